#ifndef __TSM_OUTPUT_NORMALIZER__
#define __TSM_OUTPUT_NORMALIZER__

#include "Headers.hpp"

namespace tsm {
/**
 * @brief Strips the command echo and trailing prompts from raw pty output.
 *
 * Purely textual and heuristic: prompts are recognized only by their last
 * character, so output lines that happen to end in a prompt terminator are
 * dropped too.
 */
class OutputNormalizer {
 public:
  explicit OutputNormalizer(const string& _promptTerminators = "$#");

  /**
   * @brief Returns the lines of `raw` that are neither empty, the echo of
   * `command`, nor a prompt, joined by newlines.  Falls back to the trimmed
   * raw text when every line is dropped.
   */
  string normalize(const string& raw, const string& command) const;

  /** @brief True if the trimmed line ends in a prompt terminator. */
  bool isPromptLine(const string& line) const;

  /**
   * @brief True if the trimmed line is the echoed command, either bare or
   * typed after a prompt ("user@host:~$ ls").
   */
  bool isCommandEcho(const string& line, const string& command) const;

  const string& getPromptTerminators() const { return promptTerminators; }

 protected:
  string promptTerminators;
};
}  // namespace tsm

#endif  // __TSM_OUTPUT_NORMALIZER__
