#ifndef __TSM_SESSION_CONFIG__
#define __TSM_SESSION_CONFIG__

#include "Headers.hpp"
#include "SimpleIni.h"

namespace tsm {
/** @brief Longest wait any timeout or delay may ask for. */
const std::chrono::milliseconds MAX_WAIT = std::chrono::hours(24);

/**
 * @brief Tunables shared by every session a manager spawns.
 */
struct SessionConfig {
  /** @brief Shell executable and arguments, `/bin/bash -i` by default. */
  string shell = "/bin/bash";
  vector<string> shellArgs = {"-i"};
  /** @brief Directory the shell starts in, empty to inherit ours. */
  string workingDirectory;
  /** @brief TERM for the shell, "dumb" keeps readline from decorating. */
  string term = "dumb";
  int rows = 24;
  /** @brief Wide enough that echoed commands do not wrap. */
  int columns = 512;

  std::chrono::milliseconds settleDelay = std::chrono::milliseconds(100);
  std::chrono::milliseconds pollSlice = std::chrono::milliseconds(100);
  std::chrono::milliseconds commandTimeout = std::chrono::milliseconds(5000);
  std::chrono::milliseconds closeGracePeriod = std::chrono::milliseconds(2000);

  string promptTerminators = "$#";
  size_t maxOutputBytes = 1024 * 1024;
};

/**
 * @brief Converts a timeout given in seconds by a host.
 * @throws std::out_of_range if it is negative, not finite, or above MAX_WAIT.
 */
std::chrono::milliseconds timeoutFromSeconds(double seconds);

/**
 * @brief Overlays values from a parsed ini file onto `config`.
 *
 * Keys that are missing keep their current value.  Malformed numbers throw
 * std::invalid_argument or std::out_of_range, as do durations above MAX_WAIT.
 */
void applyIniToSessionConfig(const CSimpleIniA& ini, SessionConfig* config);

/**
 * @brief Loads a config file on top of the defaults.
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
SessionConfig loadSessionConfig(const string& path);
}  // namespace tsm

#endif  // __TSM_SESSION_CONFIG__
