#include "OutputNormalizer.hpp"

namespace tsm {
OutputNormalizer::OutputNormalizer(const string& _promptTerminators)
    : promptTerminators(_promptTerminators) {}

string OutputNormalizer::normalize(const string& raw,
                                   const string& command) const {
  string trimmedCommand = trim(command);
  vector<string> kept;
  for (const auto& it : split(raw, '\n')) {
    string line = trim(it);
    if (line.empty()) {
      continue;
    }
    if (isCommandEcho(line, trimmedCommand)) {
      continue;
    }
    if (isPromptLine(line)) {
      continue;
    }
    kept.push_back(line);
  }
  if (kept.empty()) {
    return trim(raw);
  }
  return join(kept, "\n");
}

bool OutputNormalizer::isPromptLine(const string& line) const {
  string trimmed = trim(line);
  if (trimmed.empty()) {
    return false;
  }
  return promptTerminators.find(trimmed.back()) != string::npos;
}

bool OutputNormalizer::isCommandEcho(const string& line,
                                     const string& command) const {
  string trimmedLine = trim(line);
  string trimmedCommand = trim(command);
  if (trimmedCommand.empty()) {
    return false;
  }
  if (trimmedLine == trimmedCommand) {
    return true;
  }
  if (trimmedLine.length() <= trimmedCommand.length() ||
      trimmedLine.compare(trimmedLine.length() - trimmedCommand.length(),
                          trimmedCommand.length(), trimmedCommand) != 0) {
    return false;
  }
  string prefix =
      trim(trimmedLine.substr(0, trimmedLine.length() - trimmedCommand.length()));
  return isPromptLine(prefix);
}
}  // namespace tsm
