#include "SessionConfig.hpp"

namespace tsm {
namespace {
std::chrono::milliseconds parseMillis(const char* value) {
  long long millis = stoll(value);
  if (millis < 0) {
    throw std::out_of_range(string("Negative duration: ") + value);
  }
  if (millis > MAX_WAIT.count()) {
    throw std::out_of_range(string("Duration too long: ") + value);
  }
  return std::chrono::milliseconds(millis);
}

int parsePositiveInt(const char* value) {
  int retval = stoi(value);
  if (retval <= 0) {
    throw std::out_of_range(string("Expected a positive value: ") + value);
  }
  return retval;
}
}  // namespace

std::chrono::milliseconds timeoutFromSeconds(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0) {
    throw std::out_of_range("Timeout must be a non-negative number of seconds");
  }
  if (seconds * 1000.0 > double(MAX_WAIT.count())) {
    throw std::out_of_range("Timeout must not exceed " +
                            std::to_string(MAX_WAIT.count() / 1000) +
                            " seconds");
  }
  return std::chrono::milliseconds(int64_t(seconds * 1000.0));
}

void applyIniToSessionConfig(const CSimpleIniA& ini, SessionConfig* config) {
  const char* shellPath = ini.GetValue("Shell", "path", NULL);
  if (shellPath && *shellPath) {
    config->shell = string(shellPath);
  }
  const char* shellArgs = ini.GetValue("Shell", "args", NULL);
  if (shellArgs) {
    config->shellArgs.clear();
    for (const auto& arg : split(shellArgs, ' ')) {
      if (!arg.empty()) {
        config->shellArgs.push_back(arg);
      }
    }
  }
  const char* workingDirectory =
      ini.GetValue("Shell", "working_directory", NULL);
  if (workingDirectory) {
    config->workingDirectory = string(workingDirectory);
  }
  const char* term = ini.GetValue("Shell", "term", NULL);
  if (term && *term) {
    config->term = string(term);
  }
  const char* rows = ini.GetValue("Shell", "rows", NULL);
  if (rows) {
    config->rows = parsePositiveInt(rows);
  }
  const char* columns = ini.GetValue("Shell", "columns", NULL);
  if (columns) {
    config->columns = parsePositiveInt(columns);
  }

  const char* settle = ini.GetValue("Timing", "settle_ms", NULL);
  if (settle) {
    config->settleDelay = parseMillis(settle);
  }
  const char* pollSlice = ini.GetValue("Timing", "poll_slice_ms", NULL);
  if (pollSlice) {
    config->pollSlice = parseMillis(pollSlice);
    if (config->pollSlice.count() == 0) {
      throw std::out_of_range("poll_slice_ms must be positive");
    }
  }
  const char* timeout = ini.GetValue("Timing", "command_timeout_ms", NULL);
  if (timeout) {
    config->commandTimeout = parseMillis(timeout);
  }
  const char* grace = ini.GetValue("Timing", "close_grace_ms", NULL);
  if (grace) {
    config->closeGracePeriod = parseMillis(grace);
  }

  const char* terminators =
      ini.GetValue("Output", "prompt_terminators", NULL);
  if (terminators) {
    config->promptTerminators = string(terminators);
  }
  const char* maxOutput = ini.GetValue("Output", "max_output_bytes", NULL);
  if (maxOutput) {
    config->maxOutputBytes = size_t(stoull(maxOutput));
  }
}

SessionConfig loadSessionConfig(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  SessionConfig config;
  applyIniToSessionConfig(ini, &config);
  VLOG(1) << "Loaded session config from " << path << ": shell "
          << config.shell << ", timeout " << config.commandTimeout.count()
          << "ms";
  return config;
}
}  // namespace tsm
