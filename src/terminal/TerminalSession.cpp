#include "TerminalSession.hpp"

#include "RawFdUtils.hpp"

namespace tsm {
#define BUF_SIZE (16 * 1024)

TerminalSession::TerminalSession(const string& _id,
                                 shared_ptr<ShellTerminal> _terminal,
                                 const SessionConfig& _config)
    : id(_id),
      terminal(_terminal),
      config(_config),
      normalizer(_config.promptTerminators),
      state(SESSION_ACTIVE),
      createdAt(time(NULL)),
      lastActivity(createdAt),
      commandCount(0) {}

TerminalSession::~TerminalSession() { close(); }

SessionState TerminalSession::getState() {
  lock_guard<std::mutex> guard(sessionMutex);
  return state;
}

void TerminalSession::fail(CommandResult* result, SessionStatus status,
                           const string& error) {
  result->set_success(false);
  result->set_status(status);
  result->set_error(error);
}

void TerminalSession::markEnded() {
  LOG(INFO) << "Terminal session " << id << " has ended";
  state = SESSION_ENDED;
  terminal->release(config.closeGracePeriod);
}

CommandResult TerminalSession::execute(const string& command,
                                       std::chrono::milliseconds timeout) {
  lock_guard<std::mutex> guard(sessionMutex);
  CommandResult result;
  result.set_session_id(id);

  if (state == SESSION_CLOSED) {
    fail(&result, NOT_FOUND, "Terminal session not found");
    return result;
  }
  if (state == SESSION_ENDED) {
    fail(&result, SESSION_ENDED_ERROR, "Terminal session has ended");
    return result;
  }
  if (!terminal->isRunning()) {
    markEnded();
    fail(&result, SESSION_ENDED_ERROR, "Terminal session has ended");
    return result;
  }

  lastActivity = time(NULL);
  string line = command + "\n";
  try {
    RawFdUtils::writeAll(terminal->getFd(), line.c_str(), line.length());
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to write command to session " << id << ": "
               << re.what();
    fail(&result, WRITE_ERROR, string("Failed to write command: ") + re.what());
    return result;
  }
  commandCount++;
  VLOG(1) << "Session " << id << " running: " << command;

  string raw;
  bool truncated;
  try {
    truncated = readOutput(timeout, &raw);
  } catch (const std::runtime_error& re) {
    // Whatever was read so far can't be attributed reliably, drop it.
    STERROR << "Error reading from session " << id << ": " << re.what();
    fail(&result, READ_FAILURE, string("Error reading from pty: ") + re.what());
    return result;
  }
  lastActivity = time(NULL);

  result.set_success(true);
  result.set_status(STATUS_OK);
  result.set_stdout_text(normalizer.normalize(raw, command));
  result.set_stderr_text("");
  result.set_exit_code(PLACEHOLDER_EXIT_CODE);
  result.set_truncated(truncated);
  VLOG(2) << "Session " << id << " read " << raw.length() << " bytes";
  return result;
}

bool TerminalSession::readOutput(std::chrono::milliseconds timeout,
                                 string* output) {
  char b[BUF_SIZE];
  int fd = terminal->getFd();
  // Caps the deadline well inside steady_clock's range.
  if (timeout > MAX_WAIT) {
    VLOG(1) << "Clamping timeout of " << timeout.count() << "ms for session "
            << id;
    timeout = MAX_WAIT;
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      VLOG(3) << "Read deadline reached for session " << id;
      return false;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(
        config.pollSlice, deadline - now);
    if (!RawFdUtils::waitOnFdData(
            fd, std::chrono::duration_cast<std::chrono::microseconds>(slice))) {
      continue;
    }

    int rc = ::read(fd, b, BUF_SIZE);
    if (rc > 0) {
      size_t room = config.maxOutputBytes - output->length();
      if (size_t(rc) >= room) {
        output->append(b, room);
        LOG(WARNING) << "Session " << id << " output exceeded "
                     << config.maxOutputBytes << " bytes, truncating";
        return true;
      }
      output->append(b, rc);
      continue;
    }
    if (rc == 0) {
      VLOG(1) << "Session " << id << " pty closed";
      return false;
    }
    auto readErrno = GetErrno();
    if (readErrno == EINTR || readErrno == EAGAIN ||
        readErrno == EWOULDBLOCK) {
      continue;
    }
    if (readErrno == EIO) {
      // Linux reports a hung up slave side as EIO on the master.
      VLOG(1) << "Session " << id << " pty hung up";
      return false;
    }
    throw std::runtime_error(strerror(readErrno));
  }
}

size_t TerminalSession::discardPendingOutput() {
  lock_guard<std::mutex> guard(sessionMutex);
  if (state != SESSION_ACTIVE) {
    return 0;
  }
  char b[BUF_SIZE];
  size_t discarded = 0;
  int fd = terminal->getFd();
  try {
    while (RawFdUtils::waitOnFdData(fd, std::chrono::microseconds(0))) {
      int rc = ::read(fd, b, BUF_SIZE);
      if (rc <= 0) {
        break;
      }
      discarded += rc;
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Cannot drain startup output of session " << id << ": "
                 << re.what();
  }
  VLOG(1) << "Discarded " << discarded << " bytes of startup output from "
          << id;
  return discarded;
}

void TerminalSession::close() {
  lock_guard<std::mutex> guard(sessionMutex);
  if (state == SESSION_CLOSED) {
    return;
  }
  terminal->release(config.closeGracePeriod);
  state = SESSION_CLOSED;
}

SessionInfo TerminalSession::getInfo() {
  lock_guard<std::mutex> guard(sessionMutex);
  SessionInfo info;
  info.set_id(id);
  info.set_state(state);
  info.set_pid(state == SESSION_ACTIVE ? int32_t(terminal->getPid()) : 0);
  info.set_created_at(int64_t(createdAt));
  info.set_last_activity(int64_t(lastActivity));
  info.set_command_count(commandCount);
  return info;
}
}  // namespace tsm
