#include "PseudoShellTerminal.hpp"

#include "RawFdUtils.hpp"
#include "SessionError.hpp"

namespace tsm {
std::mutex PseudoShellTerminal::spawnMutex;

PseudoShellTerminal::PseudoShellTerminal(const SessionConfig& _config)
    : config(_config), masterFd(-1), childPid(0), reaped(false) {}

PseudoShellTerminal::~PseudoShellTerminal() {
  release(std::chrono::milliseconds(0));
}

void PseudoShellTerminal::start() {
  if (childPid > 0) {
    throw SessionError(SPAWN_ERROR, "Shell already started");
  }

  // Built before forking so the child only execs.
  vector<string> args;
  args.push_back(config.shell);
  args.insert(args.end(), config.shellArgs.begin(), config.shellArgs.end());
  vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);

  // The child reports a failed exec through this pipe.  A successful exec
  // closes the write end and the parent reads EOF.
  int statusPipe[2];
  {
    // Held until every descriptor made here is close-on-exec, so a shell
    // spawned concurrently for another session never inherits them.
    lock_guard<std::mutex> guard(spawnMutex);
    if (::pipe(statusPipe) == -1) {
      throw SessionError(SPAWN_ERROR, string("Cannot create status pipe: ") +
                                          strerror(GetErrno()));
    }
    try {
      RawFdUtils::setCloseOnExec(statusPipe[0]);
      RawFdUtils::setCloseOnExec(statusPipe[1]);
    } catch (const std::runtime_error& re) {
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      throw SessionError(SPAWN_ERROR, re.what());
    }

    winsize win;
    memset(&win, 0, sizeof(winsize));
    win.ws_row = config.rows;
    win.ws_col = config.columns;

    pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
    switch (pid) {
      case -1: {
        int forkErrno = GetErrno();
        ::close(statusPipe[0]);
        ::close(statusPipe[1]);
        masterFd = -1;
        throw SessionError(SPAWN_ERROR, string("Cannot allocate pty: ") +
                                            strerror(forkErrno));
      }
      case 0: {
        ::close(statusPipe[0]);
        runShell(argv.data(), statusPipe[1]);
        // runShell does not return
        _exit(127);
      }
      default: {
        // parent
        childPid = pid;
        ::close(statusPipe[1]);
        break;
      }
    }

    try {
      RawFdUtils::setCloseOnExec(masterFd);
    } catch (const std::runtime_error& re) {
      ::close(statusPipe[0]);
      release(std::chrono::milliseconds(0));
      throw SessionError(SPAWN_ERROR, re.what());
    }
  }

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (rc > 0) {
    LOG(ERROR) << "Shell " << config.shell
               << " failed to start: " << strerror(childErrno);
    release(std::chrono::milliseconds(0));
    throw SessionError(SPAWN_ERROR, "Cannot start shell " + config.shell +
                                        ": " + strerror(childErrno));
  }

  VLOG(1) << "pty opened " << masterFd << " for shell pid " << childPid;
}

void PseudoShellTerminal::runShell(char* const* argv, int statusFd) {
  // Handlers are reset by exec but ignored signals and the signal mask are
  // inherited, so hand the shell a clean slate.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  sigset_t emptyMask;
  sigemptyset(&emptyMask);
  sigprocmask(SIG_SETMASK, &emptyMask, NULL);

  setenv("TERM", config.term.c_str(), 1);
  setenv("TSM_VERSION", TSM_VERSION, 1);

  if (config.workingDirectory.empty() ||
      chdir(config.workingDirectory.c_str()) == 0) {
    execvp(argv[0], argv);
  }

  int childErrno = GetErrno();
  if (::write(statusFd, &childErrno, sizeof(childErrno)) < 0) {
    // Nothing left to report to, the parent sees EOF and a dead child.
  }
  _exit(127);
}

bool PseudoShellTerminal::isRunning() {
  if (childPid <= 0 || reaped) {
    return false;
  }
  int status;
  pid_t rc = waitpid(childPid, &status, WNOHANG);
  if (rc == 0) {
    return true;
  }
  if (rc == childPid) {
    reaped = true;
    if (WIFEXITED(status)) {
      LOG(INFO) << "Shell " << childPid << " exited with status "
                << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      LOG(INFO) << "Shell " << childPid << " killed by signal "
                << WTERMSIG(status);
    }
    return false;
  }
  if (GetErrno() == ECHILD) {
    // Collected elsewhere (SIGCHLD ignored by the host), either way it's gone.
    reaped = true;
    return false;
  }
  // EINTR: no answer this time, assume it is still there.
  return true;
}

void PseudoShellTerminal::signalShell(int signum) {
  if (::kill(-childPid, signum) == 0) {
    return;
  }
  // Process group may be gone already; fall back to the shell pid.
  if (::kill(childPid, signum) == -1 && GetErrno() != ESRCH) {
    LOG(WARNING) << "Cannot signal shell " << childPid << ": "
                 << strerror(GetErrno());
  }
}

void PseudoShellTerminal::release(std::chrono::milliseconds gracePeriod) {
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
  if (childPid <= 0 || !isRunning()) {
    return;
  }

  // Closing the master already hangs up the shell's terminal.
  signalShell(SIGHUP);
  signalShell(SIGTERM);
  gracePeriod = std::min(gracePeriod, MAX_WAIT);
  auto deadline = std::chrono::steady_clock::now() + gracePeriod;
  while (std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!isRunning()) {
      return;
    }
  }
  if (!isRunning()) {
    return;
  }

  LOG(INFO) << "Shell " << childPid << " still running after "
            << gracePeriod.count() << "ms, sending SIGKILL";
  signalShell(SIGKILL);
  int status;
  pid_t rc;
  do {
    rc = waitpid(childPid, &status, 0);
  } while (rc == -1 && GetErrno() == EINTR);
  reaped = true;
}
}  // namespace tsm
