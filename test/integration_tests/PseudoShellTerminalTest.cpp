#include "PseudoShellTerminal.hpp"

#include "RawFdUtils.hpp"
#include "SessionError.hpp"
#include "TestHeaders.hpp"

using namespace tsm;

namespace {
SessionConfig bashConfig() {
  SessionConfig config;
  config.shell = "/bin/bash";
  config.shellArgs = {"--norc", "--noprofile", "-i"};
  return config;
}

/** @brief Targets of our own fds that any child would inherit anyway. */
set<string> inheritableFdTargets() {
  set<string> targets;
  for (const auto& entry : fs::directory_iterator("/proc/self/fd")) {
    int fd = atoi(entry.path().filename().c_str());
    int flags = ::fcntl(fd, F_GETFD);
    if (flags != -1 && !(flags & FD_CLOEXEC)) {
      std::error_code ec;
      targets.insert(fs::read_symlink(entry.path(), ec).string());
    }
  }
  return targets;
}

bool processGone(pid_t pid) {
  return ::kill(pid, 0) == -1 && GetErrno() == ESRCH;
}
}  // namespace

TEST_CASE("PseudoShellTerminal spawns a shell on a pty",
          "[PseudoShellTerminal]") {
  PseudoShellTerminal terminal(bashConfig());
  terminal.start();

  REQUIRE(terminal.getPid() > 0);
  REQUIRE(terminal.getFd() >= 0);
  REQUIRE(terminal.isRunning());
  REQUIRE((::fcntl(terminal.getFd(), F_GETFD) & FD_CLOEXEC) != 0);

  pid_t pid = terminal.getPid();
  terminal.release(std::chrono::milliseconds(1000));
  REQUIRE(terminal.getFd() == -1);
  REQUIRE_FALSE(terminal.isRunning());
  REQUIRE(processGone(pid));

  // A second release is a no-op
  terminal.release(std::chrono::milliseconds(1000));
  REQUIRE(terminal.getFd() == -1);
}

TEST_CASE("PseudoShellTerminal kills a shell that ignores hangups",
          "[PseudoShellTerminal]") {
  PseudoShellTerminal terminal(bashConfig());
  terminal.start();
  pid_t pid = terminal.getPid();

  string line = "trap '' HUP TERM\n";
  REQUIRE(::write(terminal.getFd(), line.c_str(), line.length()) ==
          ssize_t(line.length()));
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  auto start = std::chrono::steady_clock::now();
  terminal.release(std::chrono::milliseconds(300));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  REQUIRE(processGone(pid));
  REQUIRE(elapsed.count() < 2000);
}

TEST_CASE("PseudoShellTerminal shells inherit no other session's fds",
          "[PseudoShellTerminal]") {
  const int numTerminals = 4;
  set<string> alreadyInheritable = inheritableFdTargets();
  vector<shared_ptr<PseudoShellTerminal>> terminals;
  for (int a = 0; a < numTerminals; a++) {
    terminals.push_back(make_shared<PseudoShellTerminal>(bashConfig()));
  }
  vector<std::thread> spawners;
  for (auto& terminal : terminals) {
    spawners.emplace_back([terminal]() { terminal->start(); });
  }
  for (auto& spawner : spawners) {
    spawner.join();
  }

  for (auto& terminal : terminals) {
    REQUIRE(terminal->isRunning());
    string fdDir = "/proc/" + std::to_string(terminal->getPid()) + "/fd";
    for (const auto& entry : fs::directory_iterator(fdDir)) {
      std::error_code ec;
      string target = fs::read_symlink(entry.path(), ec).string();
      INFO("shell " << terminal->getPid() << " holds " << entry.path()
                    << " -> " << target);
      if (alreadyInheritable.count(target)) {
        continue;
      }
      // Only the shell's own pty slave belongs here.
      REQUIRE(target.find("ptmx") == string::npos);
      REQUIRE(target.find("pipe:") == string::npos);
    }
  }
  for (auto& terminal : terminals) {
    terminal->release(std::chrono::milliseconds(1000));
  }
}

TEST_CASE("PseudoShellTerminal reports a missing shell",
          "[PseudoShellTerminal]") {
  SessionConfig config = bashConfig();
  config.shell = "/nonexistent/tsm-shell";
  PseudoShellTerminal terminal(config);

  try {
    terminal.start();
    FAIL("Expected start to throw");
  } catch (const SessionError& se) {
    REQUIRE(se.getStatus() == SPAWN_ERROR);
  }
  REQUIRE(terminal.getFd() == -1);
  REQUIRE_FALSE(terminal.isRunning());
}

TEST_CASE("PseudoShellTerminal reports a bad working directory",
          "[PseudoShellTerminal]") {
  SessionConfig config = bashConfig();
  config.workingDirectory = "/nonexistent/tsm-dir";
  PseudoShellTerminal terminal(config);

  REQUIRE_THROWS_AS(terminal.start(), SessionError);
  REQUIRE_FALSE(terminal.isRunning());
}

TEST_CASE("PseudoShellTerminal runs the shell in the working directory",
          "[PseudoShellTerminal]") {
  SessionConfig config = bashConfig();
  config.workingDirectory = "/tmp";
  PseudoShellTerminal terminal(config);
  terminal.start();

  string line = "echo DIR=$(pwd)\n";
  REQUIRE(::write(terminal.getFd(), line.c_str(), line.length()) ==
          ssize_t(line.length()));

  string output;
  char b[1024];
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(3000);
  while (output.find("DIR=/tmp") == string::npos &&
         std::chrono::steady_clock::now() < deadline) {
    if (!RawFdUtils::waitOnFdData(terminal.getFd(),
                                  std::chrono::milliseconds(100))) {
      continue;
    }
    int rc = ::read(terminal.getFd(), b, sizeof(b));
    if (rc <= 0) {
      break;
    }
    output.append(b, rc);
  }
  REQUIRE(output.find("DIR=/tmp") != string::npos);
}
