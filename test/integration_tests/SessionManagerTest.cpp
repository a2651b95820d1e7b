#include "SessionManager.hpp"

#include "SessionError.hpp"
#include "TestHeaders.hpp"

using namespace tsm;

namespace {
SessionConfig bashConfig() {
  SessionConfig config;
  config.shell = "/bin/bash";
  config.shellArgs = {"--norc", "--noprofile", "-i"};
  config.settleDelay = std::chrono::milliseconds(200);
  config.pollSlice = std::chrono::milliseconds(50);
  config.commandTimeout = std::chrono::milliseconds(1000);
  config.closeGracePeriod = std::chrono::milliseconds(500);
  return config;
}

bool processGone(pid_t pid) {
  return ::kill(pid, 0) == -1 && GetErrno() == ESRCH;
}

bool contains(const string& haystack, const string& needle) {
  return haystack.find(needle) != string::npos;
}

int64_t millisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}
}  // namespace

TEST_CASE("SessionManager creates and closes sessions", "[SessionManager]") {
  SessionManager manager(bashConfig());

  string id = manager.createSession();
  REQUIRE_FALSE(id.empty());
  REQUIRE(manager.hasSession(id));
  REQUIRE(manager.numSessions() == 1);
  pid_t pid = manager.getSessionInfo(id)->pid();
  REQUIRE(pid > 0);

  REQUIRE(manager.closeSession(id));
  REQUIRE_FALSE(manager.hasSession(id));
  REQUIRE_FALSE(manager.getSessionInfo(id));
  REQUIRE(processGone(pid));
  REQUIRE_FALSE(manager.closeSession(id));
}

TEST_CASE("SessionManager keeps a requested id", "[SessionManager]") {
  SessionManager manager(bashConfig());

  REQUIRE(manager.createSession(string("my-session")) == "my-session");
  REQUIRE(manager.hasSession("my-session"));
  REQUIRE(manager.createSession(string("")) != "");
  REQUIRE(manager.numSessions() == 2);
}

TEST_CASE("SessionManager reports unknown sessions", "[SessionManager]") {
  SessionManager manager(bashConfig());

  CommandResult result = manager.executeCommand("missing", "ls");
  REQUIRE_FALSE(result.success());
  REQUIRE(result.status() == NOT_FOUND);
  REQUIRE(result.session_id() == "missing");
  REQUIRE(manager.numSessions() == 0);
}

TEST_CASE("SessionManager runs commands in a real shell", "[SessionManager]") {
  SessionManager manager(bashConfig());
  string id = manager.createSession();

  SECTION("Output comes back without the echo") {
    CommandResult result = manager.executeCommand(
        id, "echo HELLO_MARKER", std::chrono::milliseconds(2000));
    REQUIRE(result.success());
    REQUIRE(result.status() == STATUS_OK);
    REQUIRE(contains(result.stdout_text(), "HELLO_MARKER"));
    REQUIRE_FALSE(contains(result.stdout_text(), "echo HELLO_MARKER"));
    REQUIRE(result.exit_code() == PLACEHOLDER_EXIT_CODE);
  }

  SECTION("Environment persists between commands") {
    REQUIRE(manager.executeCommand(id, "export TSM_X=42").success());
    CommandResult result = manager.executeCommand(id, "echo value=$TSM_X");
    REQUIRE(contains(result.stdout_text(), "value=42"));
  }

  SECTION("Working directory persists between commands") {
    REQUIRE(manager.executeCommand(id, "cd /tmp").success());
    CommandResult result = manager.executeCommand(id, "pwd");
    REQUIRE(contains(result.stdout_text(), "/tmp"));
  }

  SECTION("A long command is cut off at the timeout") {
    auto start = std::chrono::steady_clock::now();
    CommandResult result = manager.executeCommand(
        id, "sleep 10", std::chrono::milliseconds(2000));
    REQUIRE(result.success());
    REQUIRE(millisSince(start) >= 2000);
    REQUIRE(millisSince(start) < 2000 + 50 + 1000);
  }

  SECTION("Command count is tracked") {
    manager.executeCommand(id, "true", std::chrono::milliseconds(200));
    manager.executeCommand(id, "true", std::chrono::milliseconds(200));
    REQUIRE(manager.getSessionInfo(id)->command_count() == 2);
  }
}

TEST_CASE("SessionManager notices a dead shell", "[SessionManager]") {
  SessionManager manager(bashConfig());
  string id = manager.createSession();
  pid_t pid = manager.getSessionInfo(id)->pid();

  REQUIRE(::kill(pid, SIGKILL) == 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  auto start = std::chrono::steady_clock::now();
  CommandResult result = manager.executeCommand(id, "ls");
  REQUIRE_FALSE(result.success());
  REQUIRE(result.status() == SESSION_ENDED_ERROR);
  REQUIRE(millisSince(start) < 500);
  REQUIRE(manager.getSessionInfo(id)->state() == SESSION_ENDED);

  // Ended sessions stay addressable until closed.
  REQUIRE(manager.closeSession(id));
  REQUIRE(manager.numSessions() == 0);
}

TEST_CASE("SessionManager close kills a stubborn shell", "[SessionManager]") {
  SessionManager manager(bashConfig());
  string id = manager.createSession();
  pid_t pid = manager.getSessionInfo(id)->pid();

  REQUIRE(manager.executeCommand(id, "trap '' HUP TERM",
                                 std::chrono::milliseconds(200))
              .success());

  auto start = std::chrono::steady_clock::now();
  REQUIRE(manager.closeSession(id));
  REQUIRE(millisSince(start) < 2000);
  REQUIRE(processGone(pid));
}

TEST_CASE("SessionManager replaces a session with the same id",
          "[SessionManager]") {
  SessionManager manager(bashConfig());
  manager.createSession(string("dup"));
  pid_t firstPid = manager.getSessionInfo("dup")->pid();

  manager.createSession(string("dup"));
  pid_t secondPid = manager.getSessionInfo("dup")->pid();

  REQUIRE(manager.numSessions() == 1);
  REQUIRE(secondPid != firstPid);
  REQUIRE(processGone(firstPid));
  REQUIRE(manager.executeCommand("dup", "echo REPLACED").success());
}

TEST_CASE("SessionManager lists and closes all sessions",
          "[SessionManager]") {
  SessionManager manager(bashConfig());
  manager.createSession(string("b"));
  manager.createSession(string("a"));

  vector<SessionInfo> infos = manager.listSessions();
  REQUIRE(infos.size() == 2);
  REQUIRE(infos[0].id() == "a");
  REQUIRE(infos[1].id() == "b");
  REQUIRE(infos[0].state() == SESSION_ACTIVE);
  vector<pid_t> pids = {infos[0].pid(), infos[1].pid()};

  REQUIRE(manager.closeAllSessions() == 2);
  REQUIRE(manager.numSessions() == 0);
  REQUIRE(manager.listSessions().empty());
  for (auto pid : pids) {
    REQUIRE(processGone(pid));
  }
}

TEST_CASE("SessionManager runs sessions concurrently", "[SessionManager]") {
  SessionManager manager(bashConfig());
  vector<string> ids = {manager.createSession(), manager.createSession()};

  vector<string> outputs(ids.size());
  vector<std::thread> workers;
  for (size_t a = 0; a < ids.size(); a++) {
    workers.emplace_back([&manager, &ids, &outputs, a]() {
      outputs[a] = manager
                       .executeCommand(ids[a],
                                       "echo MARKER_" + std::to_string(a),
                                       std::chrono::milliseconds(1000))
                       .stdout_text();
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  REQUIRE(contains(outputs[0], "MARKER_0"));
  REQUIRE_FALSE(contains(outputs[0], "MARKER_1"));
  REQUIRE(contains(outputs[1], "MARKER_1"));
  REQUIRE_FALSE(contains(outputs[1], "MARKER_0"));
}

TEST_CASE("SessionManager reports spawn failures", "[SessionManager]") {
  SessionConfig config = bashConfig();
  config.shell = "/nonexistent/tsm-shell";
  SessionManager manager(config);

  REQUIRE_THROWS_AS(manager.createSession(string("broken")), SessionError);
  REQUIRE_FALSE(manager.hasSession("broken"));
}
