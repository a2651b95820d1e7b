#include "SessionManager.hpp"

#include "PseudoShellTerminal.hpp"
#include "SessionError.hpp"

namespace tsm {
SessionManager::SessionManager(const SessionConfig& _config)
    : config(_config) {
  terminalFactory = [this]() -> shared_ptr<ShellTerminal> {
    return shared_ptr<ShellTerminal>(new PseudoShellTerminal(config));
  };
}

SessionManager::SessionManager(const SessionConfig& _config,
                               ShellTerminalFactory _terminalFactory)
    : config(_config), terminalFactory(_terminalFactory) {}

SessionManager::~SessionManager() {
  int closed = closeAllSessions();
  if (closed) {
    LOG(INFO) << "Closed " << closed << " sessions on shutdown";
  }
}

string SessionManager::createSession(const optional<string>& id) {
  string sessionId = (id && !id->empty()) ? *id : sole::uuid4().str();

  auto existing = removeSession(sessionId);
  if (existing) {
    LOG(INFO) << "Replacing existing terminal session " << sessionId;
    existing->close();
  }

  // Spawn outside the lock so other sessions stay reachable meanwhile.
  shared_ptr<ShellTerminal> terminal;
  try {
    terminal = terminalFactory();
    terminal->start();
  } catch (const SessionError& se) {
    LOG(ERROR) << "Failed to create terminal session " << sessionId << ": "
               << se.what();
    throw;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to create terminal session " << sessionId << ": "
               << ex.what();
    throw SessionError(SPAWN_ERROR, ex.what());
  }

  auto session = make_shared<TerminalSession>(sessionId, terminal, config);
  if (config.settleDelay.count() > 0) {
    std::this_thread::sleep_for(config.settleDelay);
  }
  session->discardPendingOutput();

  shared_ptr<TerminalSession> displaced;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    auto it = sessions.find(sessionId);
    if (it != sessions.end()) {
      // Someone created the same id while we were spawning; last one wins.
      displaced = it->second;
      it->second = session;
    } else {
      sessions.insert(make_pair(sessionId, session));
    }
  }
  if (displaced) {
    LOG(INFO) << "Replacing concurrently created session " << sessionId;
    displaced->close();
  }

  LOG(INFO) << "Created pty terminal session " << sessionId << " (pid "
            << terminal->getPid() << ")";
  return sessionId;
}

CommandResult SessionManager::executeCommand(
    const string& id, const string& command,
    const optional<std::chrono::milliseconds>& timeout) {
  auto session = getSession(id);
  if (!session) {
    CommandResult result;
    result.set_session_id(id);
    result.set_success(false);
    result.set_status(NOT_FOUND);
    result.set_error("Terminal session not found");
    VLOG(1) << "Execute on unknown session " << id;
    return result;
  }
  return session->execute(command, timeout ? *timeout : config.commandTimeout);
}

bool SessionManager::closeSession(const string& id) {
  auto session = removeSession(id);
  if (!session) {
    return false;
  }
  session->close();
  LOG(INFO) << "Closed terminal session " << id;
  return true;
}

int SessionManager::closeAllSessions() {
  map<string, shared_ptr<TerminalSession>> closing;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    closing.swap(sessions);
  }
  for (auto& it : closing) {
    it.second->close();
    LOG(INFO) << "Closed terminal session " << it.first;
  }
  return int(closing.size());
}

vector<SessionInfo> SessionManager::listSessions() {
  vector<shared_ptr<TerminalSession>> snapshot;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    for (auto& it : sessions) {
      snapshot.push_back(it.second);
    }
  }
  vector<SessionInfo> retval;
  for (auto& session : snapshot) {
    retval.push_back(session->getInfo());
  }
  return retval;
}

optional<SessionInfo> SessionManager::getSessionInfo(const string& id) {
  auto session = getSession(id);
  if (!session) {
    return nullopt;
  }
  return session->getInfo();
}

bool SessionManager::hasSession(const string& id) {
  lock_guard<std::mutex> guard(sessionMutex);
  return sessions.find(id) != sessions.end();
}

int SessionManager::numSessions() {
  lock_guard<std::mutex> guard(sessionMutex);
  return int(sessions.size());
}

shared_ptr<TerminalSession> SessionManager::getSession(const string& id) {
  lock_guard<std::mutex> guard(sessionMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<TerminalSession>();
  }
  return it->second;
}

shared_ptr<TerminalSession> SessionManager::removeSession(const string& id) {
  lock_guard<std::mutex> guard(sessionMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<TerminalSession>();
  }
  auto session = it->second;
  sessions.erase(it);
  return session;
}
}  // namespace tsm
