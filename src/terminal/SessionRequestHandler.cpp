#include "SessionRequestHandler.hpp"

#include "SessionError.hpp"

namespace tsm {
namespace {
string requestSessionId(const json& request) {
  auto it = request.find("sessionId");
  if (it == request.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}
}  // namespace

SessionRequestHandler::SessionRequestHandler(
    shared_ptr<SessionManager> _manager)
    : manager(_manager) {}

string SessionRequestHandler::handleLine(const string& line) {
  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error& pe) {
    LOG(WARNING) << "Malformed request: " << pe.what();
    return makeError("", string("Malformed request: ") + pe.what(), STATUS_OK)
        .dump();
  }
  return handle(request).dump();
}

json SessionRequestHandler::handle(const json& request) {
  if (!request.is_object() || !request.contains("type") ||
      !request["type"].is_string()) {
    return makeError("", "Request needs a string \"type\" field", STATUS_OK);
  }
  string type = request["type"].get<string>();
  VLOG(1) << "Handling " << type;
  try {
    if (type == "terminal-start") {
      return handleStart(request);
    }
    if (type == "terminal-command") {
      return handleCommand(request);
    }
    if (type == "terminal-end") {
      return handleEnd(request);
    }
    if (type == "terminal-list") {
      return handleList();
    }
  } catch (const json::exception& je) {
    return makeError(requestSessionId(request),
                     string("Invalid request: ") + je.what(), STATUS_OK);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error handling " << type << ": " << ex.what();
    return makeError(requestSessionId(request), ex.what(), STATUS_OK);
  }
  return makeError(requestSessionId(request), "Unknown request type: " + type,
                   STATUS_OK);
}

json SessionRequestHandler::handleStart(const json& request) {
  optional<string> requestedId;
  if (request.contains("sessionId") && !request["sessionId"].is_null()) {
    requestedId = request["sessionId"].get<string>();
  }
  string sessionId;
  try {
    sessionId = manager->createSession(requestedId);
  } catch (const SessionError& se) {
    return makeError(requestedId ? *requestedId : string(), se.what(),
                     se.getStatus());
  }
  json response;
  response["type"] = "terminal-ready";
  response["sessionId"] = sessionId;
  return response;
}

json SessionRequestHandler::handleCommand(const json& request) {
  string sessionId = request.at("sessionId").get<string>();
  string command = request.at("command").get<string>();
  optional<std::chrono::milliseconds> timeout;
  if (request.contains("timeout") && !request["timeout"].is_null()) {
    try {
      timeout = timeoutFromSeconds(request["timeout"].get<double>());
    } catch (const std::out_of_range& oor) {
      return makeError(sessionId, oor.what(), STATUS_OK);
    }
  }

  CommandResult result = manager->executeCommand(sessionId, command, timeout);
  if (!result.success()) {
    return makeError(sessionId, result.error(), result.status());
  }
  json response;
  response["type"] = "terminal-output";
  response["sessionId"] = result.session_id();
  response["success"] = true;
  response["stdout"] = result.stdout_text();
  response["stderr"] = result.stderr_text();
  response["exit_code"] = result.exit_code();
  response["truncated"] = result.truncated();
  return response;
}

json SessionRequestHandler::handleEnd(const json& request) {
  string sessionId = request.at("sessionId").get<string>();
  json response;
  response["type"] = "terminal-closed";
  response["sessionId"] = sessionId;
  response["closed"] = manager->closeSession(sessionId);
  return response;
}

json SessionRequestHandler::handleList() {
  json response;
  response["type"] = "terminal-sessions";
  response["sessions"] = json::array();
  for (const auto& info : manager->listSessions()) {
    response["sessions"].push_back(sessionInfoToJson(info));
  }
  return response;
}

json SessionRequestHandler::makeError(const string& sessionId,
                                      const string& error,
                                      SessionStatus status) {
  json response;
  response["type"] = "terminal-error";
  if (!sessionId.empty()) {
    response["sessionId"] = sessionId;
  }
  response["error"] = error;
  // STATUS_OK here means the request itself was bad, not a session failure.
  response["status"] =
      status == STATUS_OK ? string("BadRequest") : sessionStatusName(status);
  return response;
}

json SessionRequestHandler::sessionInfoToJson(const SessionInfo& info) {
  json session;
  session["sessionId"] = info.id();
  session["state"] = sessionStateName(info.state());
  session["pid"] = info.pid();
  session["createdAt"] = info.created_at();
  session["lastActivity"] = info.last_activity();
  session["commandCount"] = info.command_count();
  return session;
}

void SessionRequestHandler::serve(std::istream& in, std::ostream& out) {
  string line;
  while (std::getline(in, line)) {
    if (trim(line).empty()) {
      continue;
    }
    out << handleLine(line) << endl;
  }
  VLOG(1) << "Request stream closed";
}
}  // namespace tsm
