#include "api/admission_websocket.h"
#include "core/service_availability_manager.h"
#include <json/json.h>
#include <memory>
#include <plog/Log.h>

std::atomic<size_t> AdmissionWebSocketController::active_connections_{0};
ServiceAvailabilityManager *AdmissionWebSocketController::availability_manager_ =
    nullptr;

namespace {

struct AdmittedTag {};

// Close frame payload is limited to 125 bytes including the 2-byte code
constexpr size_t MAX_CLOSE_REASON = 123;

} // namespace

void AdmissionWebSocketController::setAvailabilityManager(
    ServiceAvailabilityManager *manager) {
  availability_manager_ = manager;
}

void AdmissionWebSocketController::handleNewConnection(
    const HttpRequestPtr &req, const WebSocketConnectionPtr &wsConnPtr) {
  if (!availability_manager_) {
    reject(wsConnPtr, "service not initialized");
    return;
  }

  AdmissionDecision decision;
  try {
    decision = availability_manager_->shouldAllowConnection();
  } catch (const std::exception &e) {
    PLOG_ERROR << "[AdmissionWebSocket] Admission check failed: " << e.what();
    reject(wsConnPtr, std::string("admission check failed: ") + e.what());
    return;
  }

  if (!decision.allowed) {
    const std::string reason =
        decision.reason.value_or("service temporarily unavailable");
    PLOG_WARNING << "[AdmissionWebSocket] Refused connection from "
                 << req->getPeerAddr().toIpPort() << ": " << reason;
    reject(wsConnPtr, reason);
    return;
  }

  wsConnPtr->setContext(std::make_shared<AdmittedTag>());
  active_connections_++;
  PLOG_INFO << "[AdmissionWebSocket] New connection from "
            << req->getPeerAddr().toIpPort()
            << ". Total: " << active_connections_.load();

  Json::Value welcome;
  welcome["type"] = "connected";
  welcome["message"] = "WebSocket connection established";
  sendJson(wsConnPtr, welcome);
}

void AdmissionWebSocketController::handleConnectionClosed(
    const WebSocketConnectionPtr &wsConnPtr) {
  // Refused connections were never counted
  if (!wsConnPtr->hasContext()) {
    return;
  }
  wsConnPtr->clearContext();
  active_connections_--;

  PLOG_INFO << "[AdmissionWebSocket] Connection closed. Total: "
            << active_connections_.load();
}

void AdmissionWebSocketController::handleNewMessage(
    const WebSocketConnectionPtr &wsConnPtr, std::string &&message,
    const WebSocketMessageType &type) {
  if (type != WebSocketMessageType::Text) {
    return;
  }

  Json::Value json;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(message.data(), message.data() + message.size(), &json,
                     &errors)) {
    Json::Value error;
    error["type"] = "error";
    error["message"] = "Invalid JSON";
    sendJson(wsConnPtr, error);
    return;
  }

  if (json.get("type", "").asString() == "ping") {
    Json::Value pong;
    pong["type"] = "pong";
    sendJson(wsConnPtr, pong);
  }
}

Json::Value
AdmissionWebSocketController::rejectionFrame(const std::string &reason) {
  Json::Value error;
  error["type"] = "error";
  error["message"] = "Service temporarily unavailable";
  error["reason"] = reason;
  return error;
}

std::string
AdmissionWebSocketController::closeReason(const std::string &reason) {
  if (reason.size() <= MAX_CLOSE_REASON) {
    return reason;
  }
  size_t length = MAX_CLOSE_REASON;
  // Step back over continuation bytes (10xxxxxx) to a character boundary
  while (length > 0 &&
         (static_cast<unsigned char>(reason[length]) & 0xC0) == 0x80) {
    length--;
  }
  return reason.substr(0, length);
}

void AdmissionWebSocketController::reject(
    const WebSocketConnectionPtr &wsConnPtr, const std::string &reason) {
  sendJson(wsConnPtr, rejectionFrame(reason));
  wsConnPtr->shutdown(CloseCode::kUnexpectedCondition, closeReason(reason));
}

void AdmissionWebSocketController::sendJson(
    const WebSocketConnectionPtr &wsConnPtr, const Json::Value &message) {
  Json::StreamWriterBuilder builder;
  wsConnPtr->send(Json::writeString(builder, message));
}
