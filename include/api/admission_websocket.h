#pragma once

#include <atomic>
#include <drogon/HttpRequest.h>
#include <drogon/WebSocketController.h>
#include <json/json.h>
#include <string>

using namespace drogon;

class ServiceAvailabilityManager;

/**
 * @brief WebSocket entry point guarded by dependency health
 *
 * Endpoint: /v1/core/ws
 * Every new connection is checked with
 * ServiceAvailabilityManager::shouldAllowConnection(). Refused connections
 * receive an error frame with the reason and are closed with 1011.
 */
class AdmissionWebSocketController
    : public drogon::WebSocketController<AdmissionWebSocketController> {
public:
  void handleNewMessage(const WebSocketConnectionPtr &wsConnPtr,
                        std::string &&message,
                        const WebSocketMessageType &type) override;

  void handleNewConnection(const HttpRequestPtr &req,
                           const WebSocketConnectionPtr &wsConnPtr) override;

  void handleConnectionClosed(const WebSocketConnectionPtr &wsConnPtr) override;

  WS_PATH_LIST_BEGIN
  WS_PATH_ADD("/v1/core/ws", drogon::Get);
  WS_PATH_LIST_END

  /**
   * @brief Set availability manager (dependency injection)
   */
  static void setAvailabilityManager(ServiceAvailabilityManager *manager);

  static size_t activeConnections() { return active_connections_.load(); }

  /**
   * @brief Error frame sent to a refused connection before it is closed
   */
  static Json::Value rejectionFrame(const std::string &reason);

  /**
   * @brief reason cut to fit a close frame (123 bytes), never inside a UTF-8
   * sequence
   */
  static std::string closeReason(const std::string &reason);

private:
  void reject(const WebSocketConnectionPtr &wsConnPtr,
              const std::string &reason);

  void sendJson(const WebSocketConnectionPtr &wsConnPtr,
                const Json::Value &message);

  static std::atomic<size_t> active_connections_;
  static ServiceAvailabilityManager *availability_manager_;
};
