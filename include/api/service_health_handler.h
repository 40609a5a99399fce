#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

using namespace drogon;

class ServiceAvailabilityManager;

/**
 * @brief Dependency health endpoint handler
 *
 * Endpoint: GET /v1/core/health/services
 * Returns: HealthReport JSON. 200 while new connections are admitted,
 * 503 while they are refused.
 */
class ServiceHealthHandler
    : public drogon::HttpController<ServiceHealthHandler> {
public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(ServiceHealthHandler::getServiceHealth,
                "/v1/core/health/services", Get);
  METHOD_LIST_END

  /**
   * @brief Handle GET /v1/core/health/services
   *
   * Refreshes the health map first when it is stale.
   *
   * @param req HTTP request
   * @param callback Response callback
   */
  void getServiceHealth(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

  /**
   * @brief Set availability manager (dependency injection)
   */
  static void setAvailabilityManager(ServiceAvailabilityManager *manager);

private:
  static HttpResponsePtr createErrorResponse(HttpStatusCode code,
                                             const std::string &error,
                                             const std::string &message);

  static ServiceAvailabilityManager *availability_manager_;
};
