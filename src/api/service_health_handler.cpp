#include "api/service_health_handler.h"
#include "core/service_availability_manager.h"
#include <drogon/HttpResponse.h>
#include <plog/Log.h>

ServiceAvailabilityManager *ServiceHealthHandler::availability_manager_ =
    nullptr;

void ServiceHealthHandler::setAvailabilityManager(
    ServiceAvailabilityManager *manager) {
  availability_manager_ = manager;
}

void ServiceHealthHandler::getServiceHealth(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!availability_manager_) {
    callback(createErrorResponse(k503ServiceUnavailable, "Service unavailable",
                                 "Availability manager not initialized"));
    return;
  }

  try {
    HealthReport report = availability_manager_->getHealthReport();

    auto resp = HttpResponse::newHttpJsonResponse(report.toJson());
    resp->setStatusCode(report.allow_connections ? k200OK
                                                 : k503ServiceUnavailable);

    resp->addHeader("Access-Control-Allow-Origin", "*");
    resp->addHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
    resp->addHeader("Access-Control-Allow-Headers", "Content-Type");

    callback(resp);
  } catch (const std::exception &e) {
    PLOG_ERROR << "[ServiceHealthHandler] Failed to build health report: "
               << e.what();
    callback(createErrorResponse(k500InternalServerError,
                                 "Internal server error", e.what()));
  }
}

HttpResponsePtr
ServiceHealthHandler::createErrorResponse(HttpStatusCode code,
                                          const std::string &error,
                                          const std::string &message) {
  Json::Value errorResponse;
  errorResponse["error"] = error;
  errorResponse["message"] = message;

  auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
  resp->setStatusCode(code);
  resp->addHeader("Access-Control-Allow-Origin", "*");
  return resp;
}
