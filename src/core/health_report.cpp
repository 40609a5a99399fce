#include "core/health_report.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

Json::Value serviceEntryToJson(const HealthReport::ServiceEntry &entry) {
  Json::Value json(Json::objectValue);
  json["available"] = entry.available;
  json["status"] = serviceStatusToString(entry.status);
  json["lastCheck"] = entry.last_check ? Json::Value(formatTimestamp(
                                             *entry.last_check))
                                       : Json::Value(Json::nullValue);
  json["error"] = entry.error ? Json::Value(*entry.error)
                              : Json::Value(Json::nullValue);
  json["responseTime"] =
      entry.response_time
          ? Json::Value(static_cast<Json::Int64>(entry.response_time->count()))
          : Json::Value(Json::nullValue);
  json["circuitBreakerOpen"] = entry.circuit_breaker_open;
  return json;
}

Json::Value
serviceGroupToJson(const std::map<std::string, HealthReport::ServiceEntry> &group) {
  Json::Value json(Json::objectValue);
  for (const auto &[name, entry] : group) {
    json[name] = serviceEntryToJson(entry);
  }
  return json;
}

Json::Value stringArray(const std::vector<std::string> &values) {
  Json::Value json(Json::arrayValue);
  for (const auto &value : values) {
    json.append(value);
  }
  return json;
}

} // namespace

std::string formatTimestamp(IScheduler::WallTimePoint time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                time.time_since_epoch()) %
            1000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << "Z";

  return ss.str();
}

Json::Value HealthReport::toJson() const {
  Json::Value json(Json::objectValue);
  json["overallStatus"] = overall_status;
  json["allowConnections"] = allow_connections;
  json["denialReason"] = denial_reason ? Json::Value(*denial_reason)
                                       : Json::Value(Json::nullValue);
  json["lastCheck"] = last_check ? Json::Value(formatTimestamp(*last_check))
                                 : Json::Value(Json::nullValue);
  json["criticalServices"] = serviceGroupToJson(critical_services);
  json["optionalServices"] = serviceGroupToJson(optional_services);

  Json::Value summary_json(Json::objectValue);
  summary_json["totalServices"] = static_cast<Json::UInt64>(summary.total_services);
  summary_json["criticalCount"] = static_cast<Json::UInt64>(summary.critical_count);
  summary_json["optionalCount"] = static_cast<Json::UInt64>(summary.optional_count);
  summary_json["healthyCount"] = static_cast<Json::UInt64>(summary.healthy_count);
  summary_json["degradedCount"] = static_cast<Json::UInt64>(summary.degraded_count);
  summary_json["failedCount"] = static_cast<Json::UInt64>(summary.failed_count);
  summary_json["unknownCount"] = static_cast<Json::UInt64>(summary.unknown_count);
  summary_json["degradedServices"] = stringArray(summary.degraded_services);
  summary_json["failedServices"] = stringArray(summary.failed_services);
  json["summary"] = summary_json;

  return json;
}
