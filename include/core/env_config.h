#pragma once

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Helper functions to parse environment variables
 *
 * Invalid or out-of-range values never abort startup: a warning is written
 * to stderr (the logger may not be initialized yet) and the default is used.
 */
namespace EnvConfig {

/**
 * @brief Get string environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 */
inline std::string getString(const char *name,
                             const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return value ? std::string(value) : default_value;
}

/**
 * @brief Get integer environment variable
 * @param name Variable name
 * @param default_value Default value if not set or invalid
 * @param min_value Minimum allowed value
 * @param max_value Maximum allowed value
 */
inline int getInt(const char *name, int default_value,
                  int min_value = INT32_MIN, int max_value = INT32_MAX) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    size_t consumed = 0;
    int int_value = std::stoi(value, &consumed);
    if (consumed != std::string(value).size()) {
      throw std::invalid_argument("trailing characters");
    }
    if (int_value < min_value || int_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return int_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

/**
 * @brief Get a duration in milliseconds from an integer environment variable
 */
inline std::chrono::milliseconds
getMilliseconds(const char *name, std::chrono::milliseconds default_value,
                int min_ms = 1, int max_ms = INT32_MAX) {
  return std::chrono::milliseconds(
      getInt(name, static_cast<int>(default_value.count()), min_ms, max_ms));
}

/**
 * @brief Deployment environment tag (ENVIRONMENT), lower-cased
 *
 * Common aliases are folded: "prod" -> "production", "stage" -> "staging",
 * "dev"/"local" -> "development".
 */
inline std::string getEnvironmentTag(const std::string &default_value =
                                         "development") {
  std::string tag = getString("ENVIRONMENT", default_value);
  std::transform(tag.begin(), tag.end(), tag.begin(), ::tolower);

  if (tag == "prod") {
    return "production";
  }
  if (tag == "stage") {
    return "staging";
  }
  if (tag == "dev" || tag == "local") {
    return "development";
  }
  return tag;
}

} // namespace EnvConfig
