#pragma once

#include <string>

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace tether {
/**
 * @brief Reads an optional field, treating a missing key or a JSON null as
 * the fallback.
 */
template <typename T>
inline T jsonValueOr(const json& j, const std::string& key, const T& fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}
}  // namespace tether
