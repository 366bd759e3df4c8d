#pragma once

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace tether {
/**
 * @brief Serializes compactly.  File names and terminal text are arbitrary
 * bytes, so invalid UTF-8 is replaced with U+FFFD instead of throwing.
 */
inline string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

/** @brief Writes an optional as the value or `null`. */
template <typename T>
inline void putOptional(json &j, const char *key, const optional<T> &value) {
  if (value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

/** @brief Reads a key that may be missing or `null`. */
template <typename T>
inline optional<T> getOptional(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullopt;
  }
  return it->get<T>();
}

/** @brief Reads a key that may be missing, falling back to `fallback`. */
template <typename T>
inline T getOr(const json &j, const char *key, const T &fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}
}  // namespace tether
