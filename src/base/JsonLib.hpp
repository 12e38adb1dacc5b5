#ifndef __KJUI_JSON_LIB__
#define __KJUI_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 *
 * Objects are ordered by key, so dumping the same value always yields the
 * same bytes.
 */
using json = nlohmann::json;

namespace kjui {
/**
 * @brief Serializes a value as one compact line.
 *
 * Invalid UTF-8 is replaced instead of throwing so encoding stays total.
 */
inline std::string dumpCompact(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace kjui

#endif  // __KJUI_JSON_LIB__
