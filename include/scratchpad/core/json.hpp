/*
 * Scratchpad C++ - JSON type
 */
#ifndef scratchpad_CORE_JSON_HPP
#define scratchpad_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace scratchpad {

typedef nlohmann::json Json;

} // namespace scratchpad

#endif // scratchpad_CORE_JSON_HPP
