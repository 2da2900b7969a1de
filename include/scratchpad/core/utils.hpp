#ifndef scratchpad_CORE_UTILS_HPP
#define scratchpad_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <ctime>

namespace scratchpad {

// ============ Time utilities ============

// Format the given time as local time using a strftime pattern
std::string format_local_time(std::time_t t, const char* pattern);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Interpret "true" / "1" / "yes" (any case) as true
bool parse_bool_string(const std::string& s);

} // namespace scratchpad

#endif // scratchpad_CORE_UTILS_HPP
