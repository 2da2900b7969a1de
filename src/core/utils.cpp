#include <scratchpad/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace scratchpad {

// ============ Time utilities ============

std::string format_local_time(std::time_t t, const char* pattern) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[128];
    size_t n = strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf, n);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

bool parse_bool_string(const std::string& s) {
    std::string v = to_lower(trim(s));
    return v == "true" || v == "1" || v == "yes";
}

} // namespace scratchpad
