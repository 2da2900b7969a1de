/*
 * Scratchpad C++ - Configuration Implementation
 */
#include <scratchpad/core/config.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace scratchpad {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_DEBUG("[Config] No config file at %s, using defaults", path.c_str());
        data_ = Json::object();
        return true;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (!load_string(content.str())) {
        LOG_ERROR("[Config] Failed to parse %s", path.c_str());
        return false;
    }

    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("[Config] Top-level JSON value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        LOG_ERROR("[Config] JSON parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_value;
    return v->get<std::string>();
}

long long Config::get_int(const std::string& key, long long default_value) const {
    const Json* v = find(key);
    if (!v) return default_value;
    if (v->is_number_integer()) return v->get<long long>();
    if (v->is_string()) {
        try {
            return std::stoll(v->get<std::string>());
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* v = find(key);
    if (!v) return default_value;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) return parse_bool_string(v->get<std::string>());
    return default_value;
}

void Config::set_string(const std::string& key, const std::string& value) {
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;

    Json* node = &data_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace scratchpad
