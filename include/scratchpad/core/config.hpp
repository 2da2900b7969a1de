/*
 * Scratchpad C++ - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *   cfg.get_string("scratch_dir", "./scratchpad")
 *   cfg.get_bool("tools.allow_overwrite", false)
 */
#ifndef scratchpad_CORE_CONFIG_HPP
#define scratchpad_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>

namespace scratchpad {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from a JSON file. A missing file leaves the config empty and
    // returns true; a file that cannot be parsed returns false.
    bool load_file(const std::string& path);

    // Replace contents from a JSON string. Returns false on parse error.
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_value) const;
    long long get_int(const std::string& key, long long default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);

    const Json& data() const { return data_; }

private:
    // Returns nullptr when any segment of the dotted key is missing.
    const Json* find(const std::string& key) const;

    Json data_;
};

} // namespace scratchpad

#endif // scratchpad_CORE_CONFIG_HPP
