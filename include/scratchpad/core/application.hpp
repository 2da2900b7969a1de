/*
 * Scratchpad C++ - Application
 *
 * Wires configuration, logging, the sandboxed file store and the tool
 * dispatcher together, then serves JSON tool calls read from stdin.
 */
#ifndef scratchpad_CORE_APPLICATION_HPP
#define scratchpad_CORE_APPLICATION_HPP

#include "config.hpp"
#include "dispatcher.hpp"
#include "file_store.hpp"
#include "file_tools.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

namespace scratchpad {

struct AppInfo {
    static constexpr const char* NAME = "scratchpad";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit right away (help, version,
    // --list-tools, or a fatal setup error); exit_code() tells which.
    bool init(int argc, char* argv[]);

    // Serve one tool call per line until EOF or stop().
    int run(std::istream& in, std::ostream& out);

    void shutdown();
    void stop() { running_ = false; }

    bool is_running() const { return running_.load(); }
    int exit_code() const { return exit_code_; }

    const Config& config() const { return config_; }
    const ToolDispatcher& dispatcher() const { return dispatcher_; }

    // Parse, execute and format a single tool call line
    std::string handle_line(const std::string& line) const;

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_store();
    void setup_tools();

    std::atomic<bool> running_;
    int exit_code_;
    bool list_tools_only_;
    std::string config_file_;

    Config config_;
    std::unique_ptr<SandboxFileStore> store_;
    std::unique_ptr<FileToolsProvider> file_tools_;
    ToolDispatcher dispatcher_;
};

} // namespace scratchpad

#endif // scratchpad_CORE_APPLICATION_HPP
