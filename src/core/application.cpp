/*
 * Scratchpad C++ - Application Implementation
 */
#include <scratchpad/core/application.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <signal.h>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace scratchpad {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Sandboxed scratchpad file tools\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Reads one JSON tool call per line from stdin:\n"
              << "  {\"tool\": \"create_file\", \"arguments\": {\"file_path\": \"a.txt\", \"content\": \"hi\"}}\n\n"
              << "Options:\n"
              << "  --config <file>  Configuration file (default: config.json)\n"
              << "  --list-tools     Print the available tools and exit\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n\n"
              << "Environment:\n"
              << "  SCRATCH_PAD_DIR  Scratchpad directory (overrides scratch_dir)\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

// No SA_RESTART: a signal must interrupt a blocking read on stdin so run()
// returns without waiting for another line.
void install_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, NULL) != 0 || sigaction(SIGTERM, &sa, NULL) != 0) {
        LOG_WARN("Cannot install signal handlers: %s", strerror(errno));
    }
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(0)
    , list_tools_only_(false)
    , config_file_("config.json")
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--list-tools") == 0) {
            list_tools_only_ = true;
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = 1;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::setup_store() {
    SandboxConfig sandbox = SandboxConfig::from_config(config_);
    try {
        store_.reset(new SandboxFileStore(sandbox));
    } catch (const std::exception& e) {
        LOG_ERROR("[Sandbox] %s", e.what());
        return false;
    }
    return true;
}

void Application::setup_tools() {
    file_tools_.reset(new FileToolsProvider(*store_));
    dispatcher_.register_tools(file_tools_->get_agent_tools());
    LOG_INFO("Registered %zu agent tools", dispatcher_.tools().size());
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    install_signal_handlers();

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        exit_code_ = 1;
        return false;
    }
    setup_logging();

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_store()) {
        exit_code_ = 1;
        return false;
    }
    setup_tools();

    if (list_tools_only_) {
        std::cout << dispatcher_.build_tools_prompt();
        return false;
    }

    return true;
}

std::string Application::handle_line(const std::string& line) const {
    ParsedToolCall call = dispatcher_.parse_tool_call(line);
    AgentToolResult result = dispatcher_.execute(call);
    std::string name = call.tool_name.empty() ? "unknown" : call.tool_name;
    return ToolDispatcher::format_tool_result(name, result);
}

int Application::run(std::istream& in, std::ostream& out) {
    LOG_INFO("Reading tool calls from stdin (%zu tools)", dispatcher_.tools().size());

    std::string line;
    while (running_.load() && std::getline(in, line)) {
        if (trim(line).empty()) {
            continue;
        }
        out << handle_line(line) << "\n";
        out.flush();
    }

    return 0;
}

void Application::shutdown() {
    running_ = false;
    // Registered executors point into file_tools_
    dispatcher_.clear();
    file_tools_.reset();
    store_.reset();
    LOG_INFO("Goodbye!");
}

} // namespace scratchpad
