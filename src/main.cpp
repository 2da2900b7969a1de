/*
 * Scratchpad C++ - Sandboxed scratchpad file tools
 *
 * Usage:
 *   ./scratchpad [--config config.json] < tool_calls.jsonl
 *
 * The scratch directory comes from $SCRATCH_PAD_DIR or the scratch_dir
 * config key (default ./scratchpad).
 */
#include <scratchpad/core/application.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    auto& app = scratchpad::Application::instance();

    if (!app.init(argc, argv)) {
        return app.exit_code();
    }

    int result = app.run(std::cin, std::cout);
    app.shutdown();

    return result;
}
