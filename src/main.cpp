#include <iostream>
#include <vector>
#include <string>
#include "cli/start_command.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_start_usage();
            return EXIT_FAILURE_CODE;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::bold("pyrelaunch") << theme::dim(std::string(" version ") + PYRELAUNCH_VERSION) << "\n";
            return EXIT_OK;
        } else if (cmd == "--help") {
            print_start_usage();
            return EXIT_OK;
        } else if (cmd == "start") {
            std::vector<std::string> rest(argv + 2, argv + argc);
            auto parsed = parse_start_arguments(rest, platform::current_dir());
            if (parsed.is_err()) {
                std::cout << theme::fail(parsed.error);
                print_start_usage();
                return EXIT_FAILURE_CODE;
            }
            return run_start(parsed.value);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_start_usage();
        return EXIT_FAILURE_CODE;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_FAILURE_CODE;
    }
}
