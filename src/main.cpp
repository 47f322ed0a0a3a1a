#include <iostream>
#include <string>
#include <vector>

#include "app/runner_app.hpp"

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <program> [args...]" << std::endl;
        std::cerr << "       " << argv[0] << " -c '<command line>'" << std::endl;
        return 2;
    }

    const lazycmd::RunnerApp app;

    try {
        const std::string first(argv[1]);
        if (first == "-c") {
            if (argc != 3) {
                std::cerr << "lazy_command_run: -c takes exactly one command line" << std::endl;
                return 2;
            }
            return app.run_line(argv[2], std::cerr);
        }

        return app.run_once(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception &e) {
        std::cerr << "lazy_command_run: " << e.what() << std::endl;
        return 1;
    }
}
