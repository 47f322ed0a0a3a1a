#include "app/runner_app.hpp"

#include <iostream>
#include <string>

#include "core/command_builder.hpp"
#include "core/errors.hpp"

namespace lazycmd {

namespace {

constexpr int configuration_failure_status = 2;
constexpr int spawn_failure_status = 127;

template <typename Source>
int run_and_report(const Source &source, std::ostream &err) {
    try {
        return CommandBuilder(source).status();
    } catch (const ConfigurationError &error) {
        err << "lazy_command_run: " << error.what() << std::endl;
        return configuration_failure_status;
    } catch (const SpawnError &error) {
        err << "lazy_command_run: " << error.what() << std::endl;
        return spawn_failure_status;
    }
}

} // namespace

int RunnerApp::run_once(const std::vector<std::string> &argv) const { return run_and_report(argv, std::cerr); }

int RunnerApp::run_line(const std::string &line, std::ostream &err) const { return run_and_report(line, err); }

} // namespace lazycmd
