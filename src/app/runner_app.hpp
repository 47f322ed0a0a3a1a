#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace lazycmd {

class RunnerApp {
  public:
    // Runs argv once with inherited stdio and returns its status.
    int run_once(const std::vector<std::string> &argv) const;

    // Runs one command line, reporting failures on err. Returns the status
    // the driver exits with for that line.
    int run_line(const std::string &line, std::ostream &err) const;
};

} // namespace lazycmd
