#include "shell/Cli.hpp"

#include <exception>
#include <fmt/core.h>

int main(const int argc, char** argv) {
    try {
        return sw::shell::run(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "savewarp: {}\n", e.what());
        return 1;
    }
}
