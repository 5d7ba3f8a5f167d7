#include <iostream>
#include <string>
#include <vector>

#include <contactstore/cli/CommandLine.hpp>

int main(int argc, char** argv) {
    using namespace ContactStore;

    std::vector<std::string> args(argv + 1, argv + argc);
    const std::string program = argc > 0 ? argv[0] : "contacts";

    cli::CommandLine cmd;
    std::string error;
    if (!cli::parseCommandLine(args, cmd, error)) {
        std::cerr << "error: " << error << "\n\n" << cli::usage(program);
        return 2;
    }
    if (cmd.command == cli::Command::Help) {
        std::cout << cli::usage(program);
        return 0;
    }
    return cli::run(cmd, std::cout, std::cerr);
}
