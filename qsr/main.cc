//
// Created by igor on 08/12/2025.
//

#include <iostream>
#include <string>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace quasar::driver;

    try {
        // Handles --help and --version itself
        CompilerOptions opts = parse_command_line(argc, argv);

        Logger logger(log_level_of(opts), opts.color);

        Compiler compiler(opts, logger);
        return compiler.compile();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
