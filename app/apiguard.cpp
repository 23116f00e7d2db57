#include "apiguard/cli.hpp"
#include "apiguard/error.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    apiguard::cli::cli_options opts{};
    if (auto cli_result = apiguard::cli::parse_cli(argc, argv, opts)) {
        return *cli_result;
    }

    try {
        return apiguard::cli::run(opts, std::cout, std::cerr);
    } catch (const apiguard::guard_error& e) {
        std::cerr << "apiguard: " << apiguard::to_string(e.kind()) << ": " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
