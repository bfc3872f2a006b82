#include <iostream>
#include <vector>
#include <string>
#include "cli/wc_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage(const WCCLI& cli) {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    wcstore init "
              << theme::color::RESET << theme::color::BROWN << "<path> [--external <dir>]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    wcstore status "
              << theme::color::RESET << theme::color::BROWN << "[path]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    wcstore get "
              << theme::color::RESET << theme::color::BROWN << "<entry> [path]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    wcstore set "
              << theme::color::RESET << theme::color::BROWN << "<entry> <value> [path]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    wcstore missing "
              << theme::color::RESET << theme::color::BROWN << "<path> [--dirs] [--data] <name>..."
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    entries: apiurl, project, package, packages, files\n"
              << "    wcstore --version     Show version\n"
              << "    wcstore --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        WCCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::bold("wcstore") << theme::dim(std::string(" version ") + WCSTORE_VERSION)
                      << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
