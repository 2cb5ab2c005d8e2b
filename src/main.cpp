#include <iostream>
#include <vector>
#include <string>
#include "cli/plexmover_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::AMBER << "    plexmover run "
              << theme::color::RESET << theme::color::SLATE << "<batch.yaml>"
              << theme::color::RESET << theme::color::DIM
              << "           Run a batch of transfers" << theme::color::RESET << "\n";
    std::cout << theme::color::AMBER << "    plexmover send "
              << theme::color::RESET << theme::color::SLATE << "[--host id] <file>..."
              << theme::color::RESET << theme::color::DIM
              << "  Send files to <remote_base>/" << theme::color::RESET << "\n";
    std::cout << theme::color::AMBER << "    plexmover hosts"
              << theme::color::RESET << theme::color::DIM
              << "                       List configured hosts" << theme::color::RESET << "\n";
    std::cout << theme::color::AMBER << "    plexmover init"
              << theme::color::RESET << theme::color::DIM
              << "                        Write a config template" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    plexmover --version                   Show version\n"
              << "    plexmover --help                      Show this help\n\n"
              << "    Exit status: 0 all transfers ok, 2 some failed, 1 none ok or error"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        PlexmoverCLI cli;

        if (cmd == "--version") {
            std::cout << theme::color::AMBER << theme::color::BOLD << "plexmover"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << PLEXMOVER_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            if (argc < 3) {
                std::cout << theme::fail("Missing batch file.");
                std::cout << theme::step("Usage: plexmover run <batch.yaml>");
                return 1;
            }
            install_interrupt_handler();
            return cli.run_batch(argv[2]);
        } else if (cmd == "send") {
            std::string host;
            std::vector<std::string> files;
            for (int i = 2; i < argc; i++) {
                std::string arg = argv[i];
                if (arg == "--host") {
                    if (i + 1 >= argc) {
                        std::cout << theme::fail("--host needs a host id.");
                        return 1;
                    }
                    host = argv[++i];
                } else {
                    files.push_back(arg);
                }
            }
            install_interrupt_handler();
            return cli.run_send(host, files);
        } else if (cmd == "hosts") {
            return cli.run_hosts();
        } else if (cmd == "init") {
            return cli.run_init();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
