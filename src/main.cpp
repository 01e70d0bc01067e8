#include <iostream>
#include <optional>
#include <string>
#include "cli/batchy_cli.hpp"
#include "cli/theme.hpp"
#include "backends/backend.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    batchy prepare "
              << theme::color::RESET << theme::color::BROWN << "[--image <sif>]"
              << theme::color::RESET << theme::color::DIM
              << "   Write the run script and check scheduler tools" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    batchy check"
              << theme::color::RESET << theme::color::DIM
              << "                       Check scheduler tools only" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    batchy describe"
              << theme::color::RESET << theme::color::DIM
              << "                    Show the synced backend" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    batchy watch "
              << theme::color::RESET << theme::color::BROWN << "<jobs.yaml>"
              << theme::color::RESET << theme::color::DIM
              << "         Report progress of a job status file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Project settings are read from ./batchy.yaml,\n"
              << "    per-backend defaults from ~/.batchy/config.yaml.\n\n"
              << "    batchy --version       Show version\n"
              << "    batchy --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        BatchyCLI cli;

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "batchy"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << BATCHY_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "prepare") {
            std::optional<std::string> image;
            for (int i = 2; i < argc; i++) {
                std::string arg = argv[i];
                if (arg == "--image" && i + 1 < argc) {
                    image = argv[++i];
                } else {
                    std::cout << theme::fail("Unknown argument: " + arg);
                    return 1;
                }
            }
            return cli.run_prepare(image);
        } else if (cmd == "check") {
            return cli.run_check();
        } else if (cmd == "describe") {
            return cli.run_describe();
        } else if (cmd == "watch") {
            if (argc < 3) {
                std::cout << theme::fail("Missing job status file.");
                std::cout << theme::step("Usage: batchy watch <jobs.yaml>");
                return 1;
            }
            return cli.run_watch(argv[2]);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const MissingCommandError& e) {
        std::cout << theme::fail(e.what());
        std::cout << theme::step("Install the scheduler tools or set 'mode: test' in batchy.yaml");
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
