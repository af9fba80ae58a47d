#include <iostream>
#include <string>
#include <filesystem>
#include "cli/relay_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    vrelay serve "
              << theme::color::RESET << theme::color::AMBER << "[--config P]"
              << theme::color::RESET << theme::color::DIM
              << "      Read requests from stdin and relay them" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    vrelay config "
              << theme::color::RESET << theme::color::AMBER << "[--config P] [--init]"
              << theme::color::RESET << theme::color::DIM
              << "  Show or create the configuration" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    vrelay check-url "
              << theme::color::RESET << theme::color::AMBER << "<text>"
              << theme::color::RESET << theme::color::DIM
              << "        List supported URLs in text" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    vrelay --version        Show version\n"
              << "    vrelay --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];

        std::filesystem::path config_path;
        bool init = false;
        std::string rest;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--init") {
                init = true;
            } else {
                if (!rest.empty()) rest += " ";
                rest += arg;
            }
        }

        RelayCLI cli;

        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "vrelay"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << VRELAY_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "serve") {
            return cli.run_serve(config_path);
        } else if (cmd == "config") {
            return cli.run_config(config_path, init);
        } else if (cmd == "check-url") {
            if (rest.empty()) {
                std::cout << theme::fail("Missing text.");
                std::cout << theme::step("Usage: vrelay check-url <text>");
                return 1;
            }
            return cli.run_check_url(rest);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
