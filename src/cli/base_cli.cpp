#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <set>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help(
    const std::vector<std::pair<std::string, std::vector<std::string>>>& categories) const {
    std::set<std::string> listed;
    auto print_row = [&](const std::string& name) {
        auto it = commands_.find(name);
        if (it == commands_.end()) return;
        listed.insert(name);
        std::cout << theme::color::TEAL << fmt::format("    {:<14}", name)
                  << theme::color::RESET << theme::color::DIM << it->second.second
                  << theme::color::RESET << "\n";
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";
        for (const auto& name : cmd_names) print_row(name);
    }

    bool header = false;
    for (const auto& [name, entry] : commands_) {
        if (listed.count(name)) continue;
        if (!header) {
            std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                      << "  Other" << theme::color::RESET << "\n";
            header = true;
        }
        print_row(name);
    }
    std::cout << "\n";
}
