#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Named command table shared by the interactive front-ends.
class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    void execute_command(const std::string& command, const std::string& args = "");

    // Grouped help; commands missing from every category are listed last.
    void print_help(const std::vector<std::pair<std::string, std::vector<std::string>>>&
                        categories) const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
