#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "base_cli.hpp"

class RelayService;
class ConsoleSink;

// One request line: "<user> <url-or-text> [resolution] [destination]".
struct SubmitLine {
    std::string user_id;
    std::string text;
    std::optional<Resolution> resolution;
    std::string destination;
};

// Trailing tokens are read right to left: a resolution token ends the text,
// and a single token after it is the destination. nullopt for fewer than two tokens.
std::optional<SubmitLine> parse_submit_line(const std::string& line);

class RelayCLI : public BaseCLI {
public:
    RelayCLI();
    ~RelayCLI() override;

    // Load config, take the instance lock and serve stdin until EOF or quit.
    int run_serve(const std::filesystem::path& config_path);

    // Print the effective configuration, or write the default file.
    int run_config(const std::filesystem::path& config_path, bool init);

    // Print normalized URLs found in `text`.
    int run_check_url(const std::string& text);

private:
    void register_commands();
    void handle_line(const std::string& line);
    bool read_line(std::string& line, bool interactive);

    std::unique_ptr<RelayService> service_;
    std::unique_ptr<ConsoleSink> sink_;
    bool quit_ = false;
};
