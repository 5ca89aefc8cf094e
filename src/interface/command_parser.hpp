// Command parsing for the line-oriented service interface

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dsss {
namespace interface {

// Commands understood by the simulation service
enum class Command {
    Health,     // HEALTH
    Simulate,   // SIMULATE message="..." tx_secret=... rx_secret=... [key=value ...]
    Stage,      // STAGE <stage> simulation_id=<id>
    Quit,       // QUIT
    Unknown
};

// Parsed command with its arguments
struct ParsedCommand {
    Command cmd = Command::Unknown;
    std::string name;                             // Command word as received
    std::vector<std::string> args;                // Bare tokens after the command word
    std::map<std::string, std::string> params;    // key=value tokens

    std::optional<std::string> param(const std::string& key) const {
        auto it = params.find(key);
        if (it == params.end()) return std::nullopt;
        return it->second;
    }
};

class CommandParser {
public:
    // Parse one line. Throws InvalidArgument on an unterminated quote or
    // an empty key.
    static ParsedCommand parse(const std::string& line);

    // Split on whitespace; double quotes group, backslash escapes inside quotes
    static std::vector<std::string> tokenize(const std::string& line);

private:
    static Command lookupCommand(const std::string& word);
};

} // namespace interface
} // namespace dsss
