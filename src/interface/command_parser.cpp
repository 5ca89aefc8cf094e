// Command parsing implementation

#include "command_parser.hpp"
#include "dsss/errors.hpp"
#include <algorithm>
#include <cctype>

namespace dsss {
namespace interface {

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '\\' && i + 1 < line.size()) {
                char next = line[++i];
                current.push_back(next == 'n' ? '\n' : next);
            } else if (c == '"') {
                in_quotes = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
            in_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
        } else {
            current.push_back(c);
            in_token = true;
        }
    }

    if (in_quotes) {
        throw InvalidArgument("Unterminated quote");
    }
    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

Command CommandParser::lookupCommand(const std::string& word) {
    std::string upper = word;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "HEALTH") return Command::Health;
    if (upper == "SIMULATE") return Command::Simulate;
    if (upper == "STAGE") return Command::Stage;
    if (upper == "QUIT" || upper == "EXIT") return Command::Quit;
    return Command::Unknown;
}

ParsedCommand CommandParser::parse(const std::string& line) {
    ParsedCommand result;
    auto tokens = tokenize(line);
    if (tokens.empty()) return result;

    result.name = tokens[0];
    result.cmd = lookupCommand(tokens[0]);

    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        size_t eq = tok.find('=');
        if (eq == std::string::npos) {
            result.args.push_back(tok);
            continue;
        }
        if (eq == 0) {
            throw InvalidArgument("Malformed parameter: " + tok);
        }
        result.params[tok.substr(0, eq)] = tok.substr(eq + 1);
    }
    return result;
}

} // namespace interface
} // namespace dsss
