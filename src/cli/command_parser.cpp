// src/cli/command_parser.cpp
#include "igknight/cli/command_parser.h"
#include <algorithm>
#include <cctype>

namespace igknight {
namespace cli {

namespace {

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            hasToken = true;
        } else if (!inQuotes && std::isspace(static_cast<unsigned char>(c))) {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current += c;
            hasToken = true;
        }
    }

    // Unclosed quotes run to the end of the line
    if (hasToken) {
        tokens.push_back(current);
    }

    return tokens;
}

std::string CommandParser::remainder(const std::string& line) {
    std::string text = trim(line);
    size_t split = text.find_first_of(" \t");
    if (split == std::string::npos) {
        return "";
    }
    return trim(text.substr(split));
}

std::map<std::string, std::string> CommandParser::extractFlags(
    std::vector<std::string>& args, const std::string& flagPrefix) {

    std::map<std::string, std::string> flags;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() <= flagPrefix.size() || arg.compare(0, flagPrefix.size(), flagPrefix) != 0) {
            positional.push_back(arg);
            continue;
        }

        std::string flag = arg.substr(flagPrefix.size());
        std::string value;

        size_t equalPos = flag.find('=');
        if (equalPos != std::string::npos) {
            value = flag.substr(equalPos + 1);
            flag = flag.substr(0, equalPos);
        } else if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
            value = args[++i];
        }

        flags[flag] = value;
    }

    args = positional;
    return flags;
}

bool CommandParser::hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag) {
    return flags.find(flag) != flags.end();
}

std::string CommandParser::getFlagValue(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    const std::string& defaultValue) {

    auto it = flags.find(flag);
    return it != flags.end() ? it->second : defaultValue;
}

bool CommandParser::getFlagValueBool(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    bool defaultValue) {

    auto it = flags.find(flag);
    if (it == flags.end()) {
        return defaultValue;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value.empty() || value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return defaultValue;
}

} // namespace cli
} // namespace igknight
