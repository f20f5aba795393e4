// include/igknight/cli/command_parser.h
#ifndef IGKNIGHT_CLI_COMMAND_PARSER_H
#define IGKNIGHT_CLI_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <map>

namespace igknight {
namespace cli {

/**
 * @brief Parsing helpers for shell input and program arguments
 */
class CommandParser {
public:
    /**
     * @brief Split a command line into tokens
     *
     * Whitespace separates tokens; double quotes group words into one token.
     *
     * @param line The input line to tokenize
     * @return Vector of tokens
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief Raw text following the first word of a line
     *
     * Used by commands whose argument contains spaces (a FEN, a JSON body).
     *
     * @param line The input line
     * @return Trimmed remainder, empty if the line has one word
     */
    static std::string remainder(const std::string& line);

    /**
     * @brief Extract flags from arguments
     *
     * Flags are removed from args. A flag takes the following argument as its
     * value unless that argument is itself a flag.
     *
     * @param args Vector of arguments
     * @param flagPrefix Prefix for flags (e.g., "--" or "-")
     * @return Map of flags to values (empty string for boolean flags)
     */
    static std::map<std::string, std::string> extractFlags(
        std::vector<std::string>& args, const std::string& flagPrefix = "--");

    static bool hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag);

    static std::string getFlagValue(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        const std::string& defaultValue = "");

    /**
     * @brief Get flag value as boolean
     *
     * A bare flag counts as true.
     */
    static bool getFlagValueBool(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        bool defaultValue = false);
};

} // namespace cli
} // namespace igknight

#endif // IGKNIGHT_CLI_COMMAND_PARSER_H
