#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vidscan::app {

/**
 * @brief How discovered endpoints are printed.
 */
enum class OutputMode : int { Simple = 0, Detailed = 1, Json = 2 };

std::string outputModeToString(OutputMode mode);

/**
 * @brief Parses "simple", "detailed" or "json" (case-insensitive).
 */
std::optional<OutputMode> outputModeFromString(const std::string& str);

/**
 * @brief Thrown for malformed command lines; the process exits with status 2.
 */
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Values given on the command line. Unset options fall back to the
 * environment, then the config file, then built-in defaults.
 */
struct CommandLineOptions {
    std::optional<std::string> range;
    std::vector<std::string> forceEndpoints;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::vector<uint16_t>> ports;
    std::optional<OutputMode> outputMode;
    std::optional<int> concurrency;
    std::optional<int> timeoutMs;
    bool noEnrich{false};
    bool saveCredentials{false};
    bool verbose{false};
    bool help{false};
    bool version{false};
};

/**
 * @brief getopt_long based command line parser.
 */
class CommandLine {
public:
    /**
     * @brief Parses the process arguments.
     * @throws UsageError on unknown options, missing or invalid values,
     *         conflicting output modes and positional arguments.
     */
    static CommandLineOptions parse(int argc, char* argv[]);

    /**
     * @brief Parses a comma separated port list such as "80,443,5060".
     * @throws UsageError on an empty list or a value outside 1-65535.
     */
    static std::vector<uint16_t> parsePorts(const std::string& list);

    static std::string usage(const std::string& program);
};

} // namespace vidscan::app
