#include "app/CommandLine.hpp"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace vidscan::app {

namespace {

enum LongOnly : int {
    OptPorts = 1000,
    OptNoEnrich,
    OptSaveCredentials,
};

std::optional<int> parseInt(const std::string& text) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

int parsePositive(const std::string& option, const char* value) {
    std::string text = value ? value : "";
    auto parsed = parseInt(text);
    if (parsed && *parsed > 0) {
        return *parsed;
    }
    throw UsageError("option '--" + option + "' expects a positive number, got '" + text + "'");
}

void setMode(CommandLineOptions& options, OutputMode mode) {
    if (options.outputMode && *options.outputMode != mode) {
        throw UsageError("--simple, --detailed and --json are mutually exclusive");
    }
    options.outputMode = mode;
}

} // namespace

std::string outputModeToString(OutputMode mode) {
    switch (mode) {
    case OutputMode::Simple:
        return "simple";
    case OutputMode::Detailed:
        return "detailed";
    case OutputMode::Json:
        return "json";
    }
    return "simple";
}

std::optional<OutputMode> outputModeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "simple") {
        return OutputMode::Simple;
    }
    if (lower == "detailed") {
        return OutputMode::Detailed;
    }
    if (lower == "json") {
        return OutputMode::Json;
    }
    return std::nullopt;
}

CommandLineOptions CommandLine::parse(int argc, char* argv[]) {
    static const struct option longOptions[] = {
        {"range", required_argument, nullptr, 'r'},
        {"force-endpoint", required_argument, nullptr, 'f'},
        {"username", required_argument, nullptr, 'u'},
        {"password", required_argument, nullptr, 'p'},
        {"ports", required_argument, nullptr, OptPorts},
        {"simple", no_argument, nullptr, 's'},
        {"detailed", no_argument, nullptr, 'd'},
        {"json", no_argument, nullptr, 'j'},
        {"concurrency", required_argument, nullptr, 'c'},
        {"timeout", required_argument, nullptr, 't'},
        {"no-enrich", no_argument, nullptr, OptNoEnrich},
        {"save-credentials", no_argument, nullptr, OptSaveCredentials},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}};

    CommandLineOptions options;

    // Reset getopt so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":r:f:u:p:sdjc:t:vhV", longOptions, nullptr)) != -1) {
        switch (opt) {
        case 'r':
            options.range = optarg;
            break;
        case 'f':
            options.forceEndpoints.emplace_back(optarg);
            break;
        case 'u':
            options.username = optarg;
            break;
        case 'p':
            options.password = optarg;
            break;
        case OptPorts:
            options.ports = parsePorts(optarg);
            break;
        case 's':
            setMode(options, OutputMode::Simple);
            break;
        case 'd':
            setMode(options, OutputMode::Detailed);
            break;
        case 'j':
            setMode(options, OutputMode::Json);
            break;
        case 'c':
            options.concurrency = parsePositive("concurrency", optarg);
            break;
        case 't':
            options.timeoutMs = parsePositive("timeout", optarg);
            break;
        case OptNoEnrich:
            options.noEnrich = true;
            break;
        case OptSaveCredentials:
            options.saveCredentials = true;
            break;
        case 'v':
            options.verbose = true;
            break;
        case 'h':
            options.help = true;
            break;
        case 'V':
            options.version = true;
            break;
        case ':':
            throw UsageError(std::string("option '") + argv[optind - 1] + "' requires a value");
        default:
            throw UsageError(std::string("unrecognized option '") + argv[optind - 1] + "'");
        }
    }

    if (optind < argc) {
        throw UsageError(std::string("unexpected argument '") + argv[optind] + "'");
    }
    return options;
}

std::vector<uint16_t> CommandLine::parsePorts(const std::string& list) {
    std::vector<uint16_t> ports;
    std::istringstream iss(list);
    std::string token;

    while (std::getline(iss, token, ',')) {
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    token.end());
        if (token.empty()) {
            continue;
        }

        int port = parseInt(token).value_or(0);
        if (port < 1 || port > 65535) {
            throw UsageError("invalid port '" + token + "'");
        }
        if (std::find(ports.begin(), ports.end(), port) == ports.end()) {
            ports.push_back(static_cast<uint16_t>(port));
        }
    }

    if (ports.empty()) {
        throw UsageError("empty port list");
    }
    return ports;
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "Discover video conferencing endpoints (Cisco, Polycom, TANDBERG) on a network.\n\n"
       << "Targets:\n"
       << "  -r, --range CIDR            IPv4 range or address to scan (default: local network)\n"
       << "  -f, --force-endpoint IP     Report IP as an endpoint without probing (repeatable)\n"
       << "      --ports LIST            Ports to probe (default: 80,443,5060,5061,1720)\n\n"
       << "Authentication:\n"
       << "  -u, --username USER         Username tried before the default admin account\n"
       << "  -p, --password PASS         Password for --username\n"
       << "      --save-credentials      Store username and encrypted password in the config\n\n"
       << "Output:\n"
       << "  -s, --simple                IP, manufacturer and model (default)\n"
       << "  -d, --detailed              All fields, open ports and raw details\n"
       << "  -j, --json                  JSON array on stdout\n\n"
       << "Tuning:\n"
       << "  -c, --concurrency N         Hosts scanned in parallel (default: 20)\n"
       << "  -t, --timeout MS            Connect timeout in milliseconds (default: 500)\n"
       << "      --no-enrich             Skip status.xml and REST API queries\n\n"
       << "  -v, --verbose               Debug logging on stderr\n"
       << "  -h, --help                  Show this help\n"
       << "  -V, --version               Show version\n\n"
       << "Environment: VIDSCAN_USERNAME, VIDSCAN_PASSWORD, VIDSCAN_CONFIG_DIR\n";
    return ss.str();
}

} // namespace vidscan::app
