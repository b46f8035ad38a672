#include "controller/CommandLine.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace blockfall::controller {

namespace {

const std::string& requireValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + args[i]);
    }
    ++i;
    return args[i];
}

int parseInt(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid integer for " + flag + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("invalid integer for " + flag + ": '" + text + "'");
    }
    return value;
}

double parseSeconds(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid number for " + flag + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("invalid number for " + flag + ": '" + text + "'");
    }
    return value;
}

std::uint32_t parseSeed(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid seed for " + flag + ": '" + text + "'");
    }
    if (used != text.size() || text.front() == '-'
        || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("invalid seed for " + flag + ": '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    auto& config = options.config;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
        } else if (flag == "--rows") {
            config.rows = parseInt(flag, requireValue(args, i));
        } else if (flag == "--cols") {
            config.cols = parseInt(flag, requireValue(args, i));
        } else if (flag == "--lock-delay") {
            config.lockDelaySeconds = parseSeconds(flag, requireValue(args, i));
        } else if (flag == "--drop-interval") {
            config.dropIntervalSeconds = parseSeconds(flag, requireValue(args, i));
        } else if (flag == "--seed") {
            config.seed = parseSeed(flag, requireValue(args, i));
        } else {
            throw std::invalid_argument("unknown option: " + flag);
        }
    }

    // Narrow boards would leave the default spawn column outside the grid
    if (config.cols > 0 && config.spawn.col >= config.cols) {
        config.spawn.col = config.cols / 2;
    }

    config.validate();
    return options;
}

CommandLineOptions parseCommandLine(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& programName) {
    std::ostringstream out;
    out << "Usage: " << programName << " [options]\n"
        << "  --rows N             grid height, 1 to 1000 (default 20)\n"
        << "  --cols N             grid width, 1 to 1000 (default 10)\n"
        << "  --lock-delay SEC     grounded time before a piece locks (default 0.5)\n"
        << "  --drop-interval SEC  automatic drop period (default 0.5)\n"
        << "  --seed N             fixed seed for the piece bag\n"
        << "  --help               show this message\n";
    return out.str();
}

} // namespace blockfall::controller
