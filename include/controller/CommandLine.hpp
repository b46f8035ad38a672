#pragma once

#include "core/GameConfig.hpp"
#include <string>
#include <vector>

namespace blockfall::controller {

struct CommandLineOptions {
    blockfall::core::GameConfig config;
    bool showHelp{false};
};

/// Parse host flags (program name excluded):
///   --rows N  --cols N  --lock-delay SEC  --drop-interval SEC  --seed N  --help
/// Throws std::invalid_argument on unknown flags, missing or malformed values,
/// or a configuration that fails GameConfig::validate().
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

CommandLineOptions parseCommandLine(int argc, char** argv);

std::string usage(const std::string& programName);

} // namespace blockfall::controller
