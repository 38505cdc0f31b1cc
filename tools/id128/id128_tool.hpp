#pragma once

/**
 * @file id128_tool.hpp
 * @brief Option parsing and execution for the id128 command line tool
 */

#include <sdid128/sdid128.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sdid128 {
namespace tool {

/// What the tool prints
enum class Command {
    New,
    MachineId,
    BootId,
    InvocationId,
    Parse,
    Help,
    Version
};

/// Convert command to its command line name
[[nodiscard]] constexpr const char* command_to_string(Command command) noexcept {
    switch (command) {
        case Command::New:
            return "new";
        case Command::MachineId:
            return "machine-id";
        case Command::BootId:
            return "boot-id";
        case Command::InvocationId:
            return "invocation-id";
        case Command::Parse:
            return "parse";
        case Command::Help:
            return "help";
        case Command::Version:
            return "version";
    }
    return "help";
}

/// Parse command from its command line name
[[nodiscard]] std::optional<Command> command_from_string(const std::string& str) noexcept;

/**
 * @brief Configuration of one tool invocation
 */
struct Config {
    Command command = Command::Help;

    /// Identifiers given to "parse"
    std::vector<std::string> ids;

    /// Application ID for app-specific derivation
    std::optional<Id128> app_id;

    /// Output layout
    Format format = Format::Hex;

    /// Output letter case
    Case letter_case = Case::Lower;

    /// Print JSON instead of plain lines
    bool json = false;

    /// Lax parsing for "parse" and --app-specific
    bool lax = false;

    /// Parse "parse" arguments with libsystemd
    bool native_parse = false;

    /// Enable debug logging
    bool verbose = false;
};

/**
 * @brief Build a Config from the command line
 *
 * @return The configuration, or ErrorCode::InvalidArgument with a message
 *         suitable for printing after the program name
 */
[[nodiscard]] Result<Config> parse_options(int argc, char* argv[]);

/// Write usage text
void print_usage(std::ostream& out, const char* program_name);

/**
 * @brief Execute a parsed configuration
 *
 * @return Process exit code: 0 on success, 1 on failure
 */
[[nodiscard]] int run(const Config& config, std::ostream& out, std::ostream& err);

}  // namespace tool
}  // namespace sdid128
