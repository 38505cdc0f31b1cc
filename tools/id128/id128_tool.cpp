#include "id128_tool.hpp"

#include <sdid128/json.hpp>
#include <sdid128/logging.hpp>
#include <sdid128/native.hpp>

#include <getopt.h>

#include <cstring>
#include <ostream>

namespace sdid128 {
namespace tool {

namespace {

Result<Config> usage_error(std::string message) {
    return Result<Config>::error(ErrorCode::InvalidArgument, std::move(message));
}

bool uses_app_id(Command command) noexcept {
    return command == Command::MachineId || command == Command::BootId ||
           command == Command::InvocationId || command == Command::Parse;
}

Result<Id128> parse_id(const Config& config, const std::string& text) {
    if (config.native_parse) {
        return native::from_string(text);
    }
    return config.lax ? Id128::parse_lax(text) : Id128::parse(text);
}

Result<std::vector<Id128>> collect_ids(const Config& config) {
    using IdsResult = Result<std::vector<Id128>>;
    std::vector<Id128> ids;

    if (config.command == Command::Parse) {
        for (const auto& text : config.ids) {
            auto parsed = parse_id(config, text);
            if (parsed.is_error()) {
                return IdsResult::error(parsed.error_code(),
                                        "invalid ID \"" + text + "\": " + parsed.error_message());
            }
            if (config.app_id) {
                parsed = native::app_specific(parsed.value(), *config.app_id);
                if (parsed.is_error()) {
                    return IdsResult::error(parsed.error_code(), parsed.error_message());
                }
            }
            ids.push_back(parsed.value());
        }
        return IdsResult::ok(std::move(ids));
    }

    Result<Id128> id = Result<Id128>::error(ErrorCode::Unknown);
    switch (config.command) {
        case Command::New:
            id = native::random_id();
            break;
        case Command::MachineId:
            id = config.app_id ? native::machine_id_app_specific(*config.app_id)
                               : native::machine_id();
            break;
        case Command::BootId:
            id = config.app_id ? native::boot_id_app_specific(*config.app_id) : native::boot_id();
            break;
        case Command::InvocationId:
            id = config.app_id ? native::invocation_id_app_specific(*config.app_id)
                               : native::invocation_id();
            break;
        default:
            return IdsResult::error(ErrorCode::InvalidArgument, "command produces no IDs");
    }

    if (id.is_error()) {
        return IdsResult::error(id.error_code(), id.error_message());
    }
    ids.push_back(id.value());
    return IdsResult::ok(std::move(ids));
}

}  // namespace

std::optional<Command> command_from_string(const std::string& str) noexcept {
    for (auto command : {Command::New, Command::MachineId, Command::BootId, Command::InvocationId,
                         Command::Parse}) {
        if (str == command_to_string(command)) {
            return command;
        }
    }
    return std::nullopt;
}

Result<Config> parse_options(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"app-specific", required_argument, nullptr, 'a'},
        {"format", required_argument, nullptr, 'f'},
        {"uuid", no_argument, nullptr, 'u'},
        {"upper", no_argument, nullptr, 'U'},
        {"json", no_argument, nullptr, 'j'},
        {"lax", no_argument, nullptr, 'l'},
        {"native", no_argument, nullptr, 'n'},
        {"verbose", no_argument, nullptr, 'v'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Config config;
    std::optional<std::string> app_text;
    bool help = false;
    bool version = false;

    // optind = 0 requests a full getopt re-initialisation
    optind = 0;
    opterr = 0;

    int opt = 0;
    while ((opt = getopt_long(argc, argv, ":a:f:uUjlnvVh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'a':
                app_text = optarg;
                break;
            case 'f': {
                auto format = format_from_string(optarg);
                if (!format) {
                    return usage_error(std::string("invalid format \"") + optarg +
                                       "\", expected hex, uuid or grouped");
                }
                config.format = *format;
                break;
            }
            case 'u':
                config.format = Format::Uuid;
                break;
            case 'U':
                config.letter_case = Case::Upper;
                break;
            case 'j':
                config.json = true;
                break;
            case 'l':
                config.lax = true;
                break;
            case 'n':
                config.native_parse = true;
                break;
            case 'v':
                config.verbose = true;
                break;
            case 'V':
                version = true;
                break;
            case 'h':
                help = true;
                break;
            case ':': {
                const char* failed = argv[optind - 1];
                if (std::strncmp(failed, "--", 2) == 0) {
                    return usage_error(std::string("option ") + failed + " requires an argument");
                }
                return usage_error(std::string("option -") + static_cast<char>(optopt) +
                                   " requires an argument");
            }
            default:
                if (optopt != 0) {
                    return usage_error(std::string("unknown option -") + static_cast<char>(optopt));
                }
                return usage_error(std::string("unknown option ") + argv[optind - 1]);
        }
    }

    if (help) {
        config.command = Command::Help;
        return Result<Config>::ok(std::move(config));
    }
    if (version) {
        config.command = Command::Version;
        return Result<Config>::ok(std::move(config));
    }

    if (optind >= argc) {
        return usage_error("missing command");
    }

    auto command = command_from_string(argv[optind]);
    if (!command) {
        return usage_error(std::string("unknown command \"") + argv[optind] + "\"");
    }
    config.command = *command;

    for (int i = optind + 1; i < argc; ++i) {
        config.ids.emplace_back(argv[i]);
    }

    if (config.command == Command::Parse) {
        if (config.ids.empty()) {
            return usage_error("parse requires at least one ID");
        }
    } else if (!config.ids.empty()) {
        return usage_error(std::string(command_to_string(config.command)) +
                           " takes no arguments");
    }

    if (config.lax && config.native_parse) {
        return usage_error("--lax and --native cannot be combined");
    }

    if (app_text) {
        if (!uses_app_id(config.command)) {
            return usage_error(std::string("--app-specific cannot be used with ") +
                               command_to_string(config.command));
        }
        auto app = config.lax ? Id128::parse_lax(*app_text) : Id128::parse(*app_text);
        if (app.is_error()) {
            return usage_error("invalid application ID \"" + *app_text +
                               "\": " + app.error_message());
        }
        config.app_id = app.value();
    }

    return Result<Config>::ok(std::move(config));
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [OPTIONS] COMMAND [ID...]\n"
        << "\n"
        << "Commands:\n"
        << "  new                    Generate a new random ID\n"
        << "  machine-id             Print the ID of this machine\n"
        << "  boot-id                Print the ID of the current boot\n"
        << "  invocation-id          Print the ID of the current service invocation\n"
        << "  parse ID...            Normalize the given IDs\n"
        << "\n"
        << "Options:\n"
        << "  -a, --app-specific=ID  Derive an application-specific ID\n"
        << "  -f, --format=FMT       Output layout: hex, uuid or grouped (default hex)\n"
        << "  -u, --uuid             Same as --format=uuid\n"
        << "  -U, --upper            Upper case output\n"
        << "  -j, --json             JSON output\n"
        << "  -l, --lax              Lax parsing for parse and --app-specific\n"
        << "  -n, --native           Parse with libsystemd\n"
        << "  -v, --verbose          Debug logging\n"
        << "  -V, --version          Print version\n"
        << "  -h, --help             Print this help\n";
}

int run(const Config& config, std::ostream& out, std::ostream& err) {
    if (config.verbose) {
        logging::set_log_level(logging::LogLevel::Debug);
    }

    switch (config.command) {
        case Command::Help:
            print_usage(out, "id128");
            return 0;
        case Command::Version:
            out << "id128 " << VERSION << " (libsystemd " << native::systemd_version() << ")\n";
            return 0;
        default:
            break;
    }

    auto ids = collect_ids(config);
    if (ids.is_error()) {
        err << "id128: " << ids.error_message() << "\n";
        return 1;
    }

    if (config.json) {
        nlohmann::json output;
        if (config.command == Command::Parse) {
            output = nlohmann::json::array();
            for (const auto& id : ids.value()) {
                output.push_back(json::describe(id, config.format, config.letter_case));
            }
        } else {
            output = json::describe(ids.value().front(), config.format, config.letter_case);
            output["command"] = command_to_string(config.command);
            if (config.app_id) {
                output["app_id"] = *config.app_id;
            }
        }
        out << output.dump(2) << "\n";
        return 0;
    }

    for (const auto& id : ids.value()) {
        out << id.to_string(config.format, config.letter_case) << "\n";
    }
    return 0;
}

}  // namespace tool
}  // namespace sdid128
