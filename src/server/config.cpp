#include "wopan/server/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace wopan::server {

namespace {

Expected<unsigned long long> parse_number(const std::string& flag, const std::string& text,
                                          unsigned long long min, unsigned long long max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Err<unsigned long long>(make_error(ErrorKind::Validation,
                                                  flag + " expects a number, got '" + text + "'"));
    }
    errno = 0;
    char* end = nullptr;
    const auto value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || value < min || value > max) {
        return Err<unsigned long long>(make_error(ErrorKind::Validation,
            flag + " must be between " + std::to_string(min) + " and " + std::to_string(max)));
    }
    return Ok<unsigned long long, Error>(value);
}

bool is_log_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "critical" || level == "off";
}

/// Value following flag @p args[i], advancing i
Expected<std::string> take_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        return Err<std::string>(make_error(ErrorKind::Validation, args[i] + " requires a value"));
    }
    return Ok<std::string, Error>(args[++i]);
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Expected<ServiceConfig> load_service_config(const std::vector<std::string>& args, const EnvLookup& env) {
    ServiceConfig config;

    if (auto token = env("WOPAN_ACCESS_TOKEN")) {
        config.access_token = *token;
    }
    if (auto dir = env("WOPAN_TEMP_DIR")) {
        config.temp_dir = *dir;
    }
    if (auto port = env("WOPAN_PORT")) {
        auto parsed = parse_number("WOPAN_PORT", *port, 0, std::numeric_limits<uint16_t>::max());
        if (parsed.is_error()) {
            return Err<ServiceConfig>(parsed.error());
        }
        config.port = static_cast<uint16_t>(parsed.value());
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--insecure") {
            config.verify_tls = false;
            continue;
        }

        if (arg != "-p" && arg != "--port" && arg != "--threads" && arg != "--temp" &&
            arg != "--token" && arg != "--max-body" && arg != "--log-level") {
            return Err<ServiceConfig>(make_error(ErrorKind::Validation, "Unknown option: " + arg));
        }

        auto value = take_value(args, i);
        if (value.is_error()) {
            return Err<ServiceConfig>(value.error());
        }

        if (arg == "-p" || arg == "--port") {
            auto parsed = parse_number(arg, value.value(), 0, std::numeric_limits<uint16_t>::max());
            if (parsed.is_error()) {
                return Err<ServiceConfig>(parsed.error());
            }
            config.port = static_cast<uint16_t>(parsed.value());
        } else if (arg == "--threads") {
            auto parsed = parse_number(arg, value.value(), 1, 256);
            if (parsed.is_error()) {
                return Err<ServiceConfig>(parsed.error());
            }
            config.threads = static_cast<unsigned>(parsed.value());
        } else if (arg == "--temp") {
            config.temp_dir = value.value();
        } else if (arg == "--token") {
            config.access_token = value.value();
        } else if (arg == "--max-body") {
            auto parsed = parse_number(arg, value.value(), 1, std::numeric_limits<std::size_t>::max());
            if (parsed.is_error()) {
                return Err<ServiceConfig>(parsed.error());
            }
            config.max_body_size = static_cast<std::size_t>(parsed.value());
        } else {
            if (!is_log_level(value.value())) {
                return Err<ServiceConfig>(make_error(ErrorKind::Validation, "Unknown log level: " + value.value()));
            }
            config.log_level = value.value();
        }
    }

    return Ok<ServiceConfig, Error>(std::move(config));
}

Expected<UploadCommand> load_upload_command(const std::vector<std::string>& args, const EnvLookup& env) {
    UploadCommand command;
    if (auto token = env("WOPAN_ACCESS_TOKEN")) {
        command.access_token = *token;
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--insecure") {
            command.verify_tls = false;
            continue;
        }

        if (arg.rfind("-", 0) != 0) {
            if (!command.file.empty()) {
                return Err<UploadCommand>(make_error(ErrorKind::Validation, "Only one file may be given"));
            }
            command.file = arg;
            continue;
        }

        if (arg != "-d" && arg != "--directory" && arg != "--token" &&
            arg != "--chunk-size" && arg != "--log-level") {
            return Err<UploadCommand>(make_error(ErrorKind::Validation, "Unknown option: " + arg));
        }

        auto value = take_value(args, i);
        if (value.is_error()) {
            return Err<UploadCommand>(value.error());
        }

        if (arg == "-d" || arg == "--directory") {
            command.directory_id = value.value();
        } else if (arg == "--token") {
            command.access_token = value.value();
        } else if (arg == "--chunk-size") {
            auto parsed = parse_number(arg, value.value(), 1, std::numeric_limits<uint32_t>::max());
            if (parsed.is_error()) {
                return Err<UploadCommand>(parsed.error());
            }
            command.chunk_size = static_cast<std::size_t>(parsed.value());
        } else {
            if (!is_log_level(value.value())) {
                return Err<UploadCommand>(make_error(ErrorKind::Validation, "Unknown log level: " + value.value()));
            }
            command.log_level = value.value();
        }
    }

    if (command.file.empty()) {
        return Err<UploadCommand>(make_error(ErrorKind::Validation, "No file given"));
    }
    return Ok<UploadCommand, Error>(std::move(command));
}

std::string service_usage(const std::string& program) {
    return "Usage: " + program +
           " [--port N] [--threads N] [--temp DIR] [--token T] [--max-body BYTES]"
           " [--log-level LEVEL] [--insecure]\n"
           "Environment: WOPAN_ACCESS_TOKEN, WOPAN_TEMP_DIR, WOPAN_PORT";
}

std::string upload_usage(const std::string& program) {
    return "Usage: " + program +
           " <file> [--directory ID] [--token T] [--chunk-size BYTES] [--log-level LEVEL] [--insecure]\n"
           "Environment: WOPAN_ACCESS_TOKEN";
}

} // namespace wopan::server
