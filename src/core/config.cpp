#include "tsync/core/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace tsync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path normalized(const std::string& path) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        return fs::path(path).lexically_normal();
    }
    return resolved;
}

fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return fs::path(home);
    }
    return fs::current_path();
}

Result<int> parse_int(const std::string& flag, const std::string& text) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return Err<int>(ErrorKind::Invalid, flag + " expects a number, got '" + text + "'");
        }
        return Ok(value);
    } catch (const std::exception&) {
        return Err<int>(ErrorKind::Invalid, flag + " expects a number, got '" + text + "'");
    }
}

template<typename T>
void read_key(const json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it != document.end() && !it->is_null()) {
        target = it->template get<T>();
    }
}

} // namespace

const char* to_string(ConfirmMode mode) noexcept {
    switch (mode) {
        case ConfirmMode::Prompt: return "prompt";
        case ConfirmMode::Always: return "always";
        case ConfirmMode::Never: return "never";
    }
    return "unknown";
}

Result<ConfirmMode> parse_confirm_mode(const std::string& text) {
    if (text == "prompt") {
        return Ok(ConfirmMode::Prompt);
    }
    if (text == "always") {
        return Ok(ConfirmMode::Always);
    }
    if (text == "never") {
        return Ok(ConfirmMode::Never);
    }
    return Err<ConfirmMode>(ErrorKind::Invalid,
                            "confirm must be one of prompt, always, never (got '" + text + "')");
}

ClientConfig default_config() {
    ClientConfig config;
    const auto home = home_directory();
    config.local_root = (home / "tsync").string();
    config.ledger_path = (home / ".tsync" / "ledger.json").string();
    return config;
}

Result<ClientConfig> parse_config(const std::string& document, ClientConfig base) {
    auto root = json::parse(document, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Err<ClientConfig>(ErrorKind::Invalid, "configuration is not a JSON object");
    }

    ClientConfig config = std::move(base);
    try {
        read_key(root, "server", config.server);
        read_key(root, "user", config.user);
        read_key(root, "password", config.password);
        read_key(root, "password_env", config.password_env);
        read_key(root, "interval_minutes", config.interval_minutes);
        read_key(root, "local_root", config.local_root);
        read_key(root, "ledger_path", config.ledger_path);
        read_key(root, "tolerance_ms", config.tolerance_ms);
        read_key(root, "max_interval_minutes", config.max_interval_minutes);
        read_key(root, "shutdown_timeout_seconds", config.shutdown_timeout_seconds);
        read_key(root, "log_level", config.log_level);

        // Unsigned keys go through a signed read so negative values are rejected
        std::int64_t threshold = static_cast<std::int64_t>(config.backoff_threshold);
        std::int64_t factor = config.backoff_factor;
        read_key(root, "backoff_threshold", threshold);
        read_key(root, "backoff_factor", factor);
        if (threshold < 1 || factor < 1) {
            return Err<ClientConfig>(ErrorKind::Invalid, "backoff_threshold and backoff_factor must be >= 1");
        }
        config.backoff_threshold = static_cast<std::size_t>(threshold);
        config.backoff_factor = static_cast<unsigned>(factor);

        std::string confirm = to_string(config.confirm);
        read_key(root, "confirm", confirm);
        auto mode = parse_confirm_mode(confirm);
        if (mode.is_error()) {
            return Err<ClientConfig>(mode.error());
        }
        config.confirm = mode.value();
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorKind::Invalid, std::string("bad configuration value: ") + e.what());
    }

    return Ok(std::move(config));
}

Result<ClientConfig> load_config(const fs::path& file) {
    std::ifstream input(file);
    if (!input) {
        return Err<ClientConfig>(ErrorKind::Invalid, "cannot open configuration file " + file.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<ClientConfig> build_config(const std::vector<std::string>& args) {
    ClientConfig config = default_config();

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return Err<ClientConfig>(ErrorKind::Invalid, "--config requires a file");
            }
            auto loaded = load_config(args[i + 1]);
            if (loaded.is_error()) {
                return loaded;
            }
            config = std::move(loaded.value());
            break;
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--yes") {
            config.confirm = ConfirmMode::Always;
        } else if (arg == "--no") {
            config.confirm = ConfirmMode::Never;
        } else if (arg == "--verbose" || arg == "-v") {
            config.log_level = "debug";
        } else if (arg == "--config" || arg == "--server" || arg == "--user" || arg == "--password-env"
                   || arg == "--interval" || arg == "--local" || arg == "--ledger") {
            if (!has_value) {
                return Err<ClientConfig>(ErrorKind::Invalid, arg + " requires a value");
            }
            const std::string& value = args[++i];
            if (arg == "--server") {
                config.server = value;
            } else if (arg == "--user") {
                config.user = value;
            } else if (arg == "--password-env") {
                config.password_env = value;
            } else if (arg == "--local") {
                config.local_root = value;
            } else if (arg == "--ledger") {
                config.ledger_path = value;
            } else if (arg == "--interval") {
                auto minutes = parse_int(arg, value);
                if (minutes.is_error()) {
                    return Err<ClientConfig>(minutes.error());
                }
                config.interval_minutes = minutes.value();
            }
        } else {
            return Err<ClientConfig>(ErrorKind::Invalid, "unknown argument: " + arg);
        }
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<ClientConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<void> validate(const ClientConfig& config) {
    if (config.server.empty()) {
        return Err<void>(ErrorKind::Invalid, "no server configured (use --server or the 'server' key)");
    }
    if (config.local_root.empty()) {
        return Err<void>(ErrorKind::Invalid, "local_root must not be empty");
    }
    if (config.ledger_path.empty()) {
        return Err<void>(ErrorKind::Invalid, "ledger_path must not be empty");
    }
    if (config.interval_minutes < 1) {
        return Err<void>(ErrorKind::Invalid, "interval_minutes must be >= 1");
    }
    if (config.max_interval_minutes < config.interval_minutes) {
        return Err<void>(ErrorKind::Invalid, "max_interval_minutes must be >= interval_minutes");
    }
    if (config.tolerance_ms < 0) {
        return Err<void>(ErrorKind::Invalid, "tolerance_ms must not be negative");
    }
    if (config.shutdown_timeout_seconds < 0) {
        return Err<void>(ErrorKind::Invalid, "shutdown_timeout_seconds must not be negative");
    }

    // The ledger must not be synchronized along with the data it describes
    const auto root = normalized(config.local_root);
    const auto ledger = normalized(config.ledger_path);
    auto mismatch = std::mismatch(root.begin(), root.end(), ledger.begin(), ledger.end());
    if (mismatch.first == root.end()) {
        return Err<void>(ErrorKind::Invalid, "ledger_path must lie outside local_root");
    }
    return Ok();
}

std::string resolve_password(const ClientConfig& config) {
    if (!config.password.empty()) {
        return config.password;
    }
    if (!config.password_env.empty()) {
        if (const char* value = std::getenv(config.password_env.c_str())) {
            return value;
        }
    }
    return {};
}

} // namespace tsync
