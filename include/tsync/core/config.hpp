#pragma once

#include "tsync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tsync {

/// How destructive batches are confirmed
enum class ConfirmMode {
    Prompt,  ///< Ask on the terminal
    Always,  ///< Accept without asking
    Never    ///< Decline without asking
};

const char* to_string(ConfirmMode mode) noexcept;
Result<ConfirmMode> parse_confirm_mode(const std::string& text);

/**
 * @brief Client settings
 *
 * Sources in increasing priority: built-in defaults, the JSON file given
 * with --config, command-line flags.
 */
struct ClientConfig {
    std::string server;                  ///< Remote root (mount point of the share)
    std::string user;
    std::string password;
    std::string password_env;            ///< Environment variable holding the password
    int interval_minutes = 5;
    std::string local_root;
    std::string ledger_path;
    std::int64_t tolerance_ms = 2000;
    std::size_t backoff_threshold = 3;
    unsigned backoff_factor = 2;
    int max_interval_minutes = 60;
    int shutdown_timeout_seconds = 10;
    ConfirmMode confirm = ConfirmMode::Prompt;
    std::string log_level = "info";
};

/// Defaults with local_root and ledger_path placed under $HOME
ClientConfig default_config();

/// Overlay the keys present in a JSON document onto base
Result<ClientConfig> parse_config(const std::string& document, ClientConfig base = default_config());

Result<ClientConfig> load_config(const std::filesystem::path& file);

/**
 * @brief Build the effective configuration from argv-style arguments
 *
 * Recognized flags: --config <file>, --server <root>, --user <name>,
 * --password-env <var>, --interval <minutes>, --local <dir>, --ledger <file>,
 * --yes, --no, --verbose. The --config file is applied first regardless of
 * its position.
 */
Result<ClientConfig> build_config(const std::vector<std::string>& args);

/// Range and consistency checks
Result<void> validate(const ClientConfig& config);

/// Explicit password, else the value of password_env, else empty
std::string resolve_password(const ClientConfig& config);

} // namespace tsync
