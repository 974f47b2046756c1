#include "tsync/core/config.hpp"
#include "tsync/events/components.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/store/filesystem_store.hpp"
#include "tsync/sync/confirmation.hpp"
#include "tsync/sync/service.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kUsage =
    "Usage: tsyncd --server <remote-root> [options]\n"
    "\n"
    "  --config <file>        JSON configuration file\n"
    "  --server <remote-root> Mount point of the remote share (or file://<path>)\n"
    "  --user <name>          Account name\n"
    "  --password-env <var>   Environment variable holding the password\n"
    "  --interval <minutes>   Sync interval (default 5)\n"
    "  --local <dir>          Local folder to keep in sync\n"
    "  --ledger <file>        Where the sync ledger is stored\n"
    "  --yes / --no           Answer deletion prompts without asking\n"
    "  --verbose              Debug logging\n"
    "\n"
    "Signals: SIGUSR1 retries immediately, SIGINT/SIGTERM upload pending changes and exit.\n";

tsync::Result<std::shared_ptr<tsync::store::RemoteStore>> open_remote(const tsync::sync::SessionRequest& request) {
    std::string root = request.server_address;
    const std::string file_scheme = "file://";
    if (root.rfind(file_scheme, 0) == 0) {
        root = root.substr(file_scheme.size());
    } else if (root.find("://") != std::string::npos) {
        return tsync::Err<std::shared_ptr<tsync::store::RemoteStore>>(
            tsync::ErrorKind::Invalid,
            "'" + root + "' is not a local mount point; mount the share (e.g. davfs2) and pass its path");
    }

    if (!request.principal.empty()) {
        spdlog::debug("Authentication for {} is handled by the mount", request.principal);
    }
    return tsync::Ok<std::shared_ptr<tsync::store::RemoteStore>>(
        std::make_shared<tsync::store::DirectoryRemoteStore>(root));
}

std::unique_ptr<tsync::sync::ConfirmationGate> make_gate(tsync::ConfirmMode mode) {
    switch (mode) {
        case tsync::ConfirmMode::Always:
            return std::make_unique<tsync::sync::FixedConfirmationGate>(true);
        case tsync::ConfirmMode::Never:
            return std::make_unique<tsync::sync::FixedConfirmationGate>(false);
        case tsync::ConfirmMode::Prompt:
            break;
    }
    return std::make_unique<tsync::sync::ConsoleConfirmationGate>(std::cin, std::cout);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            std::cout << kUsage;
            return 0;
        }
    }

    auto loaded = tsync::build_config(args);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        std::cerr << kUsage;
        return 2;
    }
    const auto config = loaded.value();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    tsync::events::EventBus event_bus;
    tsync::events::LoggerComponent logger(event_bus);
    tsync::events::MetricsComponent metrics(event_bus);

    auto gate = make_gate(config.confirm);

    tsync::sync::ServiceSettings settings;
    settings.local_root = config.local_root;
    settings.ledger_path = config.ledger_path;
    settings.orchestrator.tolerance = std::chrono::milliseconds{config.tolerance_ms};
    settings.orchestrator.backoff.threshold = config.backoff_threshold;
    settings.orchestrator.backoff.factor = config.backoff_factor;
    settings.orchestrator.backoff.max_interval = std::chrono::minutes{config.max_interval_minutes};

    tsync::sync::SyncService service(settings, open_remote, *gate, event_bus);

    tsync::sync::SessionRequest request;
    request.server_address = config.server;
    request.principal = config.user;
    request.credential = tsync::resolve_password(config);
    request.interval_minutes = config.interval_minutes;

    if (service.start_session(request) == tsync::sync::SessionAck::Failed) {
        return 1;
    }

    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.add(SIGUSR1);

    std::function<void()> wait_for_signal;
    wait_for_signal = [&] {
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            if (signal_number == SIGUSR1) {
                if (!service.retry()) {
                    spdlog::info("Retry skipped, a cycle is already running");
                }
                wait_for_signal();
                return;
            }

            spdlog::info("Signal {} received, uploading pending changes", signal_number);
            service.shutdown_or_exit(std::chrono::seconds{config.shutdown_timeout_seconds});
            io.stop();
        });
    };
    wait_for_signal();
    io.run();

    metrics.print_stats();
    return 0;
}
