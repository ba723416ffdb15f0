// 1. Standard Library
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "ActiveTransfers.hpp"
#include "Clock.hpp"
#include "CurlDestination.hpp"
#include "InMemoryKeyValueStore.hpp"
#include "JournalAuditRecorder.hpp"
#include "ProgressStore.hpp"
#include "S3ObjectSource.hpp"
#include "Server.hpp"
#include "SessionBroker.hpp"
#include "StaticCredentialProvider.hpp"
#include "TransferEngine.hpp"
#include "TransferOrchestrator.hpp"
#include "config.hpp"
#include "types.hpp"

using namespace ferry;

static void setup_logging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr size_t MAX_FILES = 3;
    if (!cfg.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

int main(int argc, char* argv[]) {
    try {
        // 1. Configuration
        const std::string config_path = argc > 1 ? argv[1] : "config.toml";
        const auto config = LoadConfig(config_path);
        setup_logging(config.logging);
        if (config.source.empty()) {
            spdlog::warn("Config file '{}' not found. Using defaults.", config_path);
        } else {
            spdlog::info("Loaded configuration from {}", config.source);
        }

        CurlGlobal curl;

        // 2. Collaborators
        auto clock = std::make_shared<SystemClock>();
        auto store = std::make_shared<InMemoryKeyValueStore>(clock);
        auto provider =
            std::make_shared<StaticCredentialProvider>(config.identity, config.s3.region, clock);
        auto broker = std::make_shared<SessionBroker>(store, provider, clock, config.broker,
                                                      config.identity.role);

        auto sources =
            std::make_shared<S3SourceFactory>(config.s3, clock, config.transfer.connect_timeout);
        auto destinations = std::make_shared<CurlDestinationFactory>(config.transfer.connect_timeout);
        auto engine = std::make_shared<TransferEngine>(sources, destinations, clock, config.transfer);

        auto progress = std::make_shared<ProgressStore>(store, config.orchestrator.record_retention);
        auto audit = std::make_shared<JournalAuditRecorder>(config.audit.journal_path, clock);
        auto notifier = std::make_shared<LogNotifier>();

        auto orchestrator = std::make_shared<TransferOrchestrator>(
            broker, engine, sources, progress, audit, notifier, clock, config.orchestrator);
        auto transfers =
            std::make_shared<ActiveTransfers>(orchestrator, config.server.transfer_threads);

        // 3. Server Setup
        asio::io_context main_ioc;
        auto server = std::make_shared<Server>(main_ioc, config.server, transfers);

        // 4. Graceful Shutdown Signal
        asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code&, int signal_number) {
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            server->Stop();
        });

        spdlog::info("ferryd starting on {}:{} (object store {}:{})", config.server.address,
                     config.server.port, config.s3.host, config.s3.port);

        // 5. Run
        server->Start();

        transfers->stop_all();
        spdlog::info("Server shutdown complete.");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
