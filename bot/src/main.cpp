#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "health.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "notifier.hpp"
#include "order_executor.hpp"
#include "position_book.hpp"
#include "position_monitor.hpp"
#include "position_sizer.hpp"
#include "supervisor.hpp"
#include "trade_journal.hpp"
#include "trade_scheduler.hpp"
#include "util.hpp"
#include "volume_ledger.hpp"

#include <curl/curl.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

// Set by the signal handler, acted on by the main thread
static std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal = signal;
}

bool check_kill_switch(const std::string& kill_switch_file) {
    if (util::file_exists(kill_switch_file)) {
        LOG_WARNING("Kill switch active: " + kill_switch_file);
        return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_file = "config.json";
    if (argc > 1) {
        config_file = argv[1];
    }

    Config config;
    try {
        config = Config::load(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Logger::Options log_options;
    log_options.log_dir = config.log_dir;
    Logger::instance().init(log_options);
    Logger::instance().set_level(Logger::parse_level(config.log_level));

    LOG_INFO("========================================");
    LOG_INFO("FX Trading Bot Starting");
    LOG_INFO("========================================");

    std::vector<std::string> errors = config.validate();
    if (!errors.empty()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& e : errors) {
            std::cerr << "  - " << e << std::endl;
        }
        LOG_ERROR("Configuration validation failed with " + std::to_string(errors.size()) + " error(s)");
        return 1;
    }

    config.log_config();

    if (check_kill_switch(config.kill_switch_file)) {
        LOG_INFO("Exiting due to kill switch");
        return 0;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_ERROR("curl_global_init failed");
        return 1;
    }

    int exit_code = 0;
    {
        SystemClock clock;
        CurlTransport transport(config.http_timeout_seconds);

        SignedApiClient::Options api_options;
        api_options.private_base = config.private_api_base;
        api_options.public_base = config.public_api_base;
        api_options.api_key = config.api_key;
        api_options.api_secret = config.api_secret;
        SignedApiClient client(api_options, transport, clock);

        std::unique_ptr<Notifier> notifier;
        if (!config.webhook_url.empty()) {
            notifier = std::make_unique<WebhookNotifier>(config.webhook_url, transport);
        } else {
            LOG_WARNING("No webhook configured, notifications go to the log only");
            notifier = std::make_unique<LogNotifier>();
        }

        PositionSizer sizer(client, config.risk_ratio, config.account_currency);
        DailyVolumeLedger ledger(config.symbol_daily_volume_limit);
        PositionBook book;
        TradeJournal journal;

        OrderExecutor executor(client, sizer, ledger, book, journal, *notifier, clock,
                               ExecutorSettings::from_config(config));
        PositionMonitor monitor(client, executor, book, *notifier, clock,
                                MonitorSettings::from_config(config));
        TradeScheduler scheduler(executor, monitor, book, journal, client, *notifier, clock,
                                 SchedulerSettings::from_config(config));

        HealthChecker health(client, *notifier, HealthSettings::from_config(config));
        int inherited_restarts = ExecRestarter::inherited_count();
        RestartGuard restart_guard(clock, config.restart_cooldown_seconds, config.max_restarts, inherited_restarts);
        ExecRestarter restarter(argc, argv);

        Supervisor supervisor(client, executor, monitor, scheduler, journal, ledger, book, health,
                              restart_guard, restarter, *notifier, clock, SupervisorSettings::from_config(config));

        std::string start_msg = "Trading system started";
        if (inherited_restarts > 0) {
            start_msg += " (restart " + std::to_string(inherited_restarts) + "/" +
                         std::to_string(config.max_restarts) + ")";
        }
        if (config.auto_restart_hour.has_value()) {
            start_msg += ". Daily restart at " + std::to_string(*config.auto_restart_hour % 24) + ":00";
        }
        notifier->send(start_msg);

        supervisor.start();

        while (clock.sleep_ms(1000)) {
            int signal = g_signal.exchange(0);
            if (signal != 0) {
                LOG_INFO("Received signal " + std::to_string(signal) + ", initiating shutdown...");
                supervisor.full_stop("signal " + std::to_string(signal));
            }
        }

        LOG_INFO("Shutting down...");
        supervisor.wait();
        if (supervisor.halted()) {
            exit_code = 2;
        }
    }

    curl_global_cleanup();
    LOG_INFO("Bot stopped cleanly");
    return exit_code;
}
