#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct Config {
    // Credentials (fall back to FXBOT_API_KEY / FXBOT_API_SECRET / FXBOT_WEBHOOK_URL)
    std::string api_key;
    std::string api_secret;
    std::string webhook_url;

    // Exchange endpoints
    std::string private_api_base = "https://forex-api.coin.z.com/private";
    std::string public_api_base = "https://forex-api.coin.z.com/public";
    int64_t http_timeout_seconds = 15;

    // Entry gating and jitter
    double spread_threshold = 0.01;       // ask - bid, in price units
    int64_t jitter_seconds = 3;

    // Order retries
    int64_t entry_order_retry_interval = 5;
    int max_entry_order_attempts = 3;
    int64_t exit_order_retry_interval = 10;
    int max_exit_order_attempts = 3;

    // Protective exits (0 disables)
    double stop_loss_pips = 0.0;
    double take_profit_pips = 0.0;

    // Monitoring
    int64_t position_check_interval = 5;            // seconds, SL/TP poll
    int64_t position_check_interval_minutes = 10;   // unscheduled-position sweep

    // Sizing
    bool autolot = true;
    double leverage = 10.0;
    double manual_leverage = 18.0;        // autolot off and no lot in the plan row
    double risk_ratio = 1.0;
    std::string account_currency = "JPY";
    int64_t symbol_daily_volume_limit = 15000000;

    // Supervision
    std::optional<int> auto_restart_hour;  // 0-24, unset disables
    int eod_cutoff_hour = 19;
    int64_t health_check_interval_hours = 6;
    double min_free_disk_gb = 1.0;
    double max_memory_mb = 500.0;
    double memory_warning_mb = 100.0;
    int64_t restart_cooldown_seconds = 300;
    int max_restarts = 5;

    // File paths (relative to working directory)
    std::string config_file = "config.json";
    std::string trade_plan_file = "trades.csv";
    std::string results_dir = "daily_results";
    std::string kill_switch_file = "KILL_SWITCH";
    std::string log_dir = "logs";
    std::string log_level = "INFO";

    // Load from JSON file
    static Config load(const std::string& path);

    // Validate configuration, one entry per offending option
    std::vector<std::string> validate() const;

    // Log current configuration (secrets masked)
    void log_config() const;
};

#endif // CONFIG_HPP
