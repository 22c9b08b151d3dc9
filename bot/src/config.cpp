#include "config.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        return value;
    }
    return fallback;
}

// Accepts true/false as well as the "TRUE"/"FALSE" strings older config files use
bool parse_flag(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        std::string s = util::to_upper(util::trim(value.get<std::string>()));
        if (s == "TRUE" || s == "ON" || s == "1") return true;
        if (s == "FALSE" || s == "OFF" || s == "0") return false;
        throw std::runtime_error("Invalid boolean value: " + value.get<std::string>());
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    throw std::runtime_error("Invalid boolean value: " + value.dump());
}

std::string mask(const std::string& secret) {
    if (secret.empty()) return "(unset)";
    if (secret.size() <= 4) return "****";
    return secret.substr(0, 4) + "****";
}

void check_range(std::vector<std::string>& errors, const std::string& name,
                 double value, double lo, double hi) {
    if (value < lo || value > hi) {
        std::ostringstream oss;
        oss << name << " must be in [" << lo << ", " << hi << "], got " << value;
        errors.push_back(oss.str());
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    cfg.config_file = path;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config JSON: " + std::string(e.what()));
    }

    try {
        // Credentials
        if (j.contains("api_key")) cfg.api_key = j["api_key"].get<std::string>();
        if (j.contains("api_secret")) cfg.api_secret = j["api_secret"].get<std::string>();
        if (j.contains("webhook_url")) cfg.webhook_url = j["webhook_url"].get<std::string>();

        // Endpoints
        if (j.contains("private_api_base")) cfg.private_api_base = j["private_api_base"].get<std::string>();
        if (j.contains("public_api_base")) cfg.public_api_base = j["public_api_base"].get<std::string>();
        if (j.contains("http_timeout_seconds")) cfg.http_timeout_seconds = j["http_timeout_seconds"].get<int64_t>();

        // Entry gating and retries
        if (j.contains("spread_threshold")) cfg.spread_threshold = j["spread_threshold"].get<double>();
        if (j.contains("jitter_seconds")) cfg.jitter_seconds = j["jitter_seconds"].get<int64_t>();
        if (j.contains("entry_order_retry_interval")) cfg.entry_order_retry_interval = j["entry_order_retry_interval"].get<int64_t>();
        if (j.contains("max_entry_order_attempts")) cfg.max_entry_order_attempts = j["max_entry_order_attempts"].get<int>();
        if (j.contains("exit_order_retry_interval")) cfg.exit_order_retry_interval = j["exit_order_retry_interval"].get<int64_t>();
        if (j.contains("max_exit_order_attempts")) cfg.max_exit_order_attempts = j["max_exit_order_attempts"].get<int>();

        // Protective exits
        if (j.contains("stop_loss_pips")) cfg.stop_loss_pips = j["stop_loss_pips"].get<double>();
        if (j.contains("take_profit_pips")) cfg.take_profit_pips = j["take_profit_pips"].get<double>();

        // Monitoring
        if (j.contains("position_check_interval")) cfg.position_check_interval = j["position_check_interval"].get<int64_t>();
        if (j.contains("position_check_interval_minutes")) cfg.position_check_interval_minutes = j["position_check_interval_minutes"].get<int64_t>();

        // Sizing
        if (j.contains("autolot")) cfg.autolot = parse_flag(j["autolot"]);
        if (j.contains("leverage")) cfg.leverage = j["leverage"].get<double>();
        if (j.contains("manual_leverage")) cfg.manual_leverage = j["manual_leverage"].get<double>();
        if (j.contains("risk_ratio")) cfg.risk_ratio = j["risk_ratio"].get<double>();
        if (j.contains("account_currency")) cfg.account_currency = j["account_currency"].get<std::string>();
        if (j.contains("symbol_daily_volume_limit")) cfg.symbol_daily_volume_limit = j["symbol_daily_volume_limit"].get<int64_t>();

        // Supervision
        if (j.contains("auto_restart_hour") && !j["auto_restart_hour"].is_null()) {
            cfg.auto_restart_hour = j["auto_restart_hour"].get<int>();
        }
        if (j.contains("eod_cutoff_hour")) cfg.eod_cutoff_hour = j["eod_cutoff_hour"].get<int>();
        if (j.contains("health_check_interval_hours")) cfg.health_check_interval_hours = j["health_check_interval_hours"].get<int64_t>();
        if (j.contains("min_free_disk_gb")) cfg.min_free_disk_gb = j["min_free_disk_gb"].get<double>();
        if (j.contains("max_memory_mb")) cfg.max_memory_mb = j["max_memory_mb"].get<double>();
        if (j.contains("memory_warning_mb")) cfg.memory_warning_mb = j["memory_warning_mb"].get<double>();
        if (j.contains("restart_cooldown_seconds")) cfg.restart_cooldown_seconds = j["restart_cooldown_seconds"].get<int64_t>();
        if (j.contains("max_restarts")) cfg.max_restarts = j["max_restarts"].get<int>();

        // File paths
        if (j.contains("trade_plan_file")) cfg.trade_plan_file = j["trade_plan_file"].get<std::string>();
        if (j.contains("results_dir")) cfg.results_dir = j["results_dir"].get<std::string>();
        if (j.contains("kill_switch_file")) cfg.kill_switch_file = j["kill_switch_file"].get<std::string>();
        if (j.contains("log_dir")) cfg.log_dir = j["log_dir"].get<std::string>();
        if (j.contains("log_level")) cfg.log_level = j["log_level"].get<std::string>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config value: " + std::string(e.what()));
    }

    if (cfg.api_key.empty()) cfg.api_key = env_or("FXBOT_API_KEY", cfg.api_key);
    if (cfg.api_secret.empty()) cfg.api_secret = env_or("FXBOT_API_SECRET", cfg.api_secret);
    if (cfg.webhook_url.empty()) cfg.webhook_url = env_or("FXBOT_WEBHOOK_URL", cfg.webhook_url);

    return cfg;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;

    if (api_key.empty()) errors.push_back("api_key is required");
    if (api_secret.empty()) errors.push_back("api_secret is required");
    if (webhook_url.empty()) errors.push_back("webhook_url is required");

    check_range(errors, "spread_threshold", spread_threshold, 0.001, 1.0);
    check_range(errors, "jitter_seconds", static_cast<double>(jitter_seconds), 0, 60);
    check_range(errors, "entry_order_retry_interval", static_cast<double>(entry_order_retry_interval), 1, 60);
    check_range(errors, "max_entry_order_attempts", max_entry_order_attempts, 1, 10);
    check_range(errors, "exit_order_retry_interval", static_cast<double>(exit_order_retry_interval), 1, 60);
    check_range(errors, "max_exit_order_attempts", max_exit_order_attempts, 1, 10);
    check_range(errors, "stop_loss_pips", stop_loss_pips, 0, 1000);
    check_range(errors, "take_profit_pips", take_profit_pips, 0, 1000);
    check_range(errors, "position_check_interval", static_cast<double>(position_check_interval), 1, 60);
    check_range(errors, "position_check_interval_minutes", static_cast<double>(position_check_interval_minutes), 1, 99);
    check_range(errors, "leverage", leverage, 1, 100);
    check_range(errors, "manual_leverage", manual_leverage, 1, 100);
    check_range(errors, "risk_ratio", risk_ratio, 0.1, 1.0);

    if (auto_restart_hour.has_value()) {
        check_range(errors, "auto_restart_hour", *auto_restart_hour, 0, 24);
    }

    if (symbol_daily_volume_limit <= 0) {
        errors.push_back("symbol_daily_volume_limit must be > 0, got " + std::to_string(symbol_daily_volume_limit));
    }

    check_range(errors, "eod_cutoff_hour", eod_cutoff_hour, 0, 23);

    if (health_check_interval_hours < 1) {
        errors.push_back("health_check_interval_hours must be >= 1, got " + std::to_string(health_check_interval_hours));
    }

    if (max_restarts < 0) {
        errors.push_back("max_restarts must be >= 0, got " + std::to_string(max_restarts));
    }

    if (restart_cooldown_seconds < 0) {
        errors.push_back("restart_cooldown_seconds must be >= 0, got " + std::to_string(restart_cooldown_seconds));
    }

    if (http_timeout_seconds < 1) {
        errors.push_back("http_timeout_seconds must be >= 1, got " + std::to_string(http_timeout_seconds));
    }

    if (account_currency.size() != 3) {
        errors.push_back("account_currency must be a 3-letter code, got '" + account_currency + "'");
    }

    if (trade_plan_file.empty()) errors.push_back("trade_plan_file cannot be empty");
    if (results_dir.empty()) errors.push_back("results_dir cannot be empty");

    for (const auto& e : errors) {
        LOG_ERROR("Config: " + e);
    }

    return errors;
}

void Config::log_config() const {
    std::ostringstream oss;
    oss << "Configuration loaded:"
        << "\n  api_key: " << mask(api_key)
        << "\n  api_secret: " << mask(api_secret)
        << "\n  webhook_url: " << (webhook_url.empty() ? "(unset)" : "(set)")
        << "\n  private_api_base: " << private_api_base
        << "\n  public_api_base: " << public_api_base
        << "\n  spread_threshold: " << spread_threshold
        << "\n  jitter_seconds: " << jitter_seconds
        << "\n  entry_order_retry_interval: " << entry_order_retry_interval
        << "\n  max_entry_order_attempts: " << max_entry_order_attempts
        << "\n  exit_order_retry_interval: " << exit_order_retry_interval
        << "\n  max_exit_order_attempts: " << max_exit_order_attempts
        << "\n  stop_loss_pips: " << stop_loss_pips
        << "\n  take_profit_pips: " << take_profit_pips
        << "\n  position_check_interval: " << position_check_interval
        << "\n  position_check_interval_minutes: " << position_check_interval_minutes
        << "\n  autolot: " << (autolot ? "true" : "false")
        << "\n  leverage: " << leverage
        << "\n  manual_leverage: " << manual_leverage
        << "\n  risk_ratio: " << risk_ratio
        << "\n  symbol_daily_volume_limit: " << symbol_daily_volume_limit
        << "\n  auto_restart_hour: " << (auto_restart_hour.has_value() ? std::to_string(*auto_restart_hour) : "disabled")
        << "\n  eod_cutoff_hour: " << eod_cutoff_hour
        << "\n  trade_plan_file: " << trade_plan_file
        << "\n  results_dir: " << results_dir
        << "\n  log_dir: " << log_dir;

    LOG_INFO(oss.str());
}
