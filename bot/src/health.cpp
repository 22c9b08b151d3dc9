#include "health.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

HealthSettings HealthSettings::from_config(const Config& config) {
    HealthSettings s;
    s.min_free_disk_gb = config.min_free_disk_gb;
    s.max_memory_mb = config.max_memory_mb;
    s.required_files = {config.config_file, config.trade_plan_file};
    s.results_dir = config.results_dir;
    return s;
}

std::string HealthReport::summary() const {
    std::ostringstream oss;
    oss << "API: " << (api_ok ? "OK" : "FAIL")
        << "\nNotification: " << (notifier_ok ? "OK" : "FAIL")
        << "\nDisk: " << (disk_ok ? "OK" : "FAIL") << " (" << util::format_fixed(free_disk_gb, 2) << " GB free)"
        << "\nMemory: " << (memory_ok ? "OK" : "FAIL") << " (" << util::format_fixed(rss_mb, 1) << " MB)"
        << "\nFiles: " << (files_ok ? "OK" : "FAIL")
        << "\nOverall: " << (healthy() ? "healthy" : "unhealthy");
    for (const auto& f : failures) {
        oss << "\n- " << f;
    }
    return oss.str();
}

HealthChecker::HealthChecker(SignedApiClient& client, Notifier& notifier, const HealthSettings& settings)
    : client_(client)
    , notifier_(notifier)
    , settings_(settings) {
}

double HealthChecker::rss_mb() {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) {
        return 0.0;
    }
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            std::istringstream iss(line.substr(6));
            double kb = 0.0;
            iss >> kb;
            return kb / 1024.0;
        }
    }
    return 0.0;
}

double HealthChecker::free_disk_gb(const std::string& path) {
    std::error_code ec;
    std::filesystem::space_info info = std::filesystem::space(path, ec);
    if (ec) {
        LOG_ERROR("Disk space check failed for " + path + ": " + ec.message());
        return -1.0;
    }
    return static_cast<double>(info.available) / (1024.0 * 1024.0 * 1024.0);
}

HealthReport HealthChecker::run() {
    HealthReport report;

    // API reachability
    BalanceResult balance = client_.get_balance();
    report.api_ok = balance.success;
    if (report.api_ok) {
        LOG_INFO("Health: API OK");
    } else {
        report.failures.push_back("API unreachable: " + balance.error);
        LOG_ERROR("Health: API check failed: " + balance.error);
    }

    // Notification channel
    report.notifier_ok = notifier_.send("Health check: system running");
    if (!report.notifier_ok) {
        report.failures.push_back("Notification channel unreachable");
        LOG_ERROR("Health: notification check failed");
    }

    // Disk
    report.free_disk_gb = free_disk_gb(settings_.disk_path);
    report.disk_ok = report.free_disk_gb >= settings_.min_free_disk_gb;
    if (!report.disk_ok) {
        report.failures.push_back("Low disk space: " + util::format_fixed(report.free_disk_gb, 2) + " GB");
        LOG_WARNING("Health: low disk space " + util::format_fixed(report.free_disk_gb, 2) + " GB");
    }

    // Memory
    report.rss_mb = rss_mb();
    report.memory_ok = report.rss_mb <= settings_.max_memory_mb;
    if (!report.memory_ok) {
        report.failures.push_back("Memory usage too high: " + util::format_fixed(report.rss_mb, 1) + " MB");
        LOG_WARNING("Health: memory usage " + util::format_fixed(report.rss_mb, 1) + " MB");
    }

    // Files
    report.files_ok = true;
    for (const auto& file : settings_.required_files) {
        if (!util::file_exists(file)) {
            report.files_ok = false;
            report.failures.push_back("Required file missing: " + file);
            LOG_ERROR("Health: required file missing: " + file);
        }
    }
    std::error_code ec;
    std::filesystem::create_directories(settings_.results_dir, ec);
    if (ec) {
        report.files_ok = false;
        report.failures.push_back("Cannot create " + settings_.results_dir + ": " + ec.message());
        LOG_ERROR("Health: cannot create " + settings_.results_dir + ": " + ec.message());
    }

    LOG_INFO("Health check: " + std::string(report.healthy() ? "healthy" : "unhealthy") +
             " (" + std::to_string(report.failures.size()) + " failure(s))");
    last_ = report;
    return report;
}

RestartGuard::RestartGuard(Clock& clock, int64_t cooldown_seconds, int max_restarts, int initial_count)
    : clock_(clock)
    , cooldown_ms_(cooldown_seconds * 1000)
    , max_restarts_(max_restarts)
    , count_(initial_count) {
}

RestartGuard::Decision RestartGuard::request() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (count_ >= max_restarts_) {
        LOG_ERROR("Restart limit reached (" + std::to_string(max_restarts_) + "), manual intervention required");
        return Decision::HALT;
    }

    int64_t now = clock_.now_ms();
    if (has_restarted_ && now - last_restart_ms_ < cooldown_ms_) {
        LOG_WARNING("Restart refused: cooldown active (" +
                    std::to_string((cooldown_ms_ - (now - last_restart_ms_)) / 1000) + "s remaining)");
        return Decision::COOLDOWN;
    }

    count_++;
    last_restart_ms_ = now;
    has_restarted_ = true;
    LOG_WARNING("Restart allowed (" + std::to_string(count_) + "/" + std::to_string(max_restarts_) + ")");
    return Decision::ALLOWED;
}

int RestartGuard::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::string restart_decision_to_string(RestartGuard::Decision decision) {
    switch (decision) {
        case RestartGuard::Decision::ALLOWED:  return "ALLOWED";
        case RestartGuard::Decision::COOLDOWN: return "COOLDOWN";
        case RestartGuard::Decision::HALT:     return "HALT";
        default:                               return "UNKNOWN";
    }
}

ExecRestarter::ExecRestarter(int argc, char* argv[]) {
    for (int i = 0; i < argc; i++) {
        args_.emplace_back(argv[i]);
    }
}

int ExecRestarter::inherited_count() {
    const char* value = std::getenv(COUNT_ENV);
    if (value == nullptr) {
        return 0;
    }
    try {
        return std::max(0, std::stoi(value));
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Ignoring invalid ") + COUNT_ENV + ": " + value);
        return 0;
    }
}

bool ExecRestarter::restart(int restart_count) {
    if (args_.empty()) {
        LOG_ERROR("Restart failed: no program path");
        return false;
    }

    ::setenv(COUNT_ENV, std::to_string(restart_count).c_str(), 1);

    std::vector<char*> argv;
    for (auto& arg : args_) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    LOG_WARNING("Re-executing " + args_[0]);
    ::execv("/proc/self/exe", argv.data());

    // execv only returns on failure
    LOG_ERROR("Restart failed: execv: " + std::string(std::strerror(errno)));
    return false;
}
