#ifndef HEALTH_HPP
#define HEALTH_HPP

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "notifier.hpp"
#include <mutex>
#include <string>
#include <vector>

struct HealthSettings {
    double min_free_disk_gb = 1.0;
    double max_memory_mb = 500.0;
    std::vector<std::string> required_files;
    std::string results_dir = "daily_results";
    std::string disk_path = ".";

    static HealthSettings from_config(const Config& config);
};

struct HealthReport {
    bool api_ok = false;
    bool notifier_ok = false;
    bool disk_ok = false;
    bool memory_ok = false;
    bool files_ok = false;
    double free_disk_gb = 0.0;
    double rss_mb = 0.0;
    std::vector<std::string> failures;

    bool healthy() const { return failures.empty(); }
    std::string summary() const;
};

class HealthChecker {
public:
    HealthChecker(SignedApiClient& client, Notifier& notifier, const HealthSettings& settings);

    HealthReport run();

    const HealthReport& last_report() const { return last_; }

    // Resident set size of this process in MB, 0 if unavailable
    static double rss_mb();

    // Free space on the filesystem holding `path` in GB, negative on error
    static double free_disk_gb(const std::string& path);

private:
    SignedApiClient& client_;
    Notifier& notifier_;
    HealthSettings settings_;
    HealthReport last_;
};

// Cooldown and lifetime cap for automatic restarts
class RestartGuard {
public:
    enum class Decision {
        ALLOWED,
        COOLDOWN,
        HALT
    };

    RestartGuard(Clock& clock, int64_t cooldown_seconds, int max_restarts, int initial_count = 0);

    Decision request();

    int count() const;
    int max_restarts() const { return max_restarts_; }

private:
    Clock& clock_;
    int64_t cooldown_ms_;
    int max_restarts_;

    mutable std::mutex mutex_;
    int count_;
    int64_t last_restart_ms_ = 0;
    bool has_restarted_ = false;
};

std::string restart_decision_to_string(RestartGuard::Decision decision);

// Replaces the running process
class Restarter {
public:
    virtual ~Restarter() = default;

    // Returns only on failure
    virtual bool restart(int restart_count) = 0;
};

// Re-executes the current binary with its original arguments. The restart
// count survives through FXBOT_RESTART_COUNT.
class ExecRestarter : public Restarter {
public:
    static constexpr const char* COUNT_ENV = "FXBOT_RESTART_COUNT";

    ExecRestarter(int argc, char* argv[]);

    bool restart(int restart_count) override;

    // Restart count inherited from the previous process image
    static int inherited_count();

private:
    std::vector<std::string> args_;
};

#endif // HEALTH_HPP
