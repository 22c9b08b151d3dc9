#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <cstdint>

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    struct Options {
        std::string log_dir = "logs";
        std::string main_filename = "main.log";
        std::string error_filename = "error.log";
        int64_t main_max_bytes = 10 * 1024 * 1024;
        int main_backups = 5;
        int64_t error_max_bytes = 5 * 1024 * 1024;
        int error_backups = 3;
        bool console = true;
    };

    static Logger& instance();

    void init(const Options& options);
    void init(const std::string& log_dir = "logs");
    void set_level(Level level);
    void set_console(bool enabled);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warning(const std::string& msg);
    void error(const std::string& msg);

    void log(Level level, const std::string& msg);

    static Level parse_level(const std::string& name);

private:
    // One size-rotated output file
    struct Sink {
        std::string path;
        std::ofstream file;
        int64_t max_bytes = 0;
        int backups = 0;
        int64_t written = 0;

        void open();
        void write_line(const std::string& line);
        void rotate();
    };

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(Level level, const std::string& msg);
    std::string level_to_string(Level level) const;
    void ensure_log_dir(const std::string& log_dir);

    Sink main_sink_;
    Sink error_sink_;
    std::mutex mutex_;
    Level min_level_ = Level::INFO;
    bool console_ = true;
    bool initialized_ = false;
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance().debug(msg)
#define LOG_INFO(msg) Logger::instance().info(msg)
#define LOG_WARNING(msg) Logger::instance().warning(msg)
#define LOG_ERROR(msg) Logger::instance().error(msg)

#endif // LOGGER_HPP
