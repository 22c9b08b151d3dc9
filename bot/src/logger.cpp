#include "logger.hpp"
#include "util.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (main_sink_.file.is_open()) {
        main_sink_.file.close();
    }
    if (error_sink_.file.is_open()) {
        error_sink_.file.close();
    }
}

void Logger::Sink::open() {
    file.open(path, std::ios::app);
    if (!file.is_open()) {
        std::cerr << "ERROR: Failed to open log file: " << path << std::endl;
        return;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    written = ec ? 0 : static_cast<int64_t>(size);
}

void Logger::Sink::rotate() {
    file.close();

    // main.log.4 -> main.log.5, ..., main.log -> main.log.1
    std::error_code ec;
    std::filesystem::remove(path + "." + std::to_string(backups), ec);
    for (int i = backups - 1; i >= 1; i--) {
        std::string from = path + "." + std::to_string(i);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, path + "." + std::to_string(i + 1), ec);
        }
    }
    if (backups > 0) {
        std::filesystem::rename(path, path + ".1", ec);
    } else {
        std::filesystem::remove(path, ec);
    }

    file.open(path, std::ios::trunc);
    written = 0;
}

void Logger::Sink::write_line(const std::string& line) {
    if (!file.is_open()) {
        return;
    }
    if (max_bytes > 0 && written + static_cast<int64_t>(line.size()) + 1 > max_bytes) {
        rotate();
        if (!file.is_open()) {
            return;
        }
    }
    file << line << '\n';
    file.flush();
    written += static_cast<int64_t>(line.size()) + 1;
}

void Logger::ensure_log_dir(const std::string& log_dir) {
    std::filesystem::path dir_path(log_dir);
    if (!std::filesystem::exists(dir_path)) {
        std::filesystem::create_directories(dir_path);
    }
}

void Logger::init(const Options& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return;
    }

    ensure_log_dir(options.log_dir);

    main_sink_.path = options.log_dir + "/" + options.main_filename;
    main_sink_.max_bytes = options.main_max_bytes;
    main_sink_.backups = options.main_backups;
    main_sink_.open();

    error_sink_.path = options.log_dir + "/" + options.error_filename;
    error_sink_.max_bytes = options.error_max_bytes;
    error_sink_.backups = options.error_backups;
    error_sink_.open();

    console_ = options.console;
    initialized_ = true;
}

void Logger::init(const std::string& log_dir) {
    Options options;
    options.log_dir = log_dir;
    init(options);
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

Logger::Level Logger::parse_level(const std::string& name) {
    std::string upper = util::to_upper(name);
    if (upper == "DEBUG") return Level::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return Level::WARNING;
    if (upper == "ERROR") return Level::ERROR;
    return Level::INFO;
}

std::string Logger::level_to_string(Level level) const {
    switch (level) {
        case Level::DEBUG:   return "DEBUG";
        case Level::INFO:    return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

void Logger::write(Level level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string timestamp = util::now_iso8601();
    std::string level_str = level_to_string(level);

    std::ostringstream oss;
    oss << "[" << timestamp << "] [" << std::setw(7) << level_str << "] " << msg;
    std::string formatted = oss.str();

    if (console_) {
        if (level == Level::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    main_sink_.write_line(formatted);
    if (level == Level::ERROR) {
        error_sink_.write_line(formatted);
    }
}

void Logger::debug(const std::string& msg) {
    write(Level::DEBUG, msg);
}

void Logger::info(const std::string& msg) {
    write(Level::INFO, msg);
}

void Logger::warning(const std::string& msg) {
    write(Level::WARNING, msg);
}

void Logger::error(const std::string& msg) {
    write(Level::ERROR, msg);
}

void Logger::log(Level level, const std::string& msg) {
    write(level, msg);
}
