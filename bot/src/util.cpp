#include "util.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <ctime>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>

namespace util {

namespace {

std::tm to_local_tm(int64_t epoch_seconds) {
    std::time_t time = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_time;
    localtime_r(&time, &tm_time);
    return tm_time;
}

std::string format_local(int64_t epoch_seconds, const char* fmt) {
    std::tm tm_time = to_local_tm(epoch_seconds);
    std::ostringstream oss;
    oss << std::put_time(&tm_time, fmt);
    return oss.str();
}

std::mt19937& rng() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    return gen;
}

std::mutex& rng_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string now_iso8601() {
    return epoch_to_iso8601(now_epoch_seconds());
}

std::string epoch_to_iso8601(int64_t epoch_seconds) {
    return format_local(epoch_seconds, "%Y-%m-%dT%H:%M:%S");
}

std::string date_yyyy_mm_dd(int64_t epoch_seconds) {
    return format_local(epoch_seconds, "%Y-%m-%d");
}

std::string time_hh_mm_ss(int64_t epoch_seconds) {
    return format_local(epoch_seconds, "%H:%M:%S");
}

int64_t make_local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm_time = {};
    tm_time.tm_year = year - 1900;
    tm_time.tm_mon = month - 1;
    tm_time.tm_mday = day;
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = -1;
    return static_cast<int64_t>(mktime(&tm_time));
}

int64_t at_time_of_day(int64_t epoch_seconds, int hour, int minute, int second) {
    std::tm tm_time = to_local_tm(epoch_seconds);
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = -1;
    return static_cast<int64_t>(mktime(&tm_time));
}

int64_t add_days(int64_t epoch_seconds, int days) {
    std::tm tm_time = to_local_tm(epoch_seconds);
    tm_time.tm_mday += days;
    tm_time.tm_isdst = -1;
    return static_cast<int64_t>(mktime(&tm_time));
}

int64_t next_time_of_day(int64_t epoch_seconds, int hour, int minute, int second) {
    int64_t candidate = at_time_of_day(epoch_seconds, hour, minute, second);
    if (candidate <= epoch_seconds) {
        candidate = add_days(candidate, 1);
    }
    return candidate;
}

bool parse_hh_mm_ss(const std::string& str, int& hour, int& minute, int& second) {
    std::vector<std::string> parts = split(trim(str), ':');
    if (parts.size() != 2 && parts.size() != 3) {
        return false;
    }

    int values[3] = {0, 0, 0};
    for (size_t i = 0; i < parts.size(); i++) {
        const std::string& p = parts[i];
        if (p.empty() || p.size() > 2) {
            return false;
        }
        for (char c : p) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        values[i] = std::stoi(p);
    }

    if (values[0] > 23 || values[1] > 59 || values[2] > 59) {
        return false;
    }

    hour = values[0];
    minute = values[1];
    second = values[2];
    return true;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; i++) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

int64_t random_jitter_ms(int64_t max_jitter_ms) {
    if (max_jitter_ms <= 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(rng_mutex());
    std::uniform_int_distribution<int64_t> dist(0, max_jitter_ms);
    return dist(rng());
}

double random_uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::lock_guard<std::mutex> lock(rng_mutex());
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng());
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream iss(str);
    while (std::getline(iss, current, delim)) {
        parts.push_back(current);
    }
    if (!str.empty() && str.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace util
