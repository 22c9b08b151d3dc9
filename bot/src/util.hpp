#ifndef UTIL_HPP
#define UTIL_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <random>

namespace util {

// Time utilities (epoch seconds, local time zone)
int64_t now_epoch_seconds();
int64_t now_epoch_ms();
std::string now_iso8601();
std::string epoch_to_iso8601(int64_t epoch_seconds);
std::string date_yyyy_mm_dd(int64_t epoch_seconds);
std::string time_hh_mm_ss(int64_t epoch_seconds);

// Builds a local wall-clock instant
int64_t make_local_time(int year, int month, int day, int hour, int minute, int second);

// Same local date as `epoch_seconds`, at hh:mm:ss
int64_t at_time_of_day(int64_t epoch_seconds, int hour, int minute, int second);

// Adds calendar days keeping the local wall-clock time
int64_t add_days(int64_t epoch_seconds, int days);

// Next instant strictly after `epoch_seconds` whose local time is hh:mm:ss
int64_t next_time_of_day(int64_t epoch_seconds, int hour, int minute, int second);

// Parses "HH:MM:SS" (also accepts "H:MM:SS" and "HH:MM")
bool parse_hh_mm_ss(const std::string& str, int& hour, int& minute, int& second);

// HMAC-SHA256, lowercase hex encoded
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Random jitter for backoff and scheduling
int64_t random_jitter_ms(int64_t max_jitter_ms);
double random_uniform(double lo, double hi);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::vector<std::string> split(const std::string& str, char delim);
std::string format_fixed(double value, int precision);
bool file_exists(const std::string& path);

} // namespace util

#endif // UTIL_HPP
