#include "trade_plan.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

std::string normalize_symbol(const std::string& raw) {
    std::string s = util::to_upper(util::trim(raw));
    std::replace(s.begin(), s.end(), '/', '_');
    if (s.size() == 6 && s.find('_') == std::string::npos) {
        s = s.substr(0, 3) + "_" + s.substr(3);
    }
    return s;
}

static std::string strip_quotes(const std::string& field) {
    std::string s = util::trim(field);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return util::trim(s);
}

static void warn(std::vector<std::string>* warnings, const std::string& msg) {
    LOG_WARNING("Trade plan: " + msg);
    if (warnings != nullptr) {
        warnings->push_back(msg);
    }
}

std::vector<PlanRow> parse_trade_plan(std::istream& in, std::vector<std::string>* warnings) {
    std::vector<PlanRow> rows;
    std::string line;
    int line_no = 0;
    int data_row = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (line_no == 1) {
            continue;  // header
        }

        std::vector<std::string> fields = util::split(line, ',');
        for (auto& f : fields) {
            f = strip_quotes(f);
        }

        bool blank = std::all_of(fields.begin(), fields.end(), [](const std::string& f) { return f.empty(); });
        if (blank) {
            continue;
        }
        data_row++;

        std::string where = "line " + std::to_string(line_no);
        if (fields.size() < 5) {
            warn(warnings, where + ": expected at least 5 columns, got " + std::to_string(fields.size()));
            continue;
        }

        PlanRow row;
        row.index = data_row;
        try {
            if (!fields[0].empty()) {
                row.index = std::stoi(fields[0]);
            }
        } catch (const std::exception&) {
            row.index = data_row;
        }

        if (!string_to_side(fields[1], row.side)) {
            warn(warnings, where + ": invalid side '" + fields[1] + "'");
            continue;
        }

        row.symbol = normalize_symbol(fields[2]);
        if (row.symbol.size() != 7 || row.symbol[3] != '_') {
            warn(warnings, where + ": invalid symbol '" + fields[2] + "'");
            continue;
        }

        if (!util::parse_hh_mm_ss(fields[3], row.entry_hour, row.entry_minute, row.entry_second)) {
            warn(warnings, where + ": invalid entry time '" + fields[3] + "'");
            continue;
        }
        if (!util::parse_hh_mm_ss(fields[4], row.exit_hour, row.exit_minute, row.exit_second)) {
            warn(warnings, where + ": invalid exit time '" + fields[4] + "'");
            continue;
        }

        if (fields.size() > 5 && !fields[5].empty()) {
            double lot = 0.0;
            try {
                size_t consumed = 0;
                lot = std::stod(fields[5], &consumed);
                if (consumed != fields[5].size()) {
                    lot = 0.0;
                }
            } catch (const std::exception&) {
                lot = 0.0;
            }
            if (!(lot >= 1.0)) {
                warn(warnings, where + ": invalid lot size '" + fields[5] + "'");
                continue;
            }
            row.lot_size = static_cast<int64_t>(std::floor(lot));
        }

        rows.push_back(row);
    }

    return rows;
}

std::vector<PlanRow> load_trade_plan(const std::string& path, std::vector<std::string>* warnings) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open trade plan: " + path);
    }

    // Skip a UTF-8 byte order mark
    char bom[3] = {0, 0, 0};
    file.read(bom, 3);
    if (!(file.gcount() == 3 && bom[0] == '\xEF' && bom[1] == '\xBB' && bom[2] == '\xBF')) {
        file.clear();
        file.seekg(0);
    }

    std::vector<PlanRow> rows = parse_trade_plan(file, warnings);
    LOG_INFO("Loaded " + std::to_string(rows.size()) + " trade plan row(s) from " + path);
    return rows;
}

std::vector<TradePlanEntry> resolve_trade_plan(const std::vector<PlanRow>& rows, int64_t now, int64_t last_exit) {
    std::vector<TradePlanEntry> entries;

    for (const auto& row : rows) {
        TradePlanEntry e;
        e.index = row.index;
        e.symbol = row.symbol;
        e.side = row.side;
        e.lot_size = row.lot_size;

        e.entry_time = util::at_time_of_day(now, row.entry_hour, row.entry_minute, row.entry_second);
        if (e.entry_time <= now || e.entry_time < last_exit) {
            e.entry_time = util::add_days(e.entry_time, 1);
        }

        e.exit_time = util::at_time_of_day(e.entry_time, row.exit_hour, row.exit_minute, row.exit_second);
        if (e.exit_time <= e.entry_time) {
            e.exit_time = util::add_days(e.exit_time, 1);
        }

        entries.push_back(e);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const TradePlanEntry& a, const TradePlanEntry& b) {
        return a.entry_time < b.entry_time;
    });
    return entries;
}
