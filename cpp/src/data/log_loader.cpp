#include "ghostmeter/data/log_loader.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ghostmeter {

namespace {

void trim_field(std::string& field) {
    field.erase(0, field.find_first_not_of(" \t\r\n"));
    field.erase(field.find_last_not_of(" \t\r\n") + 1);
}

} // namespace

// ===== Public API =====

std::vector<SensorSample> LogLoader::load_samples(
    const std::string& path,
    const LogCsvOptions& opts,
    LoadStats* stats
) {
    return parse_samples(read_file(path), opts, stats);
}

std::vector<SensorSample> LogLoader::parse_samples(
    const std::string& content,
    const LogCsvOptions& opts,
    LoadStats* stats
) {
    std::vector<size_t> pos;
    auto rows = split_rows(content,
                           opts,
                           {opts.time_column, opts.supply_column, opts.return_column},
                           pos);

    LoadStats local;
    std::vector<SensorSample> samples;
    samples.reserve(rows.size());

    for (const auto& row : rows) {
        ++local.rows_read;
        double t, supply, ret;
        if (!timestamp::try_parse(row[pos[0]], t) ||
            !try_parse_double(row[pos[1]], supply) ||
            !try_parse_double(row[pos[2]], ret)) {
            ++local.rows_skipped;
            continue;
        }
        samples.emplace_back(t, supply, ret);
    }

    if (local.rows_skipped > 0) {
        std::cerr << "[LOADER] Skipped " << local.rows_skipped << " of "
                  << local.rows_read << " sensor rows" << std::endl;
    }
    if (stats) {
        *stats = local;
    }
    return samples;
}

std::vector<HistoryDayRecord> LogLoader::load_history(
    const std::string& path,
    const LogCsvOptions& opts,
    LoadStats* stats
) {
    return parse_history(read_file(path), opts, stats);
}

std::vector<HistoryDayRecord> LogLoader::parse_history(
    const std::string& content,
    const LogCsvOptions& opts,
    LoadStats* stats
) {
    std::vector<size_t> pos;
    auto rows = split_rows(content,
                           opts,
                           {opts.date_column, opts.water_column, opts.electricity_column},
                           pos);

    LoadStats local;
    std::vector<HistoryDayRecord> records;
    records.reserve(rows.size());

    for (auto& row : rows) {
        ++local.rows_read;
        double epoch, water, ele;
        if (!timestamp::try_parse(row[pos[0]], epoch) ||
            !try_parse_double(row[pos[1]], water) ||
            !try_parse_double(row[pos[2]], ele)) {
            ++local.rows_skipped;
            continue;
        }
        records.emplace_back(std::move(row[pos[0]]), water, ele);
    }

    if (local.rows_skipped > 0) {
        std::cerr << "[LOADER] Skipped " << local.rows_skipped << " of "
                  << local.rows_read << " history rows" << std::endl;
    }
    if (stats) {
        *stats = local;
    }
    return records;
}

// ===== Internal Methods =====

std::string LogLoader::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    return oss.str();
}

std::vector<std::vector<std::string>> LogLoader::split_rows(
    const std::string& content,
    const LogCsvOptions& opts,
    const std::vector<std::string>& wanted,
    std::vector<size_t>& positions
) {
    std::istringstream stream(content);
    std::string line;

    // Without a header the wanted columns are the first ones, in order
    positions.clear();
    for (size_t i = 0; i < wanted.size(); ++i) {
        positions.push_back(i);
    }

    if (opts.has_header) {
        // Skip leading blank lines; an empty document has no rows
        while (std::getline(stream, line)) {
            if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
                break;
            }
        }
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            return {};
        }

        auto names = split_line(line, opts.delimiter);
        for (auto& name : names) {
            trim_field(name);
        }
        for (size_t i = 0; i < wanted.size(); ++i) {
            auto it = std::find(names.begin(), names.end(), wanted[i]);
            if (it == names.end()) {
                throw std::runtime_error("Missing column: " + wanted[i]);
            }
            positions[i] = static_cast<size_t>(it - names.begin());
        }
    }

    const size_t needed = *std::max_element(positions.begin(), positions.end()) + 1;

    std::vector<std::vector<std::string>> rows;
    while (std::getline(stream, line)) {
        // Skip empty lines
        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto fields = split_line(line, opts.delimiter);
        if (fields.size() < needed) {
            // Too short to hold the wanted columns: count as skipped by the caller
            fields.resize(needed);
        }
        for (auto& f : fields) {
            trim_field(f);
        }
        rows.push_back(std::move(fields));
    }

    return rows;
}

bool LogLoader::try_parse_double(const std::string& str, double& out) {
    if (str.empty()) {
        return false;
    }

    try {
        size_t pos;
        out = std::stod(str, &pos);
        // Check if entire string was consumed
        return pos == str.size() && std::isfinite(out);
    } catch (const std::logic_error&) {
        return false;
    }
}

std::vector<std::string> LogLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r' || c == '\n') {
            break;
        } else {
            field += c;
        }
    }

    // Add last field
    fields.push_back(field);

    return fields;
}

} // namespace ghostmeter
