#pragma once

#include "ghostmeter/core/types.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace ghostmeter {

/// CSV layout of an exported log
struct LogCsvOptions {
    char delimiter = ',';
    bool has_header = true;
    std::string time_column = "timestamp";     ///< Sensor logs: timestamp column
    std::string supply_column = "supply";
    std::string return_column = "return";
    std::string date_column = "date";          ///< History logs: date column
    std::string water_column = "water";
    std::string electricity_column = "electricity";

    LogCsvOptions() = default;
};

/// Counters of a load, for diagnostics
struct LoadStats {
    size_t rows_read = 0;
    size_t rows_skipped = 0;
};

/// Log Loader - reads exported sensor and history logs
class LogLoader {
public:
    LogLoader() = delete;  // Static class, no instances

    /// Load sensor samples from a CSV file
    static std::vector<SensorSample> load_samples(
        const std::string& path,
        const LogCsvOptions& opts = LogCsvOptions(),
        LoadStats* stats = nullptr
    );

    /// Parse sensor samples from CSV text
    static std::vector<SensorSample> parse_samples(
        const std::string& content,
        const LogCsvOptions& opts = LogCsvOptions(),
        LoadStats* stats = nullptr
    );

    /// Load daily history records from a CSV file
    static std::vector<HistoryDayRecord> load_history(
        const std::string& path,
        const LogCsvOptions& opts = LogCsvOptions(),
        LoadStats* stats = nullptr
    );

    /// Parse daily history records from CSV text
    static std::vector<HistoryDayRecord> parse_history(
        const std::string& content,
        const LogCsvOptions& opts = LogCsvOptions(),
        LoadStats* stats = nullptr
    );

private:
    static std::string read_file(const std::string& path);

    /// Split content into header + rows, resolving column positions
    static std::vector<std::vector<std::string>> split_rows(
        const std::string& content,
        const LogCsvOptions& opts,
        const std::vector<std::string>& wanted,
        std::vector<size_t>& positions
    );

    static bool try_parse_double(const std::string& str, double& out);

    /// Split CSV line into fields
    static std::vector<std::string> split_line(
        const std::string& line,
        char delimiter
    );
};

} // namespace ghostmeter
