/***
 * Name: pyinfer::config::Options
 * Purpose: Analysis settings shared by the Analyzer and the tools.
 * Inputs:
 *   - PYINFER_TRACE, PYINFER_METRICS, PYINFER_METRICS_JSON: truthy flags
 *     (1/true/yes, any letter case).
 *   - PYINFER_LOG_PATH: directory for file logs; setting it enables them.
 *   - PYINFER_RESULT_LIMIT: maximum values kept per query, 0 for no limit.
 * Outputs:
 *   - A populated Options value.
 * Theory of Operation:
 *   Unset variables keep the defaults below. A result limit that is not a
 *   non-negative integer throws ConfigError naming the variable.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace pyinfer::config {

    struct Options {
        bool trace{false};       // PYINFER_TRACE / --trace
        bool metrics{false};     // PYINFER_METRICS / --metrics
        bool metricsJson{false}; // PYINFER_METRICS_JSON / --metrics-json
        bool logFiles{false};    // set together with logPath
        std::string logPath{};   // PYINFER_LOG_PATH / --log-path=<dir>
        std::size_t resultLimit{0};
    };

    // Returns nullptr for unset variables.
    using EnvLookup = std::function<const char *(const std::string &)>;

    Options fromEnvironment(const EnvLookup &lookup);
    Options fromEnvironment();

    // Parses a PYINFER_RESULT_LIMIT style value; throws ConfigError naming `source`.
    std::size_t parseResultLimit(const std::string &text, const std::string &source);

} // namespace pyinfer::config
