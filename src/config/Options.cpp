/***
 * Name: pyinfer::config::fromEnvironment
 * Purpose: Load Options from PYINFER_* environment variables.
 */
#include "config/Options.h"
#include "pyinfer/exceptions/config_error.h"
#include "pyinfer/support/parse.h"

#include <cstdlib>
#include <string>

namespace pyinfer::config {

    std::size_t parseResultLimit(const std::string &text, const std::string &source) {
        std::size_t limit = 0;
        std::string err;
        if (!support::ParseCountStrict(text, limit, &err)) {
            throw exceptions::ConfigError(source + ": " + err + " in '" + text + "'");
        }
        return limit;
    }

    Options fromEnvironment(const EnvLookup &lookup) {
        Options out;
        const auto flag = [&lookup](const char *name) {
            const char *value = lookup(name);
            return value != nullptr && support::IsTruthy(value);
        };
        out.trace = flag("PYINFER_TRACE");
        out.metrics = flag("PYINFER_METRICS");
        out.metricsJson = flag("PYINFER_METRICS_JSON");
        if (const char *path = lookup("PYINFER_LOG_PATH"); path != nullptr && *path != '\0') {
            out.logPath = path;
            out.logFiles = true;
        }
        if (const char *limit = lookup("PYINFER_RESULT_LIMIT"); limit != nullptr) {
            out.resultLimit = parseResultLimit(limit, "PYINFER_RESULT_LIMIT");
        }
        return out;
    }

    Options fromEnvironment() {
        return fromEnvironment([](const std::string &name) { return std::getenv(name.c_str()); });
    }

} // namespace pyinfer::config
