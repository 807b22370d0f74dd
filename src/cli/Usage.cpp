#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pyinfer::cli {

namespace {
constexpr std::string_view kUsageText = R"(infer_dump [options] [name...]

Builds the sample program, prints its tree and infers each module-level
name (all of them when none are given).

Options:
  -h, --help           Print this help and exit
  --trace              Trace cycle breaks and skipped candidates on stderr
  --metrics            Print metrics summary
  --metrics-json       Print metrics in JSON
  --log-path=<dir>     Write tree and inference logs into <dir>
  --limit=<N>          Keep at most N values per query (0: no limit)
  --                   End of options; later arguments are names as given

Environment: PYINFER_TRACE, PYINFER_METRICS, PYINFER_METRICS_JSON,
PYINFER_LOG_PATH and PYINFER_RESULT_LIMIT set the defaults.
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyinfer::cli
