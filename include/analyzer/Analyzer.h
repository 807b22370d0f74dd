#pragma once

/***
 * Name: pyinfer::Analyzer
 * Purpose: Run inference queries over a tree with options, metrics and logs.
 * Inputs:
 *   - The arena holding the analysed modules; config::Options.
 * Outputs:
 *   - One QueryReport per query; metrics; optional log files.
 * Theory of Operation:
 *   Each query drains one inference stream, stopping early at the result
 *   limit. Inference failures end up in the report, never as exceptions;
 *   precondition violations still propagate. When file logs are enabled the
 *   log directory is created on construction and two files share one
 *   timestamp prefix: the tree dump of every recorded module and the
 *   results of every query so far.
 */

#include "ast/Module.h"
#include "ast/Node.h"
#include "ast/NodeArena.h"
#include "config/Options.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"
#include "infer/Value.h"
#include "observability/Metrics.h"

#include <string>
#include <vector>

namespace pyinfer {

    struct QueryReport {
        std::string query;
        std::vector<infer::Value> values{};
        infer::Outcome outcome{infer::Outcome::Empty};
        std::string message{}; // failure message when outcome is Failed
        bool truncated{false};

        std::vector<std::string> descriptions() const;
        bool succeeded() const { return outcome == infer::Outcome::Values; }
    };

    class Analyzer {
    public:
        // Throws ConfigError when the environment holds a bad setting.
        explicit Analyzer(ast::NodeArena &arena);
        Analyzer(ast::NodeArena &arena, config::Options options);

        // Records tree geometry and, with file logs on, appends the tree dump.
        void recordTree(const ast::Module &module);

        // Values of the expression `node`.
        QueryReport infer(const ast::Node &node);
        // Values bound to `name` at module level.
        QueryReport inferName(const ast::Module &module, const std::string &name);

        const config::Options &options() const { return options_; }
        const obs::Metrics &metrics() const { return metrics_; }
        bool logFilesEnabled() const { return logFiles_; }
        // Empty when file logs are off.
        std::string treeLogPath() const;
        std::string inferLogPath() const;

    private:
        QueryReport run(std::string label, infer::InferStream stream, const infer::InferenceContext &ctx);
        void record(const QueryReport &report);
        void writeLog(const std::string &path, const std::string &text);

        ast::NodeArena &arena_;
        config::Options options_;
        obs::Metrics metrics_{};
        bool logFiles_{false};
        std::string logPrefix_{};
        std::string treeLog_{};
        std::string inferLog_{};
    };

} // namespace pyinfer
