#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/step_errors.hpp"
#include "protocol/run_result.hpp"

namespace stepgate::session {

// Whatever could be read, plus the first hard error hit along the way.
struct CollectionReport {
    std::vector<protocol::RunResult> entries;
    std::optional<core::errors::StepError> error;
};

// One entry per declared name whose file exists under `dir`. Missing files
// are skipped; unreadable ones set the error.
CollectionReport read_results(const std::filesystem::path& dir,
                              const std::vector<std::string>& names,
                              protocol::ResultType type);

// A single entry keyed by the manifest path, holding its raw content. A
// missing manifest yields nothing.
CollectionReport read_artifacts(const std::filesystem::path& manifest_path,
                                protocol::ResultType type);

class ResultCollector {
public:
    ResultCollector(std::filesystem::path results_dir,
                    std::filesystem::path step_metadata_dir);

    CollectionReport collect(const std::vector<std::string>& results,
                             const std::vector<std::string>& step_results) const;

    std::filesystem::path step_results_dir() const;
    std::filesystem::path step_artifacts_manifest() const;

private:
    std::filesystem::path results_dir_;
    std::filesystem::path step_metadata_dir_;
};

}  // namespace stepgate::session
