#include "session/result_collector.hpp"

#include <utility>
#include "core/config/defaults.hpp"
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "substitution/artifact_template.hpp"

namespace stepgate::session {

using core::errors::ErrorCategory;
using core::errors::StepError;

namespace {

void merge(CollectionReport& into, CollectionReport&& from) {
    into.entries.insert(into.entries.end(), std::make_move_iterator(from.entries.begin()),
                        std::make_move_iterator(from.entries.end()));
    if (!into.error.has_value() && from.error.has_value()) {
        into.error = std::move(from.error);
    }
}

}  // namespace

CollectionReport read_results(const std::filesystem::path& dir,
                              const std::vector<std::string>& names,
                              const protocol::ResultType type) {
    CollectionReport report;
    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        auto content = core::fs::read_text_file(dir / name);
        if (core::errors::is_error(content)) {
            const auto& error = core::errors::get_error(content);
            if (core::fs::is_file_not_found(error)) {
                LOG_DEBUG("Result " + name + " was not written, skipping");
                continue;
            }
            LOG_ERROR("Unable to read result " + name + ": " + error.message);
            if (!report.error.has_value()) {
                report.error = StepError{ErrorCategory::Collection,
                                         "Unable to read result " + name + ": " + error.message,
                                         "result_read_failed", error.hint};
            }
            continue;
        }
        report.entries.push_back({name, core::errors::get_value(content), type});
    }
    return report;
}

CollectionReport read_artifacts(const std::filesystem::path& manifest_path,
                                const protocol::ResultType type) {
    CollectionReport report;
    auto content = core::fs::read_text_file(manifest_path);
    if (core::errors::is_error(content)) {
        const auto& error = core::errors::get_error(content);
        if (!core::fs::is_file_not_found(error)) {
            report.error = StepError{ErrorCategory::Collection,
                                     "Unable to read artifact manifest: " + error.message,
                                     "artifact_read_failed", error.hint};
        }
        return report;
    }

    const auto& raw = core::errors::get_value(content);
    if (!raw.empty()) {
        auto parsed = substitution::parse_artifacts(raw);
        if (core::errors::is_error(parsed)) {
            auto error = core::errors::get_error(parsed);
            error.category = ErrorCategory::Collection;
            report.error = std::move(error);
            return report;
        }
    }
    report.entries.push_back({manifest_path.string(), raw, type});
    return report;
}

ResultCollector::ResultCollector(std::filesystem::path results_dir,
                                 std::filesystem::path step_metadata_dir)
    : results_dir_(std::move(results_dir)),
      step_metadata_dir_(std::move(step_metadata_dir)) {}

std::filesystem::path ResultCollector::step_results_dir() const {
    if (step_metadata_dir_.empty()) {
        return results_dir_;
    }
    return step_metadata_dir_ / core::config::kResultsDirName;
}

std::filesystem::path ResultCollector::step_artifacts_manifest() const {
    return step_metadata_dir_ / core::config::kArtifactsDirName /
           core::config::kArtifactManifestName;
}

CollectionReport ResultCollector::collect(const std::vector<std::string>& results,
                                          const std::vector<std::string>& step_results) const {
    CollectionReport report;
    merge(report, read_results(results_dir_, results, protocol::ResultType::TaskRunResult));
    merge(report,
          read_results(step_results_dir(), step_results, protocol::ResultType::StepResult));
    if (!step_metadata_dir_.empty()) {
        merge(report,
              read_artifacts(step_artifacts_manifest(), protocol::ResultType::StepArtifacts));
    }
    return report;
}

}  // namespace stepgate::session
