#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "core/config/defaults.hpp"
#include "core/errors/step_errors.hpp"
#include "protocol/run_result.hpp"

namespace stepgate::session {

// Serializes the termination record: a JSON array of
// {"key", "value", "resultType"} sorted by key.
class TerminationWriter {
public:
    explicit TerminationWriter(
        std::filesystem::path termination_path,
        std::size_t max_bytes = core::config::kMaxTerminationMessageBytes);

    // Writes atomically. Fails with "termination_message_too_large" without
    // touching the file when the record exceeds max_bytes.
    core::errors::Status write(std::vector<protocol::RunResult> entries) const;

    const std::filesystem::path& path() const { return termination_path_; }

private:
    std::filesystem::path termination_path_;
    std::size_t max_bytes_;
};

core::errors::Result<std::string> serialize_termination_message(
    std::vector<protocol::RunResult> entries, std::size_t max_bytes);

core::errors::Result<std::vector<protocol::RunResult>> parse_termination_message(
    const std::string& message);

// YYYY-MM-DDTHH:MM:SS.mmmZ
std::string format_started_at(std::chrono::system_clock::time_point when);

}  // namespace stepgate::session
