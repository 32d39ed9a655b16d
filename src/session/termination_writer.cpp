#include "session/termination_writer.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"

namespace stepgate::session {

using core::errors::ErrorCategory;
using core::errors::StepError;
using nlohmann::json;

namespace {

json entry_to_json(const protocol::RunResult& entry) {
    json payload;
    payload["key"] = entry.key;
    payload["value"] = entry.value;
    payload["resultType"] = static_cast<int>(entry.result_type);
    return payload;
}

bool is_known_result_type(const int code) {
    switch (static_cast<protocol::ResultType>(code)) {
        case protocol::ResultType::TaskRunResult:
        case protocol::ResultType::Internal:
        case protocol::ResultType::StepResult:
        case protocol::ResultType::StepArtifacts:
        case protocol::ResultType::TaskRunArtifacts:
            return true;
        default:
            return false;
    }
}

}  // namespace

TerminationWriter::TerminationWriter(std::filesystem::path termination_path,
                                     const std::size_t max_bytes)
    : termination_path_(std::move(termination_path)), max_bytes_(max_bytes) {}

core::errors::Result<std::string> serialize_termination_message(
    std::vector<protocol::RunResult> entries, const std::size_t max_bytes) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const protocol::RunResult& lhs, const protocol::RunResult& rhs) {
                         return lhs.key < rhs.key;
                     });

    json payload = json::array();
    for (const auto& entry : entries) {
        payload.push_back(entry_to_json(entry));
    }
    auto message = payload.dump();

    if (message.size() > max_bytes) {
        return StepError{ErrorCategory::Internal,
                         "Termination message is " + std::to_string(message.size()) +
                             " bytes, above the " + std::to_string(max_bytes) + " byte limit",
                         "termination_message_too_large",
                         "Write fewer or smaller results."};
    }
    return message;
}

core::errors::Status TerminationWriter::write(std::vector<protocol::RunResult> entries) const {
    if (termination_path_.empty()) {
        return StepError{ErrorCategory::Configuration, "Termination path cannot be empty.",
                         "invalid_termination_path"};
    }

    auto message = serialize_termination_message(std::move(entries), max_bytes_);
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }

    auto written = core::fs::write_file_atomic(termination_path_, core::errors::get_value(message));
    if (core::errors::is_error(written)) {
        return written;
    }
    LOG_DEBUG("Wrote termination message to " + termination_path_.string());
    return core::errors::ok();
}

core::errors::Result<std::vector<protocol::RunResult>> parse_termination_message(
    const std::string& message) {
    std::vector<protocol::RunResult> entries;
    if (message.empty()) {
        return entries;
    }

    json payload;
    try {
        payload = json::parse(message);
    } catch (const json::parse_error& e) {
        return StepError{ErrorCategory::Internal,
                         std::string("Termination message is not valid JSON: ") + e.what(),
                         "invalid_termination_message"};
    }
    if (!payload.is_array()) {
        return StepError{ErrorCategory::Internal, "Termination message must be a JSON array.",
                         "invalid_termination_message"};
    }

    for (const auto& item : payload) {
        if (!item.is_object() || !item.contains("key") || !item.at("key").is_string()) {
            return StepError{ErrorCategory::Internal,
                             "Termination entry needs a string key.",
                             "invalid_termination_message"};
        }
        protocol::RunResult entry;
        entry.key = item.at("key").get<std::string>();
        if (item.contains("value")) {
            if (!item.at("value").is_string()) {
                return StepError{ErrorCategory::Internal,
                                 "Value of " + entry.key + " must be a string.",
                                 "invalid_termination_message"};
            }
            entry.value = item.at("value").get<std::string>();
        }
        if (item.contains("resultType")) {
            const auto& type = item.at("resultType");
            if (!type.is_number_integer() || !is_known_result_type(type.get<int>())) {
                return StepError{ErrorCategory::Internal,
                                 "Unknown resultType for " + entry.key + ".",
                                 "invalid_termination_message"};
            }
            entry.result_type = static_cast<protocol::ResultType>(type.get<int>());
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string format_started_at(const std::chrono::system_clock::time_point when) {
    const auto since_epoch = when.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
    auto whole = seconds.count();
    if (millis < 0) {
        millis += 1000;
        whole -= 1;
    }

    const std::time_t time = static_cast<std::time_t>(whole);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << 'Z';
    return out.str();
}

}  // namespace stepgate::session
