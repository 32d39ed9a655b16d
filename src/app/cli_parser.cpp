#include "cli_parser.hpp"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>

namespace stepgate::app::cli {

    using namespace stepgate::core::errors;
    using stepgate::protocol::StepExecutionRequest;
    using json = nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> wait_files;
        bool wait_file_content = false;
        std::optional<std::string> post_file;
        std::optional<std::string> termination_path;
        std::optional<std::string> results;
        std::optional<std::string> step_results;
        std::optional<std::string> results_dir;
        std::optional<std::string> step_metadata_dir;
        std::optional<std::string> steps_dir;
        std::optional<std::string> cancel_file;
        std::optional<std::string> timeout;
        std::optional<std::string> on_error;
        bool breakpoint_on_failure = false;
        bool debug_before_step = false;
        std::optional<std::string> when;
        std::optional<std::string> stdout_path;
        std::optional<std::string> stderr_path;
        std::optional<std::string> signing_key;
        std::optional<std::string> signing_cert;
        std::optional<std::string> poll_interval_ms;
        bool verbose = false;
        std::vector<std::string> command;
    };

    namespace {

        StepError config_error(const std::string& message, const std::string& code,
                               const std::string& hint = "") {
            return StepError{ErrorCategory::Configuration, message, code, hint};
        }

        std::vector<std::string> split_names(const std::string& list) {
            std::vector<std::string> names;
            std::size_t start = 0;
            while (start <= list.size()) {
                const auto comma = list.find(',', start);
                const auto end = comma == std::string::npos ? list.size() : comma;
                if (end > start) {
                    names.push_back(list.substr(start, end - start));
                }
                if (comma == std::string::npos) {
                    break;
                }
                start = comma + 1;
            }
            return names;
        }

        // <n>ms | <n>s | <n>m | <n>h, optionally negative.
        Result<std::chrono::milliseconds> parse_duration(const std::string& text) {
            const auto invalid = config_error("Invalid duration for --timeout: " + text,
                                              "invalid_duration",
                                              "Use <n>ms, <n>s, <n>m or <n>h.");
            std::size_t unit_pos = text.find_first_not_of("-0123456789");
            if (unit_pos == std::string::npos || unit_pos == 0) {
                return invalid;
            }

            long long amount = 0;
            const char* begin = text.data();
            const char* end = text.data() + unit_pos;
            auto [ptr, ec] = std::from_chars(begin, end, amount);
            if (ec != std::errc() || ptr != end) {
                return invalid;
            }

            const std::string unit = text.substr(unit_pos);
            long long millis_per_unit = 0;
            if (unit == "ms") {
                millis_per_unit = 1;
            } else if (unit == "s") {
                millis_per_unit = 1000;
            } else if (unit == "m") {
                millis_per_unit = 60 * 1000;
            } else if (unit == "h") {
                millis_per_unit = 60 * 60 * 1000;
            } else {
                return invalid;
            }

            // Reject before scaling so the product stays representable
            constexpr auto kMaxMillis = std::chrono::milliseconds::max().count();
            constexpr auto kMinMillis = std::chrono::milliseconds::min().count();
            if (amount > kMaxMillis / millis_per_unit || amount < kMinMillis / millis_per_unit) {
                return config_error("Duration for --timeout out of range: " + text, "bounds_error",
                                    "Use a smaller amount or a smaller unit.");
            }
            return std::chrono::milliseconds(amount * millis_per_unit);
        }

        Result<std::vector<stepgate::protocol::GuardExpression>> parse_when(const std::string& text) {
            const auto invalid = [](const std::string& detail) {
                return config_error("Invalid --when expression list: " + detail, "invalid_when",
                                    "Expected a JSON array of {\"input\",\"operator\",\"values\"} or {\"cel\"} objects.");
            };

            json document;
            try {
                document = json::parse(text);
            } catch (const json::parse_error& e) {
                return invalid(e.what());
            }
            if (!document.is_array()) {
                return invalid("not an array");
            }

            std::vector<stepgate::protocol::GuardExpression> guards;
            for (const auto& item : document) {
                if (!item.is_object()) {
                    return invalid("entry is not an object");
                }
                if (item.contains("cel")) {
                    if (!item["cel"].is_string() || item.contains("input")) {
                        return invalid("\"cel\" must be a string and stand alone");
                    }
                    guards.emplace_back(stepgate::protocol::CelGuard{item["cel"].get<std::string>()});
                    continue;
                }

                if (!item.contains("input") || !item["input"].is_string() ||
                    !item.contains("operator") || !item["operator"].is_string()) {
                    return invalid("entry needs \"input\" and \"operator\" strings");
                }
                stepgate::protocol::OperatorGuard guard;
                guard.input = item["input"].get<std::string>();
                const auto op = item["operator"].get<std::string>();
                if (op == "in") {
                    guard.op = stepgate::protocol::GuardOperator::In;
                } else if (op == "notin") {
                    guard.op = stepgate::protocol::GuardOperator::NotIn;
                } else {
                    return invalid("unknown operator " + op);
                }
                if (item.contains("values")) {
                    if (!item["values"].is_array()) {
                        return invalid("\"values\" must be an array of strings");
                    }
                    for (const auto& value : item["values"]) {
                        if (!value.is_string()) {
                            return invalid("\"values\" must be an array of strings");
                        }
                        guard.values.push_back(value.get<std::string>());
                    }
                }
                guards.emplace_back(std::move(guard));
            }
            return guards;
        }

    } // namespace

    Result<StepExecutionRequest> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const auto take = [&](std::size_t& i, std::optional<std::string>& slot) -> std::optional<StepError> {
            if (i + 1 < args.size()) {
                slot = args[++i];
                return std::nullopt;
            }
            return config_error("Missing value for " + args[i], "missing_value");
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];
            std::optional<StepError> failure;
            if (arg == "--") {
                raw.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            } else if (arg == "--wait-file") {
                std::optional<std::string> file;
                failure = take(i, file);
                if (file) raw.wait_files.push_back(file.value());
            } else if (arg == "--wait-file-content") {
                raw.wait_file_content = true;
            } else if (arg == "--post-file") {
                failure = take(i, raw.post_file);
            } else if (arg == "--termination-path") {
                failure = take(i, raw.termination_path);
            } else if (arg == "--results") {
                failure = take(i, raw.results);
            } else if (arg == "--step-results") {
                failure = take(i, raw.step_results);
            } else if (arg == "--results-dir") {
                failure = take(i, raw.results_dir);
            } else if (arg == "--step-metadata-dir") {
                failure = take(i, raw.step_metadata_dir);
            } else if (arg == "--steps-dir") {
                failure = take(i, raw.steps_dir);
            } else if (arg == "--cancel-file") {
                failure = take(i, raw.cancel_file);
            } else if (arg == "--timeout") {
                failure = take(i, raw.timeout);
            } else if (arg == "--on-error") {
                failure = take(i, raw.on_error);
            } else if (arg == "--breakpoint-on-failure") {
                raw.breakpoint_on_failure = true;
            } else if (arg == "--debug-before-step") {
                raw.debug_before_step = true;
            } else if (arg == "--when") {
                failure = take(i, raw.when);
            } else if (arg == "--stdout-path") {
                failure = take(i, raw.stdout_path);
            } else if (arg == "--stderr-path") {
                failure = take(i, raw.stderr_path);
            } else if (arg == "--signing-key") {
                failure = take(i, raw.signing_key);
            } else if (arg == "--signing-cert") {
                failure = take(i, raw.signing_cert);
            } else if (arg == "--poll-interval-ms") {
                failure = take(i, raw.poll_interval_ms);
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else {
                return config_error("Unknown argument: " + arg, "unknown_argument",
                                    "Put the command to run after \"--\".");
            }
            if (failure) {
                return failure.value();
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        StepExecutionRequest req;
        req.command = std::move(raw.command);
        req.wait_files = std::move(raw.wait_files);
        req.wait_file_content = raw.wait_file_content;
        req.breakpoint_on_failure = raw.breakpoint_on_failure;
        req.debug_before_step = raw.debug_before_step;
        req.verbose = raw.verbose;

        if (raw.post_file) req.post_file = raw.post_file.value();
        if (raw.termination_path) req.termination_path = raw.termination_path.value();
        if (raw.results) req.results = split_names(raw.results.value());
        if (raw.step_results) req.step_results = split_names(raw.step_results.value());
        if (raw.results_dir) req.results_dir = raw.results_dir.value();
        if (raw.step_metadata_dir) req.step_metadata_dir = raw.step_metadata_dir.value();
        if (raw.steps_dir) req.steps_dir = raw.steps_dir.value();
        if (raw.cancel_file) req.cancel_file = raw.cancel_file.value();
        if (raw.stdout_path) req.stdout_path = std::filesystem::path(raw.stdout_path.value());
        if (raw.stderr_path) req.stderr_path = std::filesystem::path(raw.stderr_path.value());

        if (raw.debug_before_step && req.post_file.empty()) {
            return config_error("--debug-before-step requires --post-file", "missing_required_flag");
        }

        if (raw.timeout) {
            auto timeout = parse_duration(raw.timeout.value());
            if (is_error(timeout)) {
                return get_error(timeout);
            }
            req.timeout = get_value(timeout);
        }

        if (raw.on_error) {
            if (raw.on_error.value() == "stopAndFail") {
                req.on_error = stepgate::protocol::OnErrorPolicy::StopAndFail;
            } else if (raw.on_error.value() == "continue") {
                req.on_error = stepgate::protocol::OnErrorPolicy::Continue;
            } else {
                return config_error("Invalid value for --on-error: " + raw.on_error.value(),
                                    "invalid_on_error", "Must be stopAndFail or continue.");
            }
        }

        if (raw.when) {
            auto guards = parse_when(raw.when.value());
            if (is_error(guards)) {
                return get_error(guards);
            }
            req.when = get_value(guards);
        }

        // Signing material comes as a pair
        if (raw.signing_key.has_value() != raw.signing_cert.has_value()) {
            return config_error("--signing-key and --signing-cert must be given together", "conflicting_flags");
        }
        if (raw.signing_key) {
            req.signing_key = std::filesystem::path(raw.signing_key.value());
            req.signing_cert = std::filesystem::path(raw.signing_cert.value());
        }

        // Exception-free integer parsing
        if (raw.poll_interval_ms) {
            uint32_t interval = 0;
            const char* begin = raw.poll_interval_ms->data();
            const char* end = raw.poll_interval_ms->data() + raw.poll_interval_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, interval);
            if (ec != std::errc() || ptr != end) {
                return config_error("Invalid number for --poll-interval-ms", "invalid_integer", "Provide a positive integer.");
            }
            if (interval == 0 || interval > 60000) {
                return config_error("--poll-interval-ms out of bounds", "bounds_error", "Must be between 1 and 60000.");
            }
            req.poll_interval = std::chrono::milliseconds(interval);
        }

        return req;
    }

} // namespace stepgate::app::cli
