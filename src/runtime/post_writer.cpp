#include "runtime/post_writer.hpp"

#include <filesystem>
#include <fstream>
#include "core/logging/logger.hpp"

namespace stepgate::runtime {

using core::errors::ErrorCategory;
using core::errors::StepError;

core::errors::Status FilePostWriter::write(const std::string& path,
                                           const std::string& content) {
    if (path.empty()) {
        return StepError{ErrorCategory::Internal, "Post file path cannot be empty.",
                         "invalid_post_file"};
    }

    const std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return StepError{ErrorCategory::Internal,
                             "Unable to create directory for post file: " + path,
                             "post_dir_create_failed", ec.message()};
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return StepError{ErrorCategory::Internal, "Unable to open post file: " + path,
                         "post_open_failed"};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return StepError{ErrorCategory::Internal, "Unable to write post file: " + path,
                         "post_write_failed"};
    }

    LOG_DEBUG("Wrote post file " + path);
    return core::errors::ok();
}

}  // namespace stepgate::runtime
