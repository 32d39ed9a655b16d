#include "core/fs/file_io.hpp"

#include <fstream>
#include <iterator>
#include <unistd.h>

namespace stepgate::core::fs {

using errors::ErrorCategory;
using errors::StepError;

errors::Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return StepError{ErrorCategory::Collection, "File does not exist: " + path.string(),
                         "file_not_found"};
    }
    if (ec) {
        return StepError{ErrorCategory::Collection, "Unable to stat file: " + path.string(),
                         "file_read_failed", ec.message()};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return StepError{ErrorCategory::Collection,
                         "Not a regular file: " + path.string(), "file_read_failed"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StepError{ErrorCategory::Collection, "Unable to open file: " + path.string(),
                         "file_read_failed"};
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        return StepError{ErrorCategory::Collection, "Unable to read file: " + path.string(),
                         "file_read_failed"};
    }
    return content;
}

errors::Status write_file_atomic(const std::filesystem::path& path,
                                 const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return StepError{ErrorCategory::Internal,
                             "Unable to create directory: " + path.parent_path().string(),
                             "dir_create_failed", ec.message()};
        }
    }

    auto temp_path = path;
    temp_path += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return StepError{ErrorCategory::Internal,
                             "Unable to open temp file: " + temp_path.string(),
                             "file_open_failed"};
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(temp_path, ec);
            return StepError{ErrorCategory::Internal,
                             "Unable to write temp file: " + temp_path.string(),
                             "file_write_failed"};
        }
    }

    // Keep the mode of the file being replaced (scripts must stay executable).
    const auto existing = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::is_regular_file(existing)) {
        std::filesystem::permissions(temp_path, existing.permissions(),
                                     std::filesystem::perm_options::replace, ec);
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        const auto rename_error = ec.message();
        std::filesystem::remove(temp_path, ec);
        return StepError{ErrorCategory::Internal,
                         "Unable to move temp file into place: " + path.string(),
                         "file_rename_failed", rename_error};
    }
    return errors::ok();
}

}  // namespace stepgate::core::fs
