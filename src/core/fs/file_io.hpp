#pragma once

#include <filesystem>
#include <string>
#include "core/errors/step_errors.hpp"

namespace stepgate::core::fs {

// Reads a whole regular file. Fails with "file_not_found" when nothing exists
// at `path`, and "file_read_failed" when it exists but cannot be read.
errors::Result<std::string> read_text_file(const std::filesystem::path& path);

inline bool is_file_not_found(const errors::StepError& err) {
    return err.code == "file_not_found";
}

// Writes `content` to a sibling temp file and renames it over `path`, so
// readers never see a partially written file.
errors::Status write_file_atomic(const std::filesystem::path& path,
                                 const std::string& content);

}  // namespace stepgate::core::fs
