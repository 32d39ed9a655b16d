#pragma once

#include <string>
#include "core/errors/step_errors.hpp"

namespace stepgate::runtime {

class PostWriter {
public:
    virtual ~PostWriter() = default;

    // Creates `path` (and its parent directories) holding `content`.
    virtual core::errors::Status write(const std::string& path,
                                       const std::string& content) = 0;
};

class FilePostWriter : public PostWriter {
public:
    core::errors::Status write(const std::string& path,
                               const std::string& content) override;
};

}  // namespace stepgate::runtime
