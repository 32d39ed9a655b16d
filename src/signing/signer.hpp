#pragma once

#include <string>
#include <vector>
#include "core/errors/step_errors.hpp"
#include "protocol/run_result.hpp"

namespace stepgate::signing {

// Keys of the entries a signer appends to the termination record.
inline const std::string kSignatureSuffix = ".sig";
inline const std::string kResultManifestKey = "RESULT_MANIFEST";
inline const std::string kSvidKey = "SVID";

class Signer {
public:
    virtual ~Signer() = default;

    // Returns the entries to append for `results` (all TaskRunResults).
    virtual core::errors::Result<std::vector<protocol::RunResult>> sign(
        const std::vector<protocol::RunResult>& results) = 0;
};

}  // namespace stepgate::signing
