#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace stepgate::core::config {

    // Well-known locations inside the task pod
    inline const std::string kDefaultCancelFile = "/tekton/downward/cancel";
    inline const std::string kDefaultStepsDir = "/tekton/steps";
    inline const std::string kDefaultResultsDir = "/tekton/results";

    // Marker file conventions
    inline const std::string kErrorSuffix = ".err";
    inline const std::string kBreakpointExitSuffix = ".breakpointexit";
    inline const std::string kBeforeStepExitSuffix = ".beforestepexit";
    inline const std::string kExitCodeFileName = "exitCode";

    // Step metadata layout
    inline const std::string kArtifactsDirName = "artifacts";
    inline const std::string kArtifactManifestName = "provenance.json";
    inline const std::string kResultsDirName = "results";
    inline const std::string kContainerPrefix = "step-";

    constexpr std::chrono::milliseconds kDefaultPollInterval{1000};

    // Upper bound the kubelet accepts for a container termination message.
    constexpr std::size_t kMaxTerminationMessageBytes = 4096;

    // Container name of a step as laid out in the pod.
    inline std::string container_name(const std::string& step_name) {
        return kContainerPrefix + step_name;
    }

} // namespace stepgate::core::config
