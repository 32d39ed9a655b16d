#pragma once
#include <map>
#include <string>
#include <vector>

namespace stepgate::protocol {

    // One content-addressed reference: {"digest": {"sha256": "..."}, "uri": "..."}
    struct ArtifactValue {
        std::map<std::string, std::string> digest;  // algorithm -> hex
        std::string uri;
    };

    struct Artifact {
        std::string name;
        std::vector<ArtifactValue> values;
    };

    // Contents of a step's artifacts/provenance.json
    struct Artifacts {
        std::vector<Artifact> inputs;
        std::vector<Artifact> outputs;
    };

    enum class ArtifactDirection {
        Inputs,
        Outputs
    };

    // Parsed $(steps.<name>.inputs|outputs.<artifact>); never persisted.
    struct ArtifactTemplate {
        std::string container_name;
        ArtifactDirection direction = ArtifactDirection::Outputs;
        std::string artifact_name;
    };

    inline bool operator==(const ArtifactValue& lhs, const ArtifactValue& rhs) {
        return lhs.digest == rhs.digest && lhs.uri == rhs.uri;
    }

    inline bool operator==(const Artifact& lhs, const Artifact& rhs) {
        return lhs.name == rhs.name && lhs.values == rhs.values;
    }

    inline bool operator==(const ArtifactTemplate& lhs, const ArtifactTemplate& rhs) {
        return lhs.container_name == rhs.container_name &&
               lhs.direction == rhs.direction &&
               lhs.artifact_name == rhs.artifact_name;
    }

} // namespace stepgate::protocol
