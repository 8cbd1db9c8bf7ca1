#include "swarmfetch/transfer/fingerprint.h"

namespace swarmfetch {

std::string ArtifactFingerprint::key() const {
    return repo_type + ":" + repo_id + "@" + revision + "/" + filename;
}

bool ArtifactFingerprint::valid() const {
    return !repo_id.empty() && !revision.empty() && !filename.empty();
}

} // namespace swarmfetch
