#ifndef SWARMFETCH_TRANSFER_FINGERPRINT_H
#define SWARMFETCH_TRANSFER_FINGERPRINT_H

#include <string>
#include <functional>

namespace swarmfetch {

// Identity of one file at one revision of one repository
struct ArtifactFingerprint {
    std::string repo_id;
    std::string revision;
    std::string repo_type = "model";  // model, dataset, space
    std::string filename;

    // "<repo_type>:<repo_id>@<revision>/<filename>"
    std::string key() const;

    bool valid() const;

    bool operator==(const ArtifactFingerprint& other) const {
        return repo_id == other.repo_id && revision == other.revision &&
               repo_type == other.repo_type && filename == other.filename;
    }
    bool operator!=(const ArtifactFingerprint& other) const { return !(*this == other); }
};

} // namespace swarmfetch

namespace std {
template <>
struct hash<swarmfetch::ArtifactFingerprint> {
    size_t operator()(const swarmfetch::ArtifactFingerprint& fp) const {
        return std::hash<std::string>{}(fp.key());
    }
};
} // namespace std

#endif // SWARMFETCH_TRANSFER_FINGERPRINT_H
