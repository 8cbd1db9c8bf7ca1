#ifndef SWARMFETCH_TRANSFER_FILE_DELIVERY_H
#define SWARMFETCH_TRANSFER_FILE_DELIVERY_H

#include <string>

namespace swarmfetch {

// Readers of a destination path only ever see a complete file: bytes are
// written to a hidden temp file in the same directory and renamed into place.
class FileDelivery {
public:
    // "<dir>/.<name>.<random>.<tag>.part"
    static std::string temp_path_for(const std::string& destination, const std::string& tag);

    // Create the parent directory and check the destination can be written.
    // Throws SwarmFetchError(DestinationUnwritable).
    static void prepare_destination(const std::string& destination);

    // Atomically move a finished temp file onto destination
    static bool commit(const std::string& temp_path, const std::string& destination, std::string& error);

    // Hard-link source beside destination (copy when linking fails), then commit
    static bool link_into_place(const std::string& source, const std::string& destination, std::string& error);

    // Remove a file or directory tree, ignoring errors
    static void discard(const std::string& path);
};

} // namespace swarmfetch

#endif // SWARMFETCH_TRANSFER_FILE_DELIVERY_H
