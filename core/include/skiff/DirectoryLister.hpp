// One-shot remote directory enumeration into a normalized listing.
#pragma once
#include "SftpClient.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace skiff {

struct RemoteEntry {
    enum class Kind { File, Directory };

    std::string name; // never "." or ".."
    Kind kind = Kind::File;
    std::uint64_t sizeKiB = 0; // bytes / 1024, rounded down
    std::chrono::system_clock::time_point modifiedAt;
};

class DirectoryLister {
public:
    // Empty on any failure (the failure is logged). An empty result does not
    // tell an error apart from an empty directory; use the overload below for
    // that.
    static std::vector<RemoteEntry> list(SftpClient& client, const std::string& remotePath);

    // Same listing, but reports failures through err. Never throws.
    static bool list(SftpClient& client, const std::string& remotePath,
                     std::vector<RemoteEntry>& out, std::string& err);

    // Maps one raw entry. False for ".", ".." and anything that is not a
    // regular file or a directory.
    static bool toEntry(const FileInfo& info, RemoteEntry& out);
};

} // namespace skiff
