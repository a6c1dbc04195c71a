#include "skiff/DirectoryLister.hpp"
#include "skiff/Logging.hpp"

#include <ctime>
#include <exception>

namespace skiff {

bool DirectoryLister::toEntry(const FileInfo& info, RemoteEntry& out) {
    if (info.name.empty() || info.name == "." || info.name == "..") return false;
    switch (info.kind) {
    case FileKind::Regular:
        out.kind = RemoteEntry::Kind::File;
        break;
    case FileKind::Directory:
        out.kind = RemoteEntry::Kind::Directory;
        break;
    case FileKind::Other:
        return false;
    }
    out.name = info.name;
    out.sizeKiB = info.size / 1024;
    out.modifiedAt = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(info.mtime));
    return true;
}

bool DirectoryLister::list(SftpClient& client, const std::string& remotePath,
                           std::vector<RemoteEntry>& out, std::string& err) {
    const std::string path = remotePath.empty() ? "/" : remotePath;
    out.clear();
    std::vector<FileInfo> raw;
    try {
        if (!client.list(path, raw, err)) return false;
    } catch (const std::exception& ex) {
        err = std::string("listing failed: ") + ex.what();
        return false;
    }
    out.reserve(raw.size());
    for (const auto& fi : raw) {
        RemoteEntry e;
        if (toEntry(fi, e)) out.push_back(std::move(e));
    }
    qCDebug(skList) << "listed" << path.c_str() << "entries=" << out.size()
                    << "skipped=" << (raw.size() - out.size());
    return true;
}

std::vector<RemoteEntry> DirectoryLister::list(SftpClient& client, const std::string& remotePath) {
    std::vector<RemoteEntry> out;
    std::string err;
    if (!list(client, remotePath, out, err)) {
        qCWarning(skList) << "listing" << remotePath.c_str() << "failed:" << err.c_str();
        out.clear();
    }
    return out;
}

} // namespace skiff
