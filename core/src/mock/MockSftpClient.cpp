#include "skiff/MockSftpClient.hpp"
#include <algorithm>
#include <stdexcept>

namespace skiff {

MockRemote::MockRemote() {
    addDirectory("/");
    addDirectory("/home");
    addDirectory("/home/luis");
    addDirectory("/var");
    addDirectory("/var/log");
    addFile("/readme.txt", std::string(1280, 'r'));
    addFile("/home/notes.md", std::string(2048, 'n'));
    addFile("/home/luis/foto.jpg", std::string(34567, 'j'));
}

std::string MockRemote::parentOf(const std::string& path) {
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

std::string MockRemote::baseName(const std::string& path) {
    const std::size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

void MockRemote::addDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node n;
    n.info.name = path == "/" ? "/" : baseName(path);
    n.info.kind = FileKind::Directory;
    n.info.mode = 040755;
    nodes_[path] = std::move(n);
}

void MockRemote::addFile(const std::string& path, std::string content, std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node n;
    n.info.name = baseName(path);
    n.info.kind = FileKind::Regular;
    n.info.has_size = true;
    n.info.size = content.size();
    n.info.mtime = mtime;
    n.info.mode = 0100644;
    n.data = std::move(content);
    nodes_[path] = std::move(n);
}

void MockRemote::addSpecial(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node n;
    n.info.name = baseName(path);
    n.info.kind = FileKind::Other;
    n.info.mode = 0120777;
    nodes_[path] = std::move(n);
}

void MockRemote::setScript(const std::string& path, MockFileScript script) {
    std::lock_guard<std::mutex> lk(mtx_);
    scripts_[path] = std::move(script);
}

std::optional<std::string> MockRemote::content(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(path);
    if (it == nodes_.end() || it->second.info.kind != FileKind::Regular) return std::nullopt;
    return it->second.data;
}

// Stream over one node of a MockRemote, honouring its script.
class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockRemote> remote,
                   std::shared_ptr<MockSftpClient::Wake> wake,
                   std::string path, MockFileScript script)
        : remote_(std::move(remote)), wake_(std::move(wake)),
          path_(std::move(path)), script_(std::move(script)) {}

    long long read(char* buf, std::size_t len, std::string& err) override {
        if (closed_) {
            err = "remote file is closed";
            return -1;
        }
        if (script_.readDelay.count() > 0) {
            std::unique_lock<std::mutex> lk(wake_->mtx);
            wake_->cv.wait_for(lk, script_.readDelay, [this] { return wake_->interrupted; });
        }
        {
            std::lock_guard<std::mutex> lk(wake_->mtx);
            if (wake_->interrupted) {
                err = "session interrupted";
                return -1;
            }
        }

        std::lock_guard<std::mutex> lk(remote_->mtx_);
        auto it = remote_->nodes_.find(path_);
        if (it == remote_->nodes_.end()) {
            err = "file vanished: " + path_;
            return -1;
        }
        const std::string& data = it->second.data;
        if (script_.failReadAfter && offset_ >= *script_.failReadAfter) {
            err = "Connection reset by peer";
            return -1;
        }
        if (script_.stallAfter && offset_ >= *script_.stallAfter) return 0;
        if (offset_ >= data.size()) {
            eof_ = true;
            return 0;
        }

        std::size_t n = std::min(len, data.size() - offset_);
        if (script_.maxReadSize > 0) n = std::min(n, script_.maxReadSize);
        if (script_.failReadAfter) n = std::min(n, *script_.failReadAfter - offset_);
        if (script_.stallAfter) n = std::min(n, *script_.stallAfter - offset_);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset_),
                  data.begin() + static_cast<std::ptrdiff_t>(offset_ + n), buf);
        offset_ += n;
        return static_cast<long long>(n);
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        if (closed_) {
            err = "remote file is closed";
            return -1;
        }
        {
            std::lock_guard<std::mutex> lk(wake_->mtx);
            if (wake_->interrupted) {
                err = "session interrupted";
                return -1;
            }
        }
        std::lock_guard<std::mutex> lk(remote_->mtx_);
        auto it = remote_->nodes_.find(path_);
        if (it == remote_->nodes_.end()) {
            err = "file vanished: " + path_;
            return -1;
        }
        std::string& data = it->second.data;
        if (script_.failWriteAfter && data.size() >= *script_.failWriteAfter) {
            err = "Failure: disk quota exceeded";
            return -1;
        }
        data.append(buf, len);
        it->second.info.size = data.size();
        return static_cast<long long>(len);
    }

    bool atEof() const override { return eof_; }
    void close() override { closed_ = true; }

private:
    std::shared_ptr<MockRemote> remote_;
    std::shared_ptr<MockSftpClient::Wake> wake_;
    std::string path_;
    MockFileScript script_;
    std::size_t offset_ = 0;
    bool eof_ = false;
    bool closed_ = false;
};

MockSftpClient::MockSftpClient() : MockSftpClient(std::make_shared<MockRemote>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemote> remote)
    : remote_(std::move(remote)), wake_(std::make_shared<Wake>()) {}

MockSftpClient::~MockSftpClient() = default;

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "host and username are required";
        return false;
    }
    remote_->connects++;
    remote_->lastHost = opt.host;
    if (!remote_->connectError.empty()) {
        err = remote_->connectError;
        return false;
    }
    if (!remote_->expectedPassword.empty() &&
        opt.password.value_or("") != remote_->expectedPassword) {
        err = "Authentication failed: password rejected by server";
        return false;
    }
    if (remote_->connectSilentlyFails) return true;
    {
        std::lock_guard<std::mutex> lk(wake_->mtx);
        wake_->interrupted = false;
    }
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    remote_->disconnects++;
    connected_ = false;
    if (remote_->disconnectThrows) throw std::runtime_error("mock teardown failure");
}

void MockSftpClient::interrupt() {
    {
        std::lock_guard<std::mutex> lk(wake_->mtx);
        wake_->interrupted = true;
    }
    wake_->cv.notify_all();
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    if (remote_->listThrows) throw std::runtime_error("mock listing blew up");
    if (remote_->listFails) {
        err = "Permission denied";
        return false;
    }
    std::string path = remote_path.empty() ? "/" : remote_path;
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    std::lock_guard<std::mutex> lk(remote_->mtx_);
    auto dir = remote_->nodes_.find(path);
    if (dir == remote_->nodes_.end() || dir->second.info.kind != FileKind::Directory) {
        err = "no such directory in mock: " + path;
        return false;
    }

    out.clear();
    FileInfo dot = dir->second.info;
    dot.name = ".";
    FileInfo dotdot = dot;
    dotdot.name = "..";
    out.push_back(dot);
    out.push_back(dotdot);
    for (const auto& kv : remote_->nodes_) {
        if (kv.first == "/" || kv.first == path) continue;
        if (MockRemote::parentOf(kv.first) != path) continue;
        out.push_back(kv.second.info);
    }
    std::sort(out.begin() + 2, out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.isDir() != b.isDir()) return a.isDir(); // dirs first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    auto sc = remote_->scripts_.find(remote_path);
    if (sc != remote_->scripts_.end() && sc->second.failStat) {
        err = "remote stat failed: Permission denied";
        return false;
    }
    auto it = remote_->nodes_.find(remote_path);
    if (it == remote_->nodes_.end()) {
        err = "no such file: " + remote_path;
        return false;
    }
    info = it->second.info;
    return true;
}

std::unique_ptr<RemoteFile> MockSftpClient::openRead(const std::string& remote_path,
                                                     std::string& err) {
    if (!connected_) {
        err = "not connected";
        return nullptr;
    }
    MockFileScript script;
    {
        std::lock_guard<std::mutex> lk(remote_->mtx_);
        auto it = remote_->nodes_.find(remote_path);
        if (it == remote_->nodes_.end() || it->second.info.kind != FileKind::Regular) {
            err = "could not open remote file for reading: no such file";
            return nullptr;
        }
        auto sc = remote_->scripts_.find(remote_path);
        if (sc != remote_->scripts_.end()) script = sc->second;
    }
    if (script.failOpen) {
        err = "could not open remote file for reading: Permission denied";
        return nullptr;
    }
    return std::make_unique<MockRemoteFile>(remote_, wake_, remote_path, script);
}

std::unique_ptr<RemoteFile> MockSftpClient::openWrite(const std::string& remote_path,
                                                      std::string& err,
                                                      unsigned int mode) {
    if (!connected_) {
        err = "not connected";
        return nullptr;
    }
    MockFileScript script;
    {
        std::lock_guard<std::mutex> lk(remote_->mtx_);
        auto sc = remote_->scripts_.find(remote_path);
        if (sc != remote_->scripts_.end()) script = sc->second;
        if (script.failOpen) {
            err = "could not open remote file for writing: Permission denied";
            return nullptr;
        }
        if (remote_->nodes_.find(MockRemote::parentOf(remote_path)) == remote_->nodes_.end()) {
            err = "could not open remote file for writing: no such directory";
            return nullptr;
        }
        MockRemote::Node n;
        n.info.name = MockRemote::baseName(remote_path);
        n.info.kind = FileKind::Regular;
        n.info.has_size = true;
        n.info.mode = 0100000 | mode;
        remote_->nodes_[remote_path] = std::move(n);
    }
    return std::make_unique<MockRemoteFile>(remote_, wake_, remote_path, script);
}

} // namespace skiff
