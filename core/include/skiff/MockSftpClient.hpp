// In-memory SFTP backend. Several clients can share one MockRemote so tests
// can observe connects/disconnects and script faults per remote file.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>

namespace skiff {

// Per-file behaviour applied to streams opened on that path.
struct MockFileScript {
    std::size_t maxReadSize = 0;                 // 0 = as much as requested
    std::chrono::milliseconds readDelay{0};      // before every read
    std::optional<std::size_t> stallAfter;       // reads return 0 (no EOF) from this offset
    std::optional<std::size_t> failReadAfter;    // reads fail from this offset
    std::optional<std::size_t> failWriteAfter;   // writes fail once this many bytes exist
    bool failStat = false;
    bool failOpen = false;
};

class MockRemote {
public:
    // Seeded with a small tree: /, /home, /home/luis, /var, /var/log.
    MockRemote();

    void addDirectory(const std::string& path);
    void addFile(const std::string& path, std::string content, std::uint64_t mtime = 0);
    // Adds an entry that is neither file nor directory (e.g. a symlink).
    void addSpecial(const std::string& path);
    void setScript(const std::string& path, MockFileScript script);

    std::optional<std::string> content(const std::string& path) const;

    // Connection behaviour
    std::string connectError;          // non-empty: connect() fails with it
    bool connectSilentlyFails = false; // connect() returns true but stays disconnected
    bool disconnectThrows = false;
    bool listFails = false;
    bool listThrows = false;
    std::string expectedPassword;      // non-empty: compared against opt.password

    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    std::string lastHost;

private:
    friend class MockSftpClient;
    friend class MockRemoteFile;

    struct Node {
        FileInfo info;
        std::string data;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, MockFileScript> scripts_;

    static std::string parentOf(const std::string& path);
    static std::string baseName(const std::string& path);
};

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemote> remote);
    ~MockSftpClient() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void interrupt() override;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;

    std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                         std::string& err) override;

    std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                          std::string& err,
                                          unsigned int mode = 0644) override;

    const std::shared_ptr<MockRemote>& remote() const { return remote_; }

    // Shared with open files so interrupt() wakes their delayed reads.
    struct Wake {
        std::mutex mtx;
        std::condition_variable cv;
        bool interrupted = false;
    };

private:
    std::shared_ptr<MockRemote> remote_;
    std::shared_ptr<Wake> wake_;
    bool connected_ = false;
};

} // namespace skiff
