#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace skiff {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Libssh2SftpClient(const Libssh2SftpClient&) = delete;
    Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

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

private:
    bool connected_ = false;
    std::atomic<int> sock_{-1};
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    std::string lastError() const;
};

} // namespace skiff
