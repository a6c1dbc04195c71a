// Scoped ownership of one connected SftpClient. The connection is released
// when the session goes out of scope, whatever path leads there.
#pragma once
#include "SftpClient.hpp"
#include <memory>
#include <string>

namespace skiff {

struct ConnectError {
    enum class Kind { BadCredentials, ConnectionRefused, Generic };
    Kind kind = Kind::Generic;
    std::string message;
};

// Trims, strips a leading "sftp://" (any case) and a trailing '/'.
std::string normalizeHost(const std::string& host);

ConnectError classifyConnectError(const std::string& raw);

// User-facing sentence for a connection failure.
std::string describeConnectError(const ConnectError& e);

class ConnectionSession {
public:
    explicit ConnectionSession(std::unique_ptr<SftpClient> client);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // opt.host is normalized before use.
    bool connect(SessionOptions opt, ConnectError& err);

    // Best effort and idempotent: teardown faults are logged, never raised.
    void disconnect() noexcept;

    bool isConnected() const { return client_ && client_->isConnected(); }
    SftpClient& client() { return *client_; }

private:
    std::unique_ptr<SftpClient> client_;
    bool open_ = false;
};

} // namespace skiff
