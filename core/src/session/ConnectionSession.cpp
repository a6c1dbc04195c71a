#include "skiff/ConnectionSession.hpp"
#include "skiff/Logging.hpp"
#include "skiff/RuntimeLogging.hpp"

#include <exception>

namespace skiff {

std::string normalizeHost(const std::string& host) {
    static const std::string kScheme = "sftp://";
    std::string out = trimmed(host);
    if (out.size() >= kScheme.size() &&
        lowered(out.substr(0, kScheme.size())) == kScheme) {
        out.erase(0, kScheme.size());
    }
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    return out;
}

ConnectError classifyConnectError(const std::string& raw) {
    const std::string lower = lowered(raw);
    ConnectError e;
    e.message = raw;
    if (lower.find("password") != std::string::npos ||
        lower.find("authentication failed") != std::string::npos ||
        lower.find("auth fail") != std::string::npos ||
        lower.find("permission denied") != std::string::npos) {
        e.kind = ConnectError::Kind::BadCredentials;
    } else if (lower.find("refused") != std::string::npos) {
        e.kind = ConnectError::Kind::ConnectionRefused;
    } else {
        e.kind = ConnectError::Kind::Generic;
    }
    return e;
}

std::string describeConnectError(const ConnectError& e) {
    switch (e.kind) {
    case ConnectError::Kind::BadCredentials:
        return "Authentication failed: check username and password.";
    case ConnectError::Kind::ConnectionRefused:
        return "Connection refused: check the port and firewall settings.";
    case ConnectError::Kind::Generic:
        break;
    }
    return "Connection failed: " + e.message;
}

ConnectionSession::ConnectionSession(std::unique_ptr<SftpClient> client)
    : client_(std::move(client)) {}

ConnectionSession::~ConnectionSession() {
    disconnect();
}

bool ConnectionSession::connect(SessionOptions opt, ConnectError& err) {
    if (!client_) {
        err = {ConnectError::Kind::Generic, "no SFTP backend available"};
        return false;
    }
    opt.host = normalizeHost(opt.host);
    qCInfo(skConn) << "connecting" << "host=" << loggable(opt.host)
                   << "port=" << opt.port << "user=" << loggable(opt.username);

    // From here on the backend may hold resources, so teardown is owed.
    open_ = true;
    std::string raw;
    if (!client_->connect(opt, raw)) {
        err = classifyConnectError(raw);
        qCWarning(skConn) << "connect failed" << raw.c_str();
        return false;
    }
    if (!client_->isConnected()) {
        err = {ConnectError::Kind::Generic, "failed to connect for unknown reasons"};
        qCWarning(skConn) << "connect reported success but session is down";
        return false;
    }
    qCInfo(skConn) << "connected";
    return true;
}

void ConnectionSession::disconnect() noexcept {
    if (!open_ || !client_) return;
    open_ = false;
    try {
        client_->disconnect();
        qCInfo(skConn) << "disconnected";
    } catch (const std::exception& ex) {
        qCWarning(skConn) << "disconnect failed:" << ex.what();
    } catch (...) {
        qCWarning(skConn) << "disconnect failed with a non-standard exception";
    }
}

} // namespace skiff
