#include "skiff/SftpFacade.hpp"
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/Logging.hpp"
#include "skiff/Reachability.hpp"

#include <exception>

namespace skiff {

SftpFacade::SftpFacade(ClientFactory factory, FacadeSettings settings,
                       CancellationController& controller)
    : factory_(std::move(factory)),
      settings_(std::move(settings)),
      controller_(controller),
      engine_(settings_.transfer) {
    if (!factory_)
        factory_ = [] { return std::make_unique<Libssh2SftpClient>(); };
}

SessionOptions SftpFacade::sessionOptions(const Credentials& cred) const {
    SessionOptions opt;
    opt.host = cred.host;
    opt.port = cred.port;
    opt.username = cred.username;
    opt.password = cred.password;
    opt.known_hosts_policy = settings_.knownHostsPolicy;
    opt.known_hosts_path = settings_.knownHostsPath;
    opt.connect_timeout_ms = settings_.connectTimeoutMs;
    // No interactive prompt at this layer: new hosts are trusted on first use
    // and their fingerprint recorded in the log.
    opt.hostkey_confirm_cb = [](const std::string& host, std::uint16_t port,
                                const std::string& algorithm, const std::string& fingerprint) {
        qCInfo(skConn) << "trusting new host key" << loggable(host) << port
                       << algorithm.c_str() << fingerprint.c_str();
        return true;
    };
    return opt;
}

CancellationToken SftpFacade::resolveToken(const std::optional<CancellationToken>& token) const {
    if (token) return *token;
    if (auto cur = controller_.current()) {
        if (cur->isActive()) return *cur;
    }
    return CancellationToken();
}

std::unique_ptr<ConnectionSession> SftpFacade::openSession(const Credentials& cred, ConnectError& err) {
    auto session = std::make_unique<ConnectionSession>(factory_());
    if (!session->connect(sessionOptions(cred), err)) return nullptr;
    return session;
}

std::optional<ConnectError> SftpFacade::probeConnection(const Credentials& cred) {
    try {
        ConnectError err;
        auto session = openSession(cred, err);
        if (!session) return err;
        return std::nullopt;
    } catch (const std::exception& ex) {
        qCWarning(skConn) << "testConnection failed:" << ex.what();
        return ConnectError{ConnectError::Kind::Generic, ex.what()};
    }
}

std::string SftpFacade::testConnection(const std::string& host, const std::string& username,
                                       const std::string& password, std::uint16_t port) {
    const auto err = probeConnection({host, username, password, port});
    if (!err) return "Connection successful.";
    return describeConnectError(*err);
}

std::vector<RemoteEntry> SftpFacade::listFiles(const std::string& host, const std::string& username,
                                               const std::string& password, std::uint16_t port,
                                               const std::string& remotePath) {
    try {
        ConnectError err;
        auto session = openSession({host, username, password, port}, err);
        if (!session) {
            qCWarning(skList) << "listFiles could not connect:" << err.message.c_str();
            return {};
        }
        return DirectoryLister::list(session->client(), remotePath);
    } catch (const std::exception& ex) {
        qCWarning(skList) << "listFiles failed:" << ex.what();
        return {};
    }
}

TransferOutcome SftpFacade::upload(const Credentials& cred,
                                   const std::string& localPath, const std::string& remotePath,
                                   const ProgressCallback& onProgress,
                                   std::optional<CancellationToken> token,
                                   const CompletionCallback& onComplete) {
    try {
        const CancellationToken tk = resolveToken(token);
        ConnectError err;
        auto session = openSession(cred, err);
        if (!session) return TransferOutcome::connectionFailed(describeConnectError(err));
        return engine_.upload(localPath, remotePath, session->client(), tk, onProgress, onComplete);
    } catch (const std::exception& ex) {
        qCWarning(skXfer) << "upload failed:" << ex.what();
        return TransferOutcome::unhandled(ex.what());
    }
}

TransferOutcome SftpFacade::download(const Credentials& cred,
                                     const std::string& remoteFilePath, const std::string& localPath,
                                     const ProgressCallback& onProgress,
                                     std::optional<CancellationToken> token,
                                     const CompletionCallback& onComplete) {
    try {
        const CancellationToken tk = resolveToken(token);
        ConnectError err;
        auto session = openSession(cred, err);
        if (!session) return TransferOutcome::connectionFailed(describeConnectError(err));
        return engine_.download(remoteFilePath, localPath, session->client(), tk, onProgress, onComplete);
    } catch (const std::exception& ex) {
        qCWarning(skXfer) << "download failed:" << ex.what();
        return TransferOutcome::unhandled(ex.what());
    }
}

bool SftpFacade::uploadFile(const std::string& host, const std::string& username,
                            const std::string& password, std::uint16_t port,
                            const std::string& localPath, const std::string& remotePath,
                            const ProgressCallback& onProgress,
                            std::optional<CancellationToken> token,
                            const CompletionCallback& onComplete) {
    // Reason is logged by the engine; this entry point only reports success.
    return upload({host, username, password, port}, localPath, remotePath,
                  onProgress, std::move(token), onComplete).ok();
}

std::string SftpFacade::downloadFile(const std::string& host, const std::string& username,
                                     const std::string& password, std::uint16_t port,
                                     const std::string& remoteFilePath, const std::string& localPath,
                                     const ProgressCallback& onProgress,
                                     std::optional<CancellationToken> token,
                                     const CompletionCallback& onComplete) {
    return renderDownload(download({host, username, password, port}, remoteFilePath, localPath,
                                   onProgress, std::move(token), onComplete));
}

std::string SftpFacade::renderDownload(const TransferOutcome& outcome) {
    if (outcome.ok()) return kDownloadFinished;
    return std::string(kErrorPrefix) + describeOutcome(outcome);
}

std::future<TransferOutcome> SftpFacade::uploadAsync(Credentials cred, std::string localPath,
                                                     std::string remotePath,
                                                     ProgressCallback onProgress,
                                                     std::optional<CancellationToken> token,
                                                     CompletionCallback onComplete) {
    // Resolve now so a token handed out later does not leak into this transfer.
    const CancellationToken tk = resolveToken(token);
    return std::async(std::launch::async,
                      [this, cred = std::move(cred), localPath = std::move(localPath),
                       remotePath = std::move(remotePath), onProgress = std::move(onProgress),
                       tk, onComplete = std::move(onComplete)] {
                          return upload(cred, localPath, remotePath, onProgress, tk, onComplete);
                      });
}

std::future<TransferOutcome> SftpFacade::downloadAsync(Credentials cred, std::string remoteFilePath,
                                                       std::string localPath,
                                                       ProgressCallback onProgress,
                                                       std::optional<CancellationToken> token,
                                                       CompletionCallback onComplete) {
    const CancellationToken tk = resolveToken(token);
    return std::async(std::launch::async,
                      [this, cred = std::move(cred), remoteFilePath = std::move(remoteFilePath),
                       localPath = std::move(localPath), onProgress = std::move(onProgress),
                       tk, onComplete = std::move(onComplete)] {
                          return download(cred, remoteFilePath, localPath, onProgress, tk, onComplete);
                      });
}

bool SftpFacade::hasInternetConnection(std::optional<std::chrono::milliseconds> timeout) const {
    ReachabilityProbe probe(settings_.probeHosts, settings_.probePort);
    return probe.hasInternet(timeout.value_or(settings_.probeTimeout));
}

} // namespace skiff
