// Caller-facing operations: connection test, listing, upload and download.
//
// Every operation opens its own ConnectionSession, so concurrent calls never
// share a connection. Transport faults never escape: they come back as a
// TransferOutcome, a status string, false or an empty listing.
#pragma once
#include "Cancellation.hpp"
#include "ConnectionSession.hpp"
#include "DirectoryLister.hpp"
#include "Settings.hpp"
#include "TransferEngine.hpp"
#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace skiff {

struct Credentials {
    std::string host;
    std::string username;
    std::string password;
    std::uint16_t port = 22;
};

class SftpFacade {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;

    static constexpr const char* kDownloadFinished = "Download Finished.";
    static constexpr const char* kErrorPrefix = "ERROR:\n";

    // Empty factory: libssh2 backend.
    explicit SftpFacade(ClientFactory factory = {},
                        FacadeSettings settings = loadSettings(),
                        CancellationController& controller = CancellationController::global());

    // Human-readable result of a connect/disconnect round trip.
    std::string testConnection(const std::string& host, const std::string& username,
                               const std::string& password, std::uint16_t port);
    // nullopt on success.
    std::optional<ConnectError> probeConnection(const Credentials& cred);

    std::vector<RemoteEntry> listFiles(const std::string& host, const std::string& username,
                                       const std::string& password, std::uint16_t port,
                                       const std::string& remotePath);

    // Compatibility entry points: the outcome is rendered to bool / string.
    bool uploadFile(const std::string& host, const std::string& username,
                    const std::string& password, std::uint16_t port,
                    const std::string& localPath, const std::string& remotePath,
                    const ProgressCallback& onProgress = {},
                    std::optional<CancellationToken> token = std::nullopt,
                    const CompletionCallback& onComplete = {});

    std::string downloadFile(const std::string& host, const std::string& username,
                             const std::string& password, std::uint16_t port,
                             const std::string& remoteFilePath, const std::string& localPath,
                             const ProgressCallback& onProgress = {},
                             std::optional<CancellationToken> token = std::nullopt,
                             const CompletionCallback& onComplete = {});

    TransferOutcome upload(const Credentials& cred,
                           const std::string& localPath, const std::string& remotePath,
                           const ProgressCallback& onProgress = {},
                           std::optional<CancellationToken> token = std::nullopt,
                           const CompletionCallback& onComplete = {});

    TransferOutcome download(const Credentials& cred,
                             const std::string& remoteFilePath, const std::string& localPath,
                             const ProgressCallback& onProgress = {},
                             std::optional<CancellationToken> token = std::nullopt,
                             const CompletionCallback& onComplete = {});

    // Same as upload()/download() on a separate thread. Callbacks run there.
    std::future<TransferOutcome> uploadAsync(Credentials cred, std::string localPath,
                                             std::string remotePath,
                                             ProgressCallback onProgress = {},
                                             std::optional<CancellationToken> token = std::nullopt,
                                             CompletionCallback onComplete = {});

    std::future<TransferOutcome> downloadAsync(Credentials cred, std::string remoteFilePath,
                                               std::string localPath,
                                               ProgressCallback onProgress = {},
                                               std::optional<CancellationToken> token = std::nullopt,
                                               CompletionCallback onComplete = {});

    // Single-slot cancellation (see CancellationController). isCancelling()
    // is true while the current token is live, i.e. cancel() would act.
    CancellationToken newCancellationToken() { return controller_.newToken(); }
    void cancel() { controller_.cancel(); }
    bool isCancelling() const { return controller_.isActive(); }

    // Per-host probe timeout; nullopt uses settings().probeTimeout
    // (Network/probeTimeoutMs).
    bool hasInternetConnection(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    static std::string renderDownload(const TransferOutcome& outcome);

    const FacadeSettings& settings() const { return settings_; }

private:
    ClientFactory factory_;
    FacadeSettings settings_;
    CancellationController& controller_;
    TransferEngine engine_;

    SessionOptions sessionOptions(const Credentials& cred) const;
    CancellationToken resolveToken(const std::optional<CancellationToken>& token) const;

    // Connects a fresh session; on failure fills err and returns nullptr.
    std::unique_ptr<ConnectionSession> openSession(const Credentials& cred, ConnectError& err);
};

} // namespace skiff
