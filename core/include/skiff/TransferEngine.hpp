// Streaming copy loop between a local file and a remote SFTP stream.
//
// Per chunk: cancellation check, read, full write, progress sample. Downloads
// additionally treat zero-byte reads before EOF as a stall (TimedOut after
// stallTimeout without data) and race the whole loop against
// operationTimeout; when the deadline wins the loop is cancelled, the
// connection is interrupted and the worker joined before returning.
//
// The engine borrows the client and never disconnects it. Partial files are
// left in place on cancellation or failure.
#pragma once
#include "Cancellation.hpp"
#include "SftpClient.hpp"
#include "TransferTypes.hpp"
#include <string>

namespace skiff {

class TransferEngine {
public:
    explicit TransferEngine(TransferOptions opt = {});

    const TransferOptions& options() const { return opt_; }

    // onProgress runs on the calling thread.
    TransferOutcome upload(const std::string& localPath,
                           const std::string& remotePath,
                           SftpClient& client,
                           const CancellationToken& token,
                           const ProgressCallback& onProgress = {},
                           const CompletionCallback& onComplete = {}) const;

    // onProgress runs on the engine's worker thread. The operationTimeout
    // return is only as prompt as the worker: the deadline can be overrun by
    // an onProgress that blocks or a local disk write that stalls.
    TransferOutcome download(const std::string& remotePath,
                             const std::string& localPath,
                             SftpClient& client,
                             const CancellationToken& token,
                             const ProgressCallback& onProgress = {},
                             const CompletionCallback& onComplete = {}) const;

private:
    TransferOptions opt_;

    TransferOutcome uploadLoop(const std::string& localPath, const std::string& remotePath,
                               SftpClient& client, const CancellationToken& token,
                               const ProgressCallback& onProgress) const;
    TransferOutcome downloadLoop(const std::string& remotePath, const std::string& localPath,
                                 SftpClient& client, const CancellationToken& token,
                                 const ProgressCallback& onProgress) const;
    TransferOutcome finish(const char* op, const std::string& path,
                           TransferOutcome outcome,
                           const CompletionCallback& onComplete) const;
};

// "30 seconds", "1 second", "150 ms"
std::string formatTimeout(std::chrono::milliseconds d);

} // namespace skiff
