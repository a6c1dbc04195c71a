#include "skiff/TransferEngine.hpp"
#include "skiff/Logging.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace skiff {

namespace {

using SteadyClock = std::chrono::steady_clock;
using FilePtr = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

FilePtr openLocal(const std::string& path, const char* mode) {
    return FilePtr(std::fopen(path.c_str(), mode), &std::fclose);
}

// Writes the whole buffer, looping over short writes.
bool writeAll(RemoteFile& out, const char* data, std::size_t len, std::string& err) {
    while (len > 0) {
        const long long w = out.write(data, len, err);
        if (w < 0) return false;
        if (w == 0) {
            err = "remote write made no progress";
            return false;
        }
        data += w;
        len -= static_cast<std::size_t>(w);
    }
    return true;
}

void report(const ProgressCallback& cb, std::uint64_t done, std::uint64_t total,
            SteadyClock::time_point start) {
    if (!cb) return;
    cb(computeProgress(done, total, std::chrono::duration_cast<Seconds>(SteadyClock::now() - start)));
}

// Turns anything thrown inside a loop into an Unhandled outcome.
template <typename Fn>
TransferOutcome guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& ex) {
        return TransferOutcome::unhandled(ex.what());
    } catch (...) {
        return TransferOutcome::unhandled("unknown exception");
    }
}

} // namespace

std::string formatTimeout(std::chrono::milliseconds d) {
    const auto ms = d.count();
    if (ms % 1000 != 0) return std::to_string(ms) + " ms";
    const auto s = ms / 1000;
    return std::to_string(s) + (s == 1 ? " second" : " seconds");
}

TransferEngine::TransferEngine(TransferOptions opt) : opt_(opt) {
    if (opt_.chunkSize == 0) opt_.chunkSize = TransferOptions{}.chunkSize;
}

TransferOutcome TransferEngine::finish(const char* op, const std::string& path,
                                       TransferOutcome outcome,
                                       const CompletionCallback& onComplete) const {
    if (outcome.ok()) {
        qCInfo(skXfer) << op << "finished" << path.c_str();
        if (onComplete) {
            try {
                onComplete();
            } catch (const std::exception& ex) {
                qCWarning(skXfer) << op << "completion callback failed:" << ex.what();
            } catch (...) {
                qCWarning(skXfer) << op << "completion callback failed with a non-standard exception";
            }
        }
    } else {
        qCWarning(skXfer) << op << "ended" << outcomeKindName(outcome.kind)
                          << path.c_str() << outcome.detail.c_str();
    }
    return outcome;
}

TransferOutcome TransferEngine::upload(const std::string& localPath,
                                       const std::string& remotePath,
                                       SftpClient& client,
                                       const CancellationToken& token,
                                       const ProgressCallback& onProgress,
                                       const CompletionCallback& onComplete) const {
    qCInfo(skXfer) << "upload start" << localPath.c_str() << "->" << remotePath.c_str();
    TransferOutcome outcome = guarded([&] {
        return uploadLoop(localPath, remotePath, client, token, onProgress);
    });
    return finish("upload", remotePath, std::move(outcome), onComplete);
}

TransferOutcome TransferEngine::uploadLoop(const std::string& localPath,
                                           const std::string& remotePath,
                                           SftpClient& client,
                                           const CancellationToken& token,
                                           const ProgressCallback& onProgress) const {
    if (!client.isConnected()) return TransferOutcome::connectionFailed("not connected");

    FilePtr lf = openLocal(localPath, "rb");
    if (!lf) return TransferOutcome::ioFailed("could not open local file for reading: " + localPath);

    std::error_code ec;
    const auto size = std::filesystem::file_size(localPath, ec);
    const std::uint64_t total = ec ? 0 : static_cast<std::uint64_t>(size);

    std::string err;
    std::unique_ptr<RemoteFile> wh = client.openWrite(remotePath, err);
    if (!wh) return TransferOutcome::ioFailed(err);

    std::vector<char> buf(opt_.chunkSize);
    std::uint64_t done = 0;
    const auto start = SteadyClock::now();

    for (;;) {
        if (!token.isActive()) {
            qCInfo(skXfer) << "upload cancelled after" << done << "bytes";
            return TransferOutcome::cancelled();
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf.get());
        if (n == 0) {
            if (std::ferror(lf.get())) return TransferOutcome::ioFailed("local read failed");
            break; // EOF
        }
        if (!writeAll(*wh, buf.data(), n, err))
            return TransferOutcome::ioFailed("remote write failed: " + err);
        done += n;
        report(onProgress, done, total, start);
    }

    wh->close();
    return TransferOutcome::success();
}

TransferOutcome TransferEngine::download(const std::string& remotePath,
                                         const std::string& localPath,
                                         SftpClient& client,
                                         const CancellationToken& token,
                                         const ProgressCallback& onProgress,
                                         const CompletionCallback& onComplete) const {
    qCInfo(skXfer) << "download start" << remotePath.c_str() << "->" << localPath.c_str();
    // The loop watches a child token so the deadline can stop it without
    // touching the caller's token.
    CancellationToken loopToken = token.child();
    auto run = [&, loopToken] {
        return guarded([&] {
            return downloadLoop(remotePath, localPath, client, loopToken, onProgress);
        });
    };

    if (opt_.operationTimeout.count() <= 0)
        return finish("download", remotePath, run(), onComplete);

    const auto deadline = SteadyClock::now() + opt_.operationTimeout;
    std::promise<TransferOutcome> result;
    std::future<TransferOutcome> future = result.get_future();
    std::thread worker([&result, &run] { result.set_value(run()); });

    TransferOutcome outcome;
    if (future.wait_until(deadline) == std::future_status::timeout) {
        qCWarning(skXfer) << "download deadline reached; stopping worker";
        loopToken.cancel();
        client.interrupt();
        worker.join();
        outcome = TransferOutcome::timedOut("no data in " + formatTimeout(opt_.operationTimeout));
    } else {
        worker.join();
        outcome = future.get();
    }
    return finish("download", remotePath, std::move(outcome), onComplete);
}

TransferOutcome TransferEngine::downloadLoop(const std::string& remotePath,
                                             const std::string& localPath,
                                             SftpClient& client,
                                             const CancellationToken& token,
                                             const ProgressCallback& onProgress) const {
    if (!client.isConnected()) return TransferOutcome::connectionFailed("not connected");

    std::string err;
    FileInfo info;
    if (!client.stat(remotePath, info, err))
        return TransferOutcome::ioFailed("could not read remote attributes: " + err);
    const std::uint64_t total = info.has_size ? info.size : 0;

    std::unique_ptr<RemoteFile> rh = client.openRead(remotePath, err);
    if (!rh) return TransferOutcome::ioFailed(err);

    FilePtr lf = openLocal(localPath, "wb");
    if (!lf) return TransferOutcome::ioFailed("could not open local file for writing: " + localPath);

    std::vector<char> buf(opt_.chunkSize);
    std::uint64_t done = 0;
    const auto start = SteadyClock::now();
    auto lastData = start;

    for (;;) {
        if (!token.isActive()) {
            qCInfo(skXfer) << "download cancelled after" << done << "bytes";
            return TransferOutcome::cancelled();
        }
        const long long n = rh->read(buf.data(), buf.size(), err);
        if (n < 0) {
            // An interrupt shows up as a read fault; report what caused it.
            if (!token.isActive()) return TransferOutcome::cancelled();
            return TransferOutcome::ioFailed("connection dropped during read: " + err);
        }
        if (n == 0) {
            if (rh->atEof()) break;
            if (SteadyClock::now() - lastData >= opt_.stallTimeout)
                return TransferOutcome::timedOut("no data received for " + formatTimeout(opt_.stallTimeout));
            std::this_thread::sleep_for(opt_.stallBackoff);
            continue;
        }
        lastData = SteadyClock::now();
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf.get()) != static_cast<std::size_t>(n))
            return TransferOutcome::ioFailed("local write failed");
        done += static_cast<std::uint64_t>(n);
        report(onProgress, done, total, start);
    }

    if (std::fflush(lf.get()) != 0) return TransferOutcome::ioFailed("local write failed");
    rh->close();
    return TransferOutcome::success();
}

} // namespace skiff
