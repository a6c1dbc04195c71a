// Transfer engine tests against the in-memory backend (run via CTest).
#include "skiff/Cancellation.hpp"
#include "skiff/MockSftpClient.hpp"
#include "skiff/TransferEngine.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos,
              msg + " (got: " + haystack + ")");
    }
};

// Scratch directory removed on scope exit.
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("skiff-" + tag + "-" + std::to_string(static_cast<long long>(now)));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

void writeFile(const fs::path &p, const std::string &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

std::string patternedPayload(std::size_t size) {
    std::string s(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        s[i] = static_cast<char>('a' + (i * 7) % 26);
    return s;
}

skiff::SessionOptions mockOptions() {
    skiff::SessionOptions opt;
    opt.host = "mock.test";
    opt.username = "alice";
    return opt;
}

skiff::TransferOptions fastOptions() {
    skiff::TransferOptions o;
    o.chunkSize = 8192;
    o.stallTimeout = 5000ms;
    o.stallBackoff = 5ms;
    o.operationTimeout = 10000ms;
    return o;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void test_compute_progress(TestContext &t) {
    const auto s = skiff::computeProgress(100 * 1024, 200 * 1024, skiff::Seconds(2.0));
    t.check(near(s.speedKbps, 50.0), "100 KiB in 2 s should be 50 KiB/s");
    t.check(near(s.eta.count(), 2.0), "half done after 2 s should leave 2 s");
    t.check(s.bytesTransferred == 100 * 1024 && s.totalBytes == 200 * 1024,
            "sample should carry the byte counts");

    const auto zero = skiff::computeProgress(4096, 8192, skiff::Seconds(0.0));
    t.check(zero.speedKbps == 0.0, "zero elapsed should give zero speed");
    t.check(zero.eta.count() == 0.0, "zero speed should give zero eta");

    const auto unknown = skiff::computeProgress(4096, 0, skiff::Seconds(1.0));
    t.check(unknown.eta.count() == 0.0, "unknown total should never give a negative eta");

    const auto done = skiff::computeProgress(8192, 8192, skiff::Seconds(3.0));
    t.check(near(done.eta.count(), 0.0), "finished transfer should have zero eta");
}

void test_format_timeout(TestContext &t) {
    t.check(skiff::formatTimeout(30000ms) == "30 seconds", "30000 ms -> 30 seconds");
    t.check(skiff::formatTimeout(1000ms) == "1 second", "1000 ms -> 1 second");
    t.check(skiff::formatTimeout(150ms) == "150 ms", "150 ms stays in ms");
}

void test_download_progress_accounting(TestContext &t) {
    TempDir dir("dl");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    std::vector<skiff::ProgressSample> samples;
    bool completed = false;
    const skiff::TransferEngine engine(fastOptions());
    const auto local = dir.path / "foto.jpg";
    const auto outcome = engine.download(
        "/home/luis/foto.jpg", local.string(), client, skiff::CancellationToken(),
        [&](const skiff::ProgressSample &s) { samples.push_back(s); },
        [&] { completed = true; });

    t.check(outcome.ok(), "download should succeed: " + outcome.detail);
    t.check(completed, "completion callback should run on success");
    t.check(samples.size() == 5, "34567 bytes in 8 KiB chunks should report 5 samples");
    bool monotonic = true;
    for (std::size_t i = 1; i < samples.size(); ++i)
        monotonic = monotonic && samples[i].bytesTransferred > samples[i - 1].bytesTransferred;
    t.check(monotonic, "bytesTransferred should strictly increase");
    if (!samples.empty()) {
        t.check(samples.back().bytesTransferred == 34567,
                "final sample should equal the remote size");
        t.check(samples.back().totalBytes == 34567, "totalBytes should come from stat");
    }
    std::string got;
    t.check(readFile(local, got), "downloaded file should exist");
    t.check(got == std::string(34567, 'j'), "downloaded bytes should match remote");
}

void test_short_reads_are_not_stalls(TestContext &t) {
    TempDir dir("short");
    auto remote = std::make_shared<skiff::MockRemote>();
    const std::string payload = patternedPayload(10000);
    remote->addFile("/home/short.bin", payload);
    skiff::MockFileScript script;
    script.maxReadSize = 700;
    remote->setScript("/home/short.bin", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const skiff::TransferEngine engine(fastOptions());
    const auto local = dir.path / "short.bin";
    const auto outcome = engine.download("/home/short.bin", local.string(), client,
                                         skiff::CancellationToken());
    t.check(outcome.ok(), "short reads should still complete");
    std::string got;
    t.check(readFile(local, got) && got == payload, "short reads should not lose bytes");
}

void test_upload_download_round_trip(TestContext &t) {
    TempDir dir("rt");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const std::string payload = patternedPayload(50000);
    const auto src = dir.path / "src.bin";
    const auto back = dir.path / "back.bin";
    writeFile(src, payload);

    skiff::TransferOptions opt = fastOptions();
    opt.chunkSize = 4096;
    const skiff::TransferEngine engine(opt);

    std::uint64_t lastUp = 0;
    std::uint64_t upTotal = 0;
    const auto up = engine.upload(src.string(), "/home/src.bin", client,
                                  skiff::CancellationToken(),
                                  [&](const skiff::ProgressSample &s) {
                                      lastUp = s.bytesTransferred;
                                      upTotal = s.totalBytes;
                                  });
    t.check(up.ok(), "upload should succeed: " + up.detail);
    t.check(lastUp == payload.size() && upTotal == payload.size(),
            "upload progress should end at the local size");
    t.check(remote->content("/home/src.bin") == payload, "remote bytes should match local");

    const auto down = engine.download("/home/src.bin", back.string(), client,
                                      skiff::CancellationToken());
    t.check(down.ok(), "download should succeed: " + down.detail);
    std::string got;
    t.check(readFile(back, got) && got == payload, "round trip should be byte-identical");
}

void test_empty_file_round_trip(TestContext &t) {
    TempDir dir("empty");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const auto src = dir.path / "empty.txt";
    writeFile(src, "");
    int samples = 0;
    const skiff::TransferEngine engine(fastOptions());
    const auto up = engine.upload(src.string(), "/home/empty.txt", client,
                                  skiff::CancellationToken(),
                                  [&](const skiff::ProgressSample &) { ++samples; });
    t.check(up.ok(), "empty upload should succeed");
    t.check(samples == 0, "empty upload should not report progress");
    t.check(remote->content("/home/empty.txt") == std::string(),
            "empty upload should create an empty remote file");
}

void test_pre_cancelled_token(TestContext &t) {
    TempDir dir("precancel");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    skiff::CancellationToken token;
    token.cancel();
    int samples = 0;
    bool completed = false;
    const skiff::TransferEngine engine(fastOptions());

    const auto src = dir.path / "src.bin";
    writeFile(src, patternedPayload(20000));
    const auto up = engine.upload(src.string(), "/home/never.bin", client, token,
                                  [&](const skiff::ProgressSample &) { ++samples; },
                                  [&] { completed = true; });
    t.check(up.kind == skiff::TransferOutcome::Kind::Cancelled,
            "cancelled token should cancel upload before the first chunk");
    t.check(samples == 0, "no chunk should be sent after cancellation");
    t.check(!completed, "completion should not run on cancellation");
    t.check(remote->content("/home/never.bin") == std::string(),
            "remote file should hold zero bytes");

    const auto down = engine.download("/home/luis/foto.jpg", (dir.path / "x").string(),
                                      client, token,
                                      [&](const skiff::ProgressSample &) { ++samples; });
    t.check(down.kind == skiff::TransferOutcome::Kind::Cancelled,
            "cancelled token should cancel download before the first chunk");
    t.check(samples == 0, "no chunk should be received after cancellation");
    t.check(skiff::describeOutcome(down) == "Transfer cancelled by user.",
            "cancelled outcome should describe itself");
}

void test_new_token_cancels_running_download(TestContext &t) {
    TempDir dir("supersede");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.maxReadSize = 1024;
    script.readDelay = 20ms;
    remote->setScript("/home/luis/foto.jpg", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    skiff::CancellationController controller;
    const skiff::CancellationToken token = controller.newToken();
    std::atomic<std::uint64_t> seen{0};
    const skiff::TransferEngine engine(fastOptions());
    const auto local = dir.path / "partial.jpg";

    auto fut = std::async(std::launch::async, [&] {
        return engine.download("/home/luis/foto.jpg", local.string(), client, token,
                               [&](const skiff::ProgressSample &s) { seen = s.bytesTransferred; });
    });
    const auto waitStart = std::chrono::steady_clock::now();
    while (seen.load() == 0 && std::chrono::steady_clock::now() - waitStart < 5s)
        std::this_thread::sleep_for(5ms);
    const skiff::CancellationToken next = controller.newToken();
    const auto outcome = fut.get();

    t.check(outcome.kind == skiff::TransferOutcome::Kind::Cancelled,
            "issuing a new token should cancel the running transfer");
    t.check(!token.isActive(), "previous token should be inactive");
    t.check(next.isActive(), "new token should be active");
    std::error_code ec;
    t.check(fs::exists(local), "partial file should be left in place");
    t.check(fs::file_size(local, ec) < 34567, "partial file should be incomplete");
}

void test_stall_times_out(TestContext &t) {
    TempDir dir("stall");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.stallAfter = 1000;
    remote->setScript("/home/luis/foto.jpg", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    skiff::TransferOptions opt = fastOptions();
    opt.stallTimeout = 100ms;
    const skiff::TransferEngine engine(opt);
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = engine.download("/home/luis/foto.jpg",
                                         (dir.path / "stall.jpg").string(), client,
                                         skiff::CancellationToken());
    const auto took = std::chrono::steady_clock::now() - started;

    t.check(outcome.kind == skiff::TransferOutcome::Kind::TimedOut,
            "a stream that stops delivering should time out");
    t.checkContains(outcome.detail, "no data received for 100 ms",
                    "stall detail should name the stall window");
    t.check(took >= 100ms, "stall should wait at least the stall window");
    t.check(took < 5s, "stall should not wait for the operation deadline");
}

void test_stall_before_first_byte(TestContext &t) {
    TempDir dir("stall0");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.stallAfter = 0;
    remote->setScript("/home/notes.md", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    skiff::TransferOptions opt = fastOptions();
    opt.stallTimeout = 100ms;
    const skiff::TransferEngine engine(opt);
    int samples = 0;
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = engine.download("/home/notes.md", (dir.path / "silent.md").string(),
                                         client, skiff::CancellationToken(),
                                         [&](const skiff::ProgressSample &) { ++samples; });
    const auto took = std::chrono::steady_clock::now() - started;

    t.check(outcome.kind == skiff::TransferOutcome::Kind::TimedOut,
            "a stream that never delivers should time out");
    t.checkContains(outcome.detail, "no data received for 100 ms",
                    "silent stream should report the stall window");
    t.check(samples == 0, "no progress should be reported without data");
    t.check(took >= 100ms && took < 5s, "stall window should start with the loop");
}

void test_operation_deadline(TestContext &t) {
    TempDir dir("deadline");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.maxReadSize = 100;
    script.readDelay = 50ms;
    remote->setScript("/home/luis/foto.jpg", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    skiff::TransferOptions opt = fastOptions();
    opt.operationTimeout = 300ms;
    const skiff::TransferEngine engine(opt);
    skiff::CancellationToken token;
    bool completed = false;
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = engine.download("/home/luis/foto.jpg",
                                         (dir.path / "slow.jpg").string(), client, token,
                                         {}, [&] { completed = true; });
    const auto took = std::chrono::steady_clock::now() - started;

    t.check(outcome.kind == skiff::TransferOutcome::Kind::TimedOut,
            "slow transfer should hit the operation deadline");
    t.checkContains(outcome.detail, "no data in 300 ms",
                    "deadline detail should name the operation timeout");
    t.check(took < 3s, "deadline should stop the worker promptly");
    t.check(token.isActive(), "deadline should not cancel the caller's token");
    t.check(!completed, "completion should not run on timeout");
}

void test_read_fault(TestContext &t) {
    TempDir dir("readfault");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.failReadAfter = 4096;
    remote->setScript("/home/luis/foto.jpg", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const skiff::TransferEngine engine(fastOptions());
    const auto local = dir.path / "broken.jpg";
    const auto outcome = engine.download("/home/luis/foto.jpg", local.string(), client,
                                         skiff::CancellationToken());
    t.check(outcome.kind == skiff::TransferOutcome::Kind::IoFailed,
            "a read fault should fail the download");
    t.checkContains(outcome.detail, "connection dropped during read",
                    "read fault should be reported as a dropped connection");
    t.checkContains(outcome.detail, "Connection reset by peer",
                    "read fault should keep the transport message");
    std::error_code ec;
    t.check(fs::file_size(local, ec) == 4096, "bytes before the fault should stay on disk");
}

void test_write_fault(TestContext &t) {
    TempDir dir("writefault");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.failWriteAfter = 1000;
    remote->setScript("/home/quota.bin", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const auto src = dir.path / "big.bin";
    writeFile(src, patternedPayload(8000));
    skiff::TransferOptions opt = fastOptions();
    opt.chunkSize = 512;
    const skiff::TransferEngine engine(opt);
    bool completed = false;
    const auto outcome = engine.upload(src.string(), "/home/quota.bin", client,
                                       skiff::CancellationToken(), {},
                                       [&] { completed = true; });
    t.check(outcome.kind == skiff::TransferOutcome::Kind::IoFailed,
            "a remote write fault should fail the upload");
    t.checkContains(outcome.detail, "disk quota exceeded",
                    "write fault should keep the server message");
    t.check(!completed, "completion should not run on failure");
}

void test_local_and_remote_open_failures(TestContext &t) {
    TempDir dir("open");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockFileScript script;
    script.failStat = true;
    remote->setScript("/readme.txt", script);
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");

    const skiff::TransferEngine engine(fastOptions());
    const auto missing = engine.upload((dir.path / "nope.bin").string(), "/home/nope.bin",
                                       client, skiff::CancellationToken());
    t.check(missing.kind == skiff::TransferOutcome::Kind::IoFailed,
            "missing local file should fail the upload");
    t.checkContains(missing.detail, "could not open local file for reading",
                    "missing local file should be named in the detail");

    const auto noStat = engine.download("/readme.txt", (dir.path / "r.txt").string(),
                                        client, skiff::CancellationToken());
    t.check(noStat.kind == skiff::TransferOutcome::Kind::IoFailed,
            "stat failure should fail the download");
    t.checkContains(noStat.detail, "could not read remote attributes",
                    "stat failure should be named in the detail");

    const auto badLocal = engine.download("/home/notes.md",
                                          (dir.path / "no-such-dir" / "n.md").string(),
                                          client, skiff::CancellationToken());
    t.check(badLocal.kind == skiff::TransferOutcome::Kind::IoFailed,
            "unwritable local path should fail the download");
    t.checkContains(badLocal.detail, "could not open local file for writing",
                    "unwritable local path should be named in the detail");
}

void test_not_connected(TestContext &t) {
    TempDir dir("offline");
    skiff::MockSftpClient client;
    const skiff::TransferEngine engine(fastOptions());
    const auto outcome = engine.download("/readme.txt", (dir.path / "r.txt").string(),
                                         client, skiff::CancellationToken());
    t.check(outcome.kind == skiff::TransferOutcome::Kind::ConnectionFailed,
            "disconnected client should give ConnectionFailed");
    t.checkContains(skiff::describeOutcome(outcome), "Connection failed:",
                    "ConnectionFailed should describe itself");
}

void test_callback_faults(TestContext &t) {
    TempDir dir("callbacks");
    auto remote = std::make_shared<skiff::MockRemote>();
    skiff::MockSftpClient client(remote);
    std::string err;
    t.check(client.connect(mockOptions(), err), "mock connect should succeed");
    const skiff::TransferEngine engine(fastOptions());

    const auto ok = engine.download("/home/notes.md", (dir.path / "a.md").string(), client,
                                    skiff::CancellationToken(), {},
                                    [] { throw std::runtime_error("observer broke"); });
    t.check(ok.ok(), "a throwing completion callback should not change the outcome");

    const auto broken = engine.download(
        "/home/notes.md", (dir.path / "b.md").string(), client, skiff::CancellationToken(),
        [](const skiff::ProgressSample &) { throw std::runtime_error("progress broke"); });
    t.check(broken.kind == skiff::TransferOutcome::Kind::Unhandled,
            "a throwing progress callback should end the transfer as Unhandled");
    t.checkContains(broken.detail, "progress broke", "Unhandled should keep the message");
}

void test_zero_chunk_falls_back(TestContext &t) {
    skiff::TransferOptions opt;
    opt.chunkSize = 0;
    const skiff::TransferEngine engine(opt);
    t.check(engine.options().chunkSize == 8192, "chunkSize 0 should use the default");
}

} // namespace

int main() {
    TestContext t;
    test_compute_progress(t);
    test_format_timeout(t);
    test_download_progress_accounting(t);
    test_short_reads_are_not_stalls(t);
    test_upload_download_round_trip(t);
    test_empty_file_round_trip(t);
    test_pre_cancelled_token(t);
    test_new_token_cancels_running_download(t);
    test_stall_times_out(t);
    test_stall_before_first_byte(t);
    test_operation_deadline(t);
    test_read_fault(t);
    test_write_fault(t);
    test_local_and_remote_open_failures(t);
    test_not_connected(t);
    test_callback_faults(t);
    test_zero_chunk_falls_back(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] skiff_transfer_tests\n";
    return EXIT_SUCCESS;
}
