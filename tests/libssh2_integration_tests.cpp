// Integration tests for the real Libssh2SftpClient against a test SFTP server.
// The test is skipped (exit code 77) unless the required SKIFF_IT_* env vars
// exist.
#include "skiff/DirectoryLister.hpp"
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/TransferEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

int main() {
    const auto host = envValue("SKIFF_IT_SFTP_HOST");
    const auto user = envValue("SKIFF_IT_SFTP_USER");
    const auto pass = envValue("SKIFF_IT_SFTP_PASS");
    const std::string remoteBase =
        envValue("SKIFF_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] skiff_sftp_integration_tests requires env vars: "
                  << "SKIFF_IT_SFTP_HOST, SKIFF_IT_SFTP_USER and "
                     "SKIFF_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SKIFF_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SKIFF_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    skiff::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    opt.password = *pass;
    opt.known_hosts_policy = skiff::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteFile =
        joinRemotePath(remoteBase, "skiff-it-" + token + ".txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("skiff-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    std::string payload = "skiff integration payload\n";
    for (int i = 0; i < 2000; ++i)
        payload += "line-" + std::to_string(i) + "\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    skiff::Libssh2SftpClient client;
    const skiff::TransferEngine engine;
    std::string err;

    const bool connected = client.connect(opt, err);
    t.check(connected, std::string("connect should succeed: ") + err);
    if (t.failures == 0) {
        std::uint64_t last = 0;
        const auto up = engine.upload(localSrc.string(), remoteFile, client,
                                      skiff::CancellationToken(),
                                      [&last](const skiff::ProgressSample &s) {
                                          last = s.bytesTransferred;
                                      });
        t.check(up.ok(), "upload should succeed: " + up.detail);
        t.check(last == payload.size(), "upload progress should reach the file size");
    }
    if (t.failures == 0) {
        skiff::FileInfo st{};
        err.clear();
        t.check(client.stat(remoteFile, st, err),
                std::string("stat(remoteFile) should succeed: ") + err);
        t.check(st.has_size && st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        const auto entries = skiff::DirectoryLister::list(client, remoteBase);
        const std::string name = "skiff-it-" + token + ".txt";
        t.check(std::any_of(entries.begin(), entries.end(),
                            [&name](const skiff::RemoteEntry &e) {
                                return e.name == name;
                            }),
                "listing should include the uploaded file");
    }
    if (t.failures == 0) {
        const auto down = engine.download(remoteFile, localDst.string(), client,
                                          skiff::CancellationToken());
        t.check(down.ok(), "download should succeed: " + down.detail);
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        skiff::CancellationToken cancelled;
        cancelled.cancel();
        const auto down = engine.download(remoteFile, localDst.string(), client,
                                          cancelled);
        t.check(down.kind == skiff::TransferOutcome::Kind::Cancelled,
                "cancelled token should stop the download");
    }

    client.disconnect();
    t.check(!client.isConnected(), "disconnect should close the session");
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] skiff_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
