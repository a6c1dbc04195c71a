// Basic types shared between the façade, the engine and the SFTP backends.
// Keep these structures plain so they can be copied across threads freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skiff {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and save new hosts; reject key changes.
    Off        // No verification (not recommended).
};

// Type of a remote node as reported by the server attributes.
enum class FileKind { Regular, Directory, Other };

struct FileInfo {
    std::string   name;            // base name
    FileKind      kind = FileKind::Regular;
    bool          has_size = false;
    std::uint64_t size  = 0;       // bytes (if has_size)
    std::uint64_t mtime = 0;       // epoch (seconds)
    std::uint32_t mode  = 0;       // POSIX bits (permissions/type)

    bool isDir() const { return kind == FileKind::Directory; }
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Blocking timeout for the handshake and authentication (ms).
    int connect_timeout_ms = 20000;
    // Blocking timeout for each SFTP read/write once connected (ms). A read
    // that hits it is reported as "no data yet" so the engine can decide.
    int io_timeout_ms = 5000;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

} // namespace skiff
