// Persistent configuration read through QSettings.
#pragma once
#include "SftpTypes.hpp"
#include "TransferTypes.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

class QSettings;

namespace skiff {

struct FacadeSettings {
    TransferOptions transfer;

    std::chrono::milliseconds probeTimeout{1500};
    std::vector<std::string> probeHosts;
    std::uint16_t probePort = 80;

    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::AcceptNew;
    std::optional<std::string> knownHostsPath;
    int connectTimeoutMs = 20000;
};

// Keys (defaults in FacadeSettings):
//   Transfer/chunkSize, Transfer/stallTimeoutMs, Transfer/stallBackoffMs,
//   Transfer/operationTimeoutMs, Network/probeTimeoutMs, Network/probeHosts,
//   Network/probePort, Security/knownHostsPolicy (strict|accept-new|off),
//   Security/knownHostsPath, Connection/timeoutMs
// Missing, non-positive or unparsable values keep the default.
FacadeSettings loadSettings(const QSettings& s);

// QSettings("skiff", "skiff")
FacadeSettings loadSettings();

std::optional<KnownHostsPolicy> parseKnownHostsPolicy(const std::string& text);

} // namespace skiff
