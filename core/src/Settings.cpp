#include "skiff/Settings.hpp"
#include "skiff/Logging.hpp"
#include "skiff/Reachability.hpp"
#include "skiff/RuntimeLogging.hpp"

#include <QSettings>
#include <QStringList>

namespace skiff {

namespace {

// Positive integer value for key, or fallback.
qlonglong positiveValue(const QSettings& s, const char* key, qlonglong fallback) {
    if (!s.contains(key)) return fallback;
    bool ok = false;
    const qlonglong v = s.value(key).toLongLong(&ok);
    if (!ok || v <= 0) {
        qCWarning(skXfer) << "ignoring invalid setting" << key << s.value(key).toString();
        return fallback;
    }
    return v;
}

} // namespace

std::optional<KnownHostsPolicy> parseKnownHostsPolicy(const std::string& text) {
    const std::string v = lowered(trimmed(text));
    if (v == "strict") return KnownHostsPolicy::Strict;
    if (v == "accept-new" || v == "acceptnew" || v == "tofu") return KnownHostsPolicy::AcceptNew;
    if (v == "off" || v == "none") return KnownHostsPolicy::Off;
    return std::nullopt;
}

FacadeSettings loadSettings(const QSettings& s) {
    FacadeSettings out;
    out.probeHosts = ReachabilityProbe::defaultHosts();

    TransferOptions& t = out.transfer;
    t.chunkSize = static_cast<std::size_t>(
        positiveValue(s, "Transfer/chunkSize", static_cast<qlonglong>(t.chunkSize)));
    t.stallTimeout = std::chrono::milliseconds(
        positiveValue(s, "Transfer/stallTimeoutMs", t.stallTimeout.count()));
    t.stallBackoff = std::chrono::milliseconds(
        positiveValue(s, "Transfer/stallBackoffMs", t.stallBackoff.count()));
    t.operationTimeout = std::chrono::milliseconds(
        positiveValue(s, "Transfer/operationTimeoutMs", t.operationTimeout.count()));

    out.probeTimeout = std::chrono::milliseconds(
        positiveValue(s, "Network/probeTimeoutMs", out.probeTimeout.count()));
    const qlonglong port = positiveValue(s, "Network/probePort", out.probePort);
    if (port <= 65535) out.probePort = static_cast<std::uint16_t>(port);
    if (s.contains("Network/probeHosts")) {
        std::vector<std::string> hosts;
        for (const QString& h : s.value("Network/probeHosts").toStringList()) {
            const QString clean = h.trimmed();
            if (!clean.isEmpty()) hosts.push_back(clean.toStdString());
        }
        if (!hosts.empty()) out.probeHosts = std::move(hosts);
    }

    if (s.contains("Security/knownHostsPolicy")) {
        const std::string raw = s.value("Security/knownHostsPolicy").toString().toStdString();
        if (auto policy = parseKnownHostsPolicy(raw))
            out.knownHostsPolicy = *policy;
        else
            qCWarning(skConn) << "unknown knownHostsPolicy" << raw.c_str();
    }
    const QString khPath = s.value("Security/knownHostsPath").toString().trimmed();
    if (!khPath.isEmpty()) out.knownHostsPath = khPath.toStdString();
    out.connectTimeoutMs = static_cast<int>(
        positiveValue(s, "Connection/timeoutMs", out.connectTimeoutMs));
    return out;
}

FacadeSettings loadSettings() {
    QSettings s("skiff", "skiff");
    return loadSettings(s);
}

} // namespace skiff
