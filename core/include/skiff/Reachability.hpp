// Best-effort internet reachability check. Advisory only: nothing in the
// transfer path depends on its answer.
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace skiff {

// One address of one local interface, as reported by getifaddrs.
struct NetInterface {
    std::string name;
    unsigned int flags = 0;    // IFF_* bits
    bool ipv4 = false;
    std::uint32_t address = 0; // IPv4, host byte order
};

class ReachabilityProbe {
public:
    static std::vector<std::string> defaultHosts();

    explicit ReachabilityProbe(std::vector<std::string> hosts = defaultHosts(),
                               std::uint16_t port = 80);

    // false when no usable interface is up; otherwise true on the first host
    // (in list order) that accepts a TCP connection within timeout.
    bool hasInternet(std::chrono::milliseconds timeout) const;

    // Same decision over an explicit interface snapshot. No host is contacted
    // unless one of the interfaces is usable.
    bool hasInternet(std::chrono::milliseconds timeout,
                     const std::vector<NetInterface>& interfaces) const;

    // Current interface addresses (empty if getifaddrs fails).
    static std::vector<NetInterface> localInterfaces();

    // Up, IPv4, not loopback, not link-local, not a virtual bridge/tunnel.
    static bool isUsable(const NetInterface& iface);
    static bool hasUsableInterface(const std::vector<NetInterface>& interfaces);
    static bool hasUsableInterface();

    // Non-blocking connect raced against timeout. Never throws.
    static bool tryConnect(const std::string& host, std::uint16_t port,
                           std::chrono::milliseconds timeout);

    // Interface names that never count as a real uplink.
    static bool isVirtualInterfaceName(const std::string& name);

private:
    std::vector<std::string> hosts_;
    std::uint16_t port_;
};

} // namespace skiff
