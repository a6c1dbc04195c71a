#include "skiff/Reachability.hpp"
#include "skiff/Logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace skiff {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Closes the descriptor on every exit path.
struct SocketGuard {
    int fd = -1;
    ~SocketGuard() {
        if (fd != -1) ::close(fd);
    }
};

} // namespace

std::vector<std::string> ReachabilityProbe::defaultHosts() {
    return {"1.1.1.1", "8.8.8.8", "9.9.9.9", "www.google.com", "www.cloudflare.com"};
}

ReachabilityProbe::ReachabilityProbe(std::vector<std::string> hosts, std::uint16_t port)
    : hosts_(std::move(hosts)), port_(port) {}

bool ReachabilityProbe::isVirtualInterfaceName(const std::string& name) {
    static const char* const prefixes[] = {"lo", "docker", "veth", "virbr", "br-",
                                           "vmnet", "vboxnet", "tun", "tap", "zt"};
    for (const char* p : prefixes) {
        if (startsWith(name, p)) return true;
    }
    return false;
}

std::vector<NetInterface> ReachabilityProbe::localInterfaces() {
    std::vector<NetInterface> out;
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        qCDebug(skNet) << "getifaddrs failed" << std::strerror(errno);
        return out;
    }
    for (struct ifaddrs* a = addrs; a != nullptr; a = a->ifa_next) {
        NetInterface iface;
        iface.name = a->ifa_name ? a->ifa_name : "";
        iface.flags = a->ifa_flags;
        if (a->ifa_addr && a->ifa_addr->sa_family == AF_INET) {
            const auto* sin = reinterpret_cast<const struct sockaddr_in*>(a->ifa_addr);
            iface.ipv4 = true;
            iface.address = ntohl(sin->sin_addr.s_addr);
        }
        out.push_back(std::move(iface));
    }
    freeifaddrs(addrs);
    return out;
}

bool ReachabilityProbe::isUsable(const NetInterface& iface) {
    if (!iface.ipv4) return false;
    if (!(iface.flags & IFF_UP) || (iface.flags & IFF_LOOPBACK)) return false;
    if (isVirtualInterfaceName(iface.name)) return false;
    // 169.254.0.0/16 link-local
    return (iface.address & 0xFFFF0000u) != 0xA9FE0000u;
}

bool ReachabilityProbe::hasUsableInterface(const std::vector<NetInterface>& interfaces) {
    for (const auto& iface : interfaces) {
        if (isUsable(iface)) return true;
    }
    return false;
}

bool ReachabilityProbe::hasUsableInterface() {
    return hasUsableInterface(localInterfaces());
}

bool ReachabilityProbe::tryConnect(const std::string& host, std::uint16_t port,
                                   std::chrono::milliseconds timeout) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        qCDebug(skNet) << "resolve failed" << host.c_str() << gai_strerror(gai);
        return false;
    }

    bool reached = false;
    for (auto rp = res; rp != nullptr && !reached; rp = rp->ai_next) {
        SocketGuard sock;
        sock.fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (sock.fd == -1) continue;
        const int flags = ::fcntl(sock.fd, F_GETFL, 0);
        if (flags == -1 || ::fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) != 0) continue;

        if (::connect(sock.fd, rp->ai_addr, rp->ai_addrlen) == 0) {
            reached = true;
            break;
        }
        if (errno != EINPROGRESS) {
            qCDebug(skNet) << "connect failed" << host.c_str() << std::strerror(errno);
            continue;
        }

        struct pollfd pfd{};
        pfd.fd = sock.fd;
        pfd.events = POLLOUT;
        const int rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rv <= 0) {
            qCDebug(skNet) << "connect timed out" << host.c_str();
            continue;
        }
        int soErr = 0;
        socklen_t len = sizeof(soErr);
        if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 && soErr == 0) {
            reached = true;
        } else {
            qCDebug(skNet) << "connect failed" << host.c_str() << std::strerror(soErr);
        }
    }
    freeaddrinfo(res);
    return reached;
}

bool ReachabilityProbe::hasInternet(std::chrono::milliseconds timeout) const {
    return hasInternet(timeout, localInterfaces());
}

bool ReachabilityProbe::hasInternet(std::chrono::milliseconds timeout,
                                    const std::vector<NetInterface>& interfaces) const {
    if (!hasUsableInterface(interfaces)) {
        qCInfo(skNet) << "no usable network interface";
        return false;
    }
    for (const auto& host : hosts_) {
        if (tryConnect(host, port_, timeout)) {
            qCDebug(skNet) << "reachable via" << host.c_str();
            return true;
        }
    }
    qCInfo(skNet) << "no probe host reachable";
    return false;
}

} // namespace skiff
