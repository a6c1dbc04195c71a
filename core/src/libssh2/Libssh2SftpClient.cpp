// libssh2 backend: manages the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and blocking streams with an I/O
// timeout so stalls surface as "no data" instead of hanging forever.
#include "skiff/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace skiff {

namespace {

std::once_flag g_libssh2_init;

// Context for keyboard-interactive: answer every prompt with the password.
struct KbdIntCtx {
    const char* pass;
};

void kbint_password_callback(const char* /*name*/, int /*name_len*/,
                             const char* /*instruction*/, int /*instruction_len*/,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    const std::size_t plen = ctx->pass ? std::strlen(ctx->pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0) continue;
        // libssh2 frees each response with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(plen + 1));
        if (!buf) continue;
        std::memcpy(buf, ctx->pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(plen);
    }
}

FileKind kindFromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return FileKind::Other;
    switch (attrs.permissions & LIBSSH2_SFTP_S_IFMT) {
        case LIBSSH2_SFTP_S_IFREG: return FileKind::Regular;
        case LIBSSH2_SFTP_S_IFDIR: return FileKind::Directory;
        default: return FileKind::Other;
    }
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES& attrs, FileInfo& fi) {
    fi.kind = kindFromAttrs(attrs);
    fi.has_size = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) != 0;
    fi.size = fi.has_size ? static_cast<std::uint64_t>(attrs.filesize) : 0;
    fi.mtime = (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? static_cast<std::uint64_t>(attrs.mtime) : 0;
    fi.mode = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? static_cast<std::uint32_t>(attrs.permissions) : 0;
}

std::string sessionError(LIBSSH2_SESSION* session, const char* fallback) {
    if (!session) return fallback;
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return fallback;
    return std::string(msg, static_cast<std::size_t>(len));
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(LIBSSH2_SESSION* session, LIBSSH2_SFTP_HANDLE* handle)
        : session_(session), handle_(handle) {}
    ~Libssh2RemoteFile() override { close(); }

    long long read(char* buf, std::size_t len, std::string& err) override {
        if (!handle_) {
            err = "remote file is closed";
            return -1;
        }
        ssize_t rc = libssh2_sftp_read(handle_, buf, len);
        if (rc > 0) return rc;
        if (rc == 0) {
            eof_ = true;
            return 0;
        }
        // Blocking call gave up without data: not an error, the caller decides.
        if (rc == LIBSSH2_ERROR_EAGAIN || rc == LIBSSH2_ERROR_TIMEOUT) return 0;
        err = sessionError(session_, "sftp read failed");
        return -1;
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        if (!handle_) {
            err = "remote file is closed";
            return -1;
        }
        for (;;) {
            ssize_t rc = libssh2_sftp_write(handle_, buf, len);
            if (rc >= 0) return rc;
            if (rc == LIBSSH2_ERROR_EAGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            err = sessionError(session_, "sftp write failed");
            return -1;
        }
    }

    bool atEof() const override { return eof_; }

    void close() override {
        if (handle_) {
            libssh2_sftp_close(handle_);
            handle_ = nullptr;
        }
    }

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP_HANDLE* handle_;
    bool eof_ = false;
};

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, [] { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

std::string Libssh2SftpClient::lastError() const {
    return sessionError(session_, "unknown libssh2 error");
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        // TCP keepalive so half-open connections eventually error out
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
    }
    freeaddrinfo(res);
    err = "connect to " + host + ":" + portStr + " failed";
    if (lastErrno != 0) err += std::string(": ") + std::strerror(lastErrno);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value() && !opt.known_hosts_path->empty()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "could not obtain the server host key";
        return false;
    }

    int alg = 0;
    std::string algName = "UNKNOWN";
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; algName = "RSA"; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS: alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; algName = "DSA"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; algName = "ECDSA-256"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; algName = "ECDSA-384"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; algName = "ECDSA-521"; break;
        case LIBSSH2_HOSTKEY_TYPE_ED25519: alg = LIBSSH2_KNOWNHOST_KEY_ED25519; algName = "ED25519"; break;
        default: break;
    }

    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &found);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH ||
        opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                  ? "host key does not match known_hosts"
                  : "host not present in known_hosts";
        return false;
    }

    // AcceptNew + NOTFOUND: ask for confirmation, then persist.
    std::string fpStr;
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (h) {
        std::ostringstream oss;
        oss << "SHA256:";
        for (int i = 0; i < 32; ++i) {
            char b[4];
            std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
            if (i) oss << ':';
            oss << b;
        }
        fpStr = oss.str();
    }
    const bool confirmed = opt.hostkey_confirm_cb &&
                           opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr);
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        err = "unknown host: fingerprint not confirmed";
        return false;
    }
    if (!khPath.empty()) {
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                           nullptr, 0,
                                           LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                           nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "could not write host to known_hosts";
            return false;
        }
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    if (!opt.password.has_value()) {
        err = "Authentication failed: no password provided";
        return false;
    }

    // Try password first; some servers only offer keyboard-interactive.
    int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
    if (rc_pw == 0) return true;
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "server closed the connection after the password attempt";
        return false;
    }

    const char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                                static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        int rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(),
                                                           kbint_password_callback);
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
    }

    err = "Authentication failed: password rejected by server";
    if (!authlist.empty()) err += " (methods: " + authlist + ")";
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.connect_timeout_ms > 0 ? opt.connect_timeout_ms : 0);

    if (libssh2_session_handshake(session_, sock_.load()) != 0) {
        err = "SSH handshake failed: " + lastError();
        disconnect();
        return false;
    }
    // Ask the server for keepalive replies every 30s
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "could not initialise SFTP subsystem: " + lastError();
        disconnect();
        return false;
    }

    libssh2_session_set_timeout(session_, opt.io_timeout_ms > 0 ? opt.io_timeout_ms : 0);
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int s = sock_.exchange(-1);
    if (s != -1) ::close(s);
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    // Only shut the socket down: blocked libssh2 calls return with an error and
    // the descriptor itself is released by disconnect().
    const int s = sock_.load();
    if (s != -1) ::shutdown(s, SHUT_RDWR);
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for " + path + ": " + lastError();
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            fillInfo(attrs, fi);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = "sftp_readdir_ex failed: " + lastError();
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
        err = (sftpErr == LIBSSH2_FX_NO_SUCH_FILE)
                  ? "no such file: " + remote_path
                  : "remote stat failed: " + lastError();
        return false;
    }
    const std::size_t slash = remote_path.find_last_of('/');
    info.name = (slash == std::string::npos) ? remote_path : remote_path.substr(slash + 1);
    fillInfo(st, info);
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::openRead(const std::string& remote_path,
                                                        std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  static_cast<unsigned>(remote_path.size()),
                                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = "could not open remote file for reading: " + lastError();
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(session_, h);
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::openWrite(const std::string& remote_path,
                                                         std::string& err,
                                                         unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  static_cast<unsigned>(remote_path.size()),
                                                  LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                  static_cast<long>(mode), LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = "could not open remote file for writing: " + lastError();
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(session_, h);
}

} // namespace skiff
