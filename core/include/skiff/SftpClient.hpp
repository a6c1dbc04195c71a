// Abstract interface for the SFTP capability consumed by the transfer engine.
// Concrete implementations (libssh2, mock) must follow this API so the engine
// and the façade stay decoupled from the backend.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <memory>

namespace skiff {

// Open remote file. Owned by whoever opened it; closes on destruction.
//
// read() returns the number of bytes copied into buf. A return of 0 means
// "nothing available": check atEof() to tell end of file from a stall.
// A negative return is a fault and err is filled.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    virtual long long read(char* buf, std::size_t len, std::string& err) = 0;
    virtual long long write(const char* buf, std::size_t len, std::string& err) = 0;
    virtual bool atEof() const = 0;
    virtual void close() = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Wake up any blocked I/O on this connection. The session is unusable
    // afterwards; only disconnect() is expected to follow.
    virtual void interrupt() = 0;

    // Remote directory listing (raw: may include "." and "..")
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Detailed metadata (stat). Returns false if it fails or does not exist.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Open a remote file for sequential reading.
    virtual std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                                 std::string& err) = 0;

    // Create/truncate a remote file for sequential writing.
    virtual std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                                  std::string& err,
                                                  unsigned int mode = 0644) = 0;
};

} // namespace skiff
