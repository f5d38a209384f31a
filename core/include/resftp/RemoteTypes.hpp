// Basic types shared by the session backends, the reconnect supervisor and
// the client facade. Kept as plain structs so callers can copy them freely.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace resftp {

// Error classes reported by sessions, factories and the client.
enum class ErrorKind {
    None,
    Connect,         // dial, handshake, auth or SFTP init failed
    Trust,           // host key does not match the pinned key
    Transport,       // remote operation failed (no such file, denied, ...)
    TransportLost,   // session unusable; a fresh session is required
    LocalIO,         // local file could not be opened/read/written
    Canceled,        // CancelCheck asked to stop
    InvalidArgument
};

const char *errorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
};

// Connection parameters. Immutable once handed to a factory.
struct Config {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    // "<key-type> <base64>" of the server key. Empty disables verification
    // (insecure; the observed key is logged so it can be pinned).
    std::string trusted_host_key;

    std::chrono::seconds connect_timeout{30};
    // Applied to every blocking libssh2 call. 0 = no timeout.
    std::chrono::milliseconds session_timeout{0};
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX type/permission bits
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// Rows of fields produced by a RecordParser.
using Records = std::vector<std::vector<std::string>>;

// Cooperative cancellation; return true to abort the running operation.
using CancelCheck = std::function<bool()>;

// done/total bytes; total is 0 when unknown.
using ProgressCB = std::function<void(std::size_t, std::size_t)>;

// Builds a CancelCheck that fires once the given duration has elapsed.
CancelCheck cancelAfter(std::chrono::steady_clock::duration timeout);

// Joins a directory and a name with exactly one '/'.
std::string joinRemotePath(const std::string &base, const std::string &name);

// Ancestor directories of a remote file path, root-to-leaf, excluding "/" and
// the file itself. "/a/b/c.txt" -> {"/a", "/a/b"}; "a/b.txt" -> {"a"}.
std::vector<std::string> remoteAncestors(const std::string &remote_path);

} // namespace resftp
