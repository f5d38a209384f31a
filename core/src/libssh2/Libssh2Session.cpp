// libssh2 backend: TCP socket, SSH session and SFTP channel.
// Includes connect timeout, keepalive, host key pinning and loss detection.
#include "resftp/Libssh2Session.hpp"
#include "resftp/Config.hpp"
#include "resftp/HostKeyVerifier.hpp"
#include "resftp/Logging.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace resftp {

struct Libssh2Connection {
    mutable std::mutex mtx; // libssh2 is not thread-safe per session
    int sock = -1;
    LIBSSH2_SESSION *session = nullptr;
    LIBSSH2_SFTP *sftp = nullptr;
    bool open = false;

    ~Libssh2Connection() {
        std::lock_guard<std::mutex> lk(mtx);
        shutdownLocked();
    }

    void shutdownLocked() {
        open = false;
        if (sftp) {
            libssh2_sftp_shutdown(sftp);
            sftp = nullptr;
        }
        if (session) {
            libssh2_session_disconnect(session, "bye");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != -1) {
            ::close(sock);
            sock = -1;
        }
    }
};

namespace {

std::once_flag g_libssh2_once;

void ensureLibssh2Initialized() {
    std::call_once(g_libssh2_once, []() {
        if (libssh2_init(0) != 0)
            qCWarning(rsSession) << "libssh2_init failed";
    });
}

std::string lastSessionError(LIBSSH2_SESSION *session) {
    if (!session)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0)
        return {};
    return std::string(msg, static_cast<std::size_t>(len));
}

const char *sftpStatusText(unsigned long fx) {
    switch (fx) {
    case LIBSSH2_FX_EOF:
        return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE:
        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FAILURE:
        return "failure";
    case LIBSSH2_FX_BAD_MESSAGE:
        return "bad message";
    case LIBSSH2_FX_NO_CONNECTION:
        return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST:
        return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED:
        return "operation unsupported";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_WRITE_PROTECT:
        return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        return "no space on filesystem";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    default:
        return "sftp error";
    }
}

// Session-level errors after which the socket or the SSH layer is unusable.
bool isTransportLossCode(int rc) {
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
#ifdef LIBSSH2_ERROR_SOCKET_RECV
    case LIBSSH2_ERROR_SOCKET_RECV:
#endif
#ifdef LIBSSH2_ERROR_BAD_SOCKET
    case LIBSSH2_ERROR_BAD_SOCKET:
#endif
        return true;
    default:
        return false;
    }
}

// Classifies the last failure on conn. Must be called with conn.mtx held.
void fillError(Libssh2Connection &conn, const char *what,
               const std::string &path, Error &err) {
    const int rc = conn.session ? libssh2_session_last_errno(conn.session)
                                : LIBSSH2_ERROR_SOCKET_NONE;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && conn.sftp) {
        const unsigned long fx = libssh2_sftp_last_error(conn.sftp);
        if (fx == LIBSSH2_FX_CONNECTION_LOST ||
            fx == LIBSSH2_FX_NO_CONNECTION) {
            conn.open = false;
            err.set(ErrorKind::TransportLost,
                    std::string("connection lost: ") + what + " " + path);
            return;
        }
        err.set(ErrorKind::Transport, std::string(what) + " " + path + ": " +
                                          sftpStatusText(fx));
        return;
    }
    if (isTransportLossCode(rc)) {
        conn.open = false;
        std::string detail = lastSessionError(conn.session);
        err.set(ErrorKind::TransportLost,
                std::string("connection lost: ") + what + " " + path +
                    (detail.empty() ? std::string() : " (" + detail + ")"));
        return;
    }
    std::string detail = lastSessionError(conn.session);
    err.set(ErrorKind::Transport,
            std::string(what) + " " + path + " failed" +
                (detail.empty() ? std::string() : ": " + detail) +
                " [rc=" + std::to_string(rc) + "]");
}

bool requireOpen(const Libssh2Connection &conn, Error &err) {
    if (conn.open && conn.session && conn.sftp)
        return true;
    err.set(ErrorKind::TransportLost, "connection lost: session closed");
    return false;
}

FileInfo fileInfoFromAttrs(const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    FileInfo fi{};
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                       LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
        fi.mode = static_cast<std::uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    return fi;
}

const char *hostKeyTypeName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "ssh-rsa";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "ssh-dss";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ecdsa-sha2-nistp256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ecdsa-sha2-nistp384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ssh-ed25519";
#endif
    default:
        return "unknown";
    }
}

// Answers keyboard-interactive prompts: username for prompts that ask for a
// user/name, the password otherwise.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupResponse(const char *s, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

void kbintCallback(const char *name, int name_len, const char *instruction,
                   int instruction_len, int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                   void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text) {
            prompt.assign(reinterpret_cast<const char *>(prompts[i].text),
                          prompts[i].length);
        }
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<Libssh2Connection> conn,
                      LIBSSH2_SFTP_HANDLE *handle, std::string path)
        : conn_(std::move(conn)), handle_(handle), path_(std::move(path)) {}

    ~Libssh2RemoteFile() override {
        Error ignored;
        if (handle_ && !close(ignored))
            qCDebug(rsSession) << "close on destruction failed"
                               << qs(ignored.message);
    }

    const std::string &path() const override { return path_; }

    long long read(char *buf, std::size_t len, Error &err) override {
        std::lock_guard<std::mutex> lk(conn_->mtx);
        if (!handle_) {
            err.set(ErrorKind::InvalidArgument, "file already closed: " + path_);
            return -1;
        }
        if (!requireOpen(*conn_, err))
            return -1;
        const ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            fillError(*conn_, "read", path_, err);
            return -1;
        }
        return static_cast<long long>(n);
    }

    bool write(const char *data, std::size_t len, Error &err) override {
        std::lock_guard<std::mutex> lk(conn_->mtx);
        if (!handle_) {
            err.set(ErrorKind::InvalidArgument, "file already closed: " + path_);
            return false;
        }
        if (!requireOpen(*conn_, err))
            return false;
        while (len > 0) {
            const ssize_t w = libssh2_sftp_write(handle_, data, len);
            if (w < 0) {
                fillError(*conn_, "write", path_, err);
                return false;
            }
            data += w;
            len -= static_cast<std::size_t>(w);
        }
        return true;
    }

    bool close(Error &err) override {
        std::lock_guard<std::mutex> lk(conn_->mtx);
        if (!handle_)
            return true;
        LIBSSH2_SFTP_HANDLE *h = handle_;
        handle_ = nullptr;
        // Handles die with the SFTP channel; never touch one after shutdown.
        if (!conn_->sftp)
            return true;
        if (libssh2_sftp_close(h) != 0) {
            fillError(*conn_, "close", path_, err);
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<Libssh2Connection> conn_;
    LIBSSH2_SFTP_HANDLE *handle_ = nullptr;
    std::string path_;
};

} // namespace

// ---------------------------------------------------------------------------
// Libssh2Session

Libssh2Session::Libssh2Session(std::shared_ptr<Libssh2Connection> conn)
    : conn_(std::move(conn)) {}

// Open files keep the connection alive; it is torn down with the last one.
Libssh2Session::~Libssh2Session() = default;

bool Libssh2Session::isOpen() const {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    return conn_->open;
}

std::unique_ptr<RemoteFile> Libssh2Session::openHandle(const std::string &path,
                                                       unsigned long flags,
                                                       long mode,
                                                       const char *what,
                                                       Error &err) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return nullptr;
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        conn_->sftp, path.c_str(), static_cast<unsigned int>(path.size()),
        flags, mode, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fillError(*conn_, what, path, err);
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(conn_, h, path);
}

std::unique_ptr<RemoteFile> Libssh2Session::open(const std::string &path,
                                                 Error &err) {
    return openHandle(path, LIBSSH2_FXF_READ, 0, "open", err);
}

std::unique_ptr<RemoteFile> Libssh2Session::create(const std::string &path,
                                                   Error &err) {
    return openHandle(path,
                      LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                      0644, "create", err);
}

bool Libssh2Session::rename(const std::string &from, const std::string &to,
                            Error &err) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return false;
    const long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    const int rc = libssh2_sftp_rename_ex(
        conn_->sftp, from.c_str(), static_cast<unsigned int>(from.size()),
        to.c_str(), static_cast<unsigned int>(to.size()), flags);
    if (rc != 0) {
        fillError(*conn_, "rename", from, err);
        return false;
    }
    return true;
}

bool Libssh2Session::remove(const std::string &path, Error &err) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return false;
    if (libssh2_sftp_unlink(conn_->sftp, path.c_str()) != 0) {
        fillError(*conn_, "remove", path, err);
        return false;
    }
    return true;
}

bool Libssh2Session::mkdir(const std::string &path, Error &err,
                           unsigned int mode) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return false;
    if (libssh2_sftp_mkdir(conn_->sftp, path.c_str(), mode) != 0) {
        fillError(*conn_, "mkdir", path, err);
        return false;
    }
    return true;
}

bool Libssh2Session::readDir(const std::string &path,
                             std::vector<FileInfo> &out, Error &err) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return false;

    const std::string dirPath = path.empty() ? "." : path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(conn_->sftp, dirPath.c_str());
    if (!dir) {
        fillError(*conn_, "opendir", dirPath, err);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
        if (rc > 0) {
            FileInfo fi = fileInfoFromAttrs(attrs);
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            fillError(*conn_, "readdir", dirPath, err);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2Session::lstat(const std::string &path, FileInfo &info,
                           Error &err) {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    if (!requireOpen(*conn_, err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(conn_->sftp, path.c_str(),
                                        static_cast<unsigned int>(path.size()),
                                        LIBSSH2_SFTP_LSTAT, &st);
    if (rc != 0) {
        fillError(*conn_, "lstat", path, err);
        return false;
    }
    info = fileInfoFromAttrs(st);
    return true;
}

void Libssh2Session::close() {
    std::lock_guard<std::mutex> lk(conn_->mtx);
    conn_->shutdownLocked();
}

// ---------------------------------------------------------------------------
// Libssh2SessionFactory

Libssh2SessionFactory::Libssh2SessionFactory(Config cfg) : cfg_(std::move(cfg)) {
    ensureLibssh2Initialized();
}

bool Libssh2SessionFactory::tcpConnect(Libssh2Connection &conn,
                                       Error &err) const {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u",
                  static_cast<unsigned>(cfg_.port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(cfg_.host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connect,
                std::string("tcp connect: getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    const auto deadline =
        std::chrono::steady_clock::now() + cfg_.connect_timeout;
    std::string lastErr = "no usable address";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErr = std::strerror(errno);
            continue;
        }
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
        // Non-blocking connect so the dial honours connect_timeout.
        const int fl = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, fl | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            const int pr = left.count() > 0
                               ? ::poll(&pfd, 1, static_cast<int>(left.count()))
                               : 0;
            if (pr == 1) {
                int soErr = 0;
                socklen_t soLen = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &soLen);
                if (soErr == 0) {
                    rc = 0;
                } else {
                    lastErr = std::strerror(soErr);
                }
            } else if (pr == 0) {
                lastErr = "connection timed out";
            } else {
                lastErr = std::strerror(errno);
            }
        } else if (rc != 0) {
            lastErr = std::strerror(errno);
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, fl);
            conn.sock = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        if (std::chrono::steady_clock::now() >= deadline)
            break;
    }
    freeaddrinfo(res);
    err.set(ErrorKind::Connect, "tcp connect: " + cfg_.host + ":" +
                                    std::to_string(cfg_.port) + ": " + lastErr);
    return false;
}

bool Libssh2SessionFactory::sshHandshake(Libssh2Connection &conn,
                                         Error &err) const {
    conn.session = libssh2_session_init();
    if (!conn.session) {
        err.set(ErrorKind::Connect, "ssh handshake: libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(conn.session, 1);
    // The handshake is bounded by the connect timeout as well.
    libssh2_session_set_timeout(
        conn.session,
        static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                              cfg_.connect_timeout)
                              .count()));
    const int rc = libssh2_session_handshake(conn.session, conn.sock);
    if (rc != 0) {
        err.set(ErrorKind::Connect, "ssh handshake: " +
                                        lastSessionError(conn.session) +
                                        " [rc=" + std::to_string(rc) + "]");
        return false;
    }
    return true;
}

bool Libssh2SessionFactory::verifyServerKey(Libssh2Connection &conn,
                                            Error &err) const {
    std::size_t keylen = 0;
    int keytype = 0;
    const char *raw = libssh2_session_hostkey(conn.session, &keylen, &keytype);
    if (!raw || keylen == 0) {
        err.set(ErrorKind::Trust, "ssh handshake: could not read host key");
        return false;
    }
    HostKey key;
    key.blob.assign(raw, keylen);
    key.type = hostKeyTypeFromBlob(key.blob);
    if (key.type.empty())
        key.type = hostKeyTypeName(keytype);

    return acceptHostKey(cfg_.trusted_host_key, key, err);
}

bool Libssh2SessionFactory::authenticate(Libssh2Connection &conn,
                                         Error &err) const {
    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(conn.session, cfg_.username.c_str(),
                                          cfg_.password.c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc_pw == 0)
        return true;

    // The server closed after the password attempt; the rest would cascade.
    if (isTransportLossCode(rc_pw)) {
        err.set(ErrorKind::Connect,
                "auth: server closed the connection after password attempt");
        return false;
    }
    const std::string pwErr = lastSessionError(conn.session);

    char *methods = libssh2_userauth_list(
        conn.session, cfg_.username.c_str(),
        static_cast<unsigned int>(cfg_.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{cfg_.username.c_str(), cfg_.password.c_str()};
        void **abs = libssh2_session_abstract(conn.session);
        if (abs)
            *abs = &ctx;
        int rc_kbd = -1;
        for (;;) {
            rc_kbd = libssh2_userauth_keyboard_interactive(
                conn.session, cfg_.username.c_str(), kbintCallback);
            if (rc_kbd != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs)
            *abs = nullptr;
        if (rc_kbd == 0)
            return true;
    }

    err.set(ErrorKind::Connect,
            "auth: password authentication failed" +
                (authlist.empty() ? std::string()
                                  : " (methods: " + authlist + ")") +
                (pwErr.empty() ? std::string() : ": " + pwErr) +
                " [rc_pw=" + std::to_string(rc_pw) + "]");
    return false;
}

std::unique_ptr<RemoteSession> Libssh2SessionFactory::connect(Error &err) {
    std::string invalid;
    if (!validateConfig(cfg_, invalid)) {
        err.set(ErrorKind::InvalidArgument, invalid);
        return nullptr;
    }

    auto conn = std::make_shared<Libssh2Connection>();
    std::lock_guard<std::mutex> lk(conn->mtx);
    if (!tcpConnect(*conn, err) || !sshHandshake(*conn, err) ||
        !verifyServerKey(*conn, err) || !authenticate(*conn, err)) {
        qCWarning(rsSession) << "connect to" << qs(cfg_.host) << cfg_.port
                             << "failed:" << qs(err.message);
        conn->shutdownLocked();
        return nullptr;
    }

    const long timeoutMs = static_cast<long>(cfg_.session_timeout.count());
    libssh2_session_set_timeout(conn->session, timeoutMs);
    // SSH keepalive every 30s if the peer allows it.
    libssh2_keepalive_config(conn->session, 1, 30);

    conn->sftp = libssh2_sftp_init(conn->session);
    if (!conn->sftp) {
        err.set(ErrorKind::Connect,
                "sftp init: " + lastSessionError(conn->session));
        qCWarning(rsSession) << "connect to" << qs(cfg_.host) << cfg_.port
                             << "failed:" << qs(err.message);
        conn->shutdownLocked();
        return nullptr;
    }
    conn->open = true;
    qCInfo(rsSession) << "connected to" << qs(cfg_.host) << cfg_.port << "as"
                      << qs(cfg_.username);
    return std::make_unique<Libssh2Session>(conn);
}

} // namespace resftp
