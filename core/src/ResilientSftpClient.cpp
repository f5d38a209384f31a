#include "resftp/ResilientSftpClient.hpp"
#include "resftp/Logging.hpp"
#include "resftp/RemoteWalker.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace resftp {

namespace {

constexpr std::size_t kChunk = 64 * 1024;

Error localError(const std::string &what, const std::string &path) {
    Error e;
    e.set(ErrorKind::LocalIO, what + " " + path + ": " + std::strerror(errno));
    return e;
}

struct FileCloser {
    void operator()(std::FILE *f) const {
        if (f)
            std::fclose(f);
    }
};
using LocalFile = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

bool isConnectionLost(const Error &err) {
    return err.kind == ErrorKind::TransportLost ||
           err.message.find("connection lost") != std::string::npos;
}

ResilientSftpClient::ResilientSftpClient(std::shared_ptr<SessionFactory> factory,
                                         ClientOptions options)
    : options_(std::move(options)), supervisor_(std::move(factory)) {
    supervisor_.start();
}

ResilientSftpClient::~ResilientSftpClient() { close(); }

bool ResilientSftpClient::connect(Error &err) {
    if (!supervisor_.connectNow(err)) {
        qCWarning(rsClient) << "initial connect failed:" << qs(err.message);
        return false;
    }
    return true;
}

bool ResilientSftpClient::isConnected() const {
    auto s = supervisor_.currentSession();
    return s && s->isOpen();
}

bool ResilientSftpClient::waitForReconnect(std::chrono::milliseconds timeout) const {
    return supervisor_.waitIdle(timeout);
}

void ResilientSftpClient::connectionLostHandler(const Error &err) {
    if (err.ok())
        return;
    if (!options_.is_transport_lost || !options_.is_transport_lost(err))
        return;
    qCInfo(rsClient) << "connection lost, requesting reconnect";
    supervisor_.requestReconnect();
}

void ResilientSftpClient::report(const Error &err) {
    if (err.kind == ErrorKind::LocalIO && !options_.policy.route_local_errors)
        return;
    if (err.kind == ErrorKind::Canceled)
        return;
    connectionLostHandler(err);
}

std::shared_ptr<RemoteSession> ResilientSftpClient::session(Error &err) {
    auto s = supervisor_.currentSession();
    if (!s)
        err.set(ErrorKind::TransportLost, "connection lost: no active session");
    return s;
}

std::unique_ptr<RemoteFile>
ResilientSftpClient::openFile(const std::string &remote_file, Error &err) {
    auto s = session(err);
    std::unique_ptr<RemoteFile> file = s ? s->open(remote_file, err) : nullptr;
    if (!file) {
        qCWarning(rsClient) << "error opening file" << logPath(remote_file)
                            << qs(err.message);
        report(err);
    }
    return file;
}

bool ResilientSftpClient::getRecords(const std::string &remote_file,
                                     const RecordParser &parser, Records &out,
                                     Error &err) {
    out.clear();
    if (!parser) {
        err.set(ErrorKind::InvalidArgument, "getRecords: no parser given");
        return false;
    }
    auto file = openFile(remote_file, err);
    if (!file)
        return false;

    const bool parsed = parser(*file, out, err);
    Error closeErr;
    if (!file->close(closeErr))
        qCDebug(rsClient) << "close after read failed" << qs(closeErr.message);
    if (!parsed) {
        qCWarning(rsClient) << "error reading file" << logPath(remote_file)
                            << qs(err.message);
        out.clear();
        report(err);
        return false;
    }
    return true;
}

std::vector<FileInfo> ResilientSftpClient::files(const std::string &remote_dir,
                                                 Error *err) {
    if (err)
        err->clear();
    Error e;
    std::vector<FileInfo> entries;
    auto s = session(e);
    if (s && s->readDir(remote_dir, entries, e))
        return entries;

    qCWarning(rsClient) << "failed to read directory" << logPath(remote_dir)
                        << qs(e.message);
    report(e);
    if (err && !options_.policy.swallow_list_errors)
        *err = e;
    return {};
}

bool ResilientSftpClient::walkFiles(const std::string &remote_dir,
                                    std::vector<std::string> &out, Error &err,
                                    const CancelCheck &shouldCancel) {
    out.clear();
    auto s = session(err);
    if (!s) {
        report(err);
        return false;
    }
    RemoteWalker walker(*s, remote_dir);
    while (walker.step()) {
        if (!walker.error().ok()) {
            err = walker.error();
            qCWarning(rsClient) << "walk of" << logPath(remote_dir)
                                << "stopped after" << out.size() << "files:"
                                << qs(err.message);
            report(err);
            return false;
        }
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Canceled, "walk canceled: " + remote_dir);
            return false;
        }
        if (!walker.info().is_dir)
            out.push_back(walker.path());
    }
    return true;
}

bool ResilientSftpClient::moveFile(const std::string &source,
                                   const std::string &dest, Error &err) {
    auto s = session(err);
    if (s && s->rename(source, dest, err))
        return true;
    qCWarning(rsClient) << "move failed" << logPath(source) << qs(err.message);
    report(err);
    return false;
}

bool ResilientSftpClient::removeFile(const std::string &remote_path,
                                     Error &err) {
    auto s = session(err);
    if (s && s->remove(remote_path, err))
        return true;
    qCWarning(rsClient) << "remove failed" << logPath(remote_path)
                        << qs(err.message);
    report(err);
    return false;
}

void ResilientSftpClient::makeParentDirs(RemoteSession &session,
                                         const std::string &remote_file) {
    // Existing directories make mkdir fail; the create that follows is the
    // real check.
    for (const auto &dir : remoteAncestors(remote_file)) {
        Error ignored;
        if (!session.mkdir(dir, ignored))
            qCDebug(rsClient) << "mkdir" << logPath(dir) << qs(ignored.message);
    }
}

bool ResilientSftpClient::upload(RemoteSession &session,
                                 const std::string &remote_file,
                                 const ChunkSource &source, std::size_t total,
                                 bool &created, Error &err,
                                 const ProgressCB &progress,
                                 const CancelCheck &shouldCancel) {
    created = false;
    auto dst = session.create(remote_file, err);
    if (!dst) {
        qCWarning(rsClient) << "create remote file failed"
                            << logPath(remote_file) << qs(err.message);
        report(err);
        return false;
    }
    created = true;

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Canceled, "upload canceled: " + remote_file);
            Error closeErr;
            if (!dst->close(closeErr))
                qCDebug(rsClient) << "close after cancel" << qs(closeErr.message);
            return false;
        }
        const long long n = source(buf.data(), buf.size(), err);
        if (n < 0 || (n > 0 && !dst->write(buf.data(), static_cast<std::size_t>(n), err))) {
            Error closeErr;
            if (!dst->close(closeErr))
                qCDebug(rsClient) << "close after failed upload"
                                  << qs(closeErr.message);
            report(err);
            return false;
        }
        if (n == 0)
            break;
        done += static_cast<std::size_t>(n);
        if (progress)
            progress(done, total);
    }
    if (!dst->close(err)) {
        report(err);
        return false;
    }
    return true;
}

bool ResilientSftpClient::putFile(const std::string &local_file,
                                  const std::string &remote_file, Error &err,
                                  const ProgressCB &progress,
                                  const CancelCheck &shouldCancel) {
    LocalFile src(std::fopen(local_file.c_str(), "rb"));
    if (!src) {
        err = localError("open", local_file);
        qCWarning(rsClient) << "open local file failed" << qs(err.message);
        report(err);
        return false;
    }
    std::size_t total = 0;
    if (std::fseek(src.get(), 0, SEEK_END) == 0) {
        const long sz = std::ftell(src.get());
        total = sz > 0 ? static_cast<std::size_t>(sz) : 0;
    }
    std::rewind(src.get());

    auto s = session(err);
    if (!s) {
        report(err);
        return false;
    }
    makeParentDirs(*s, remote_file);

    std::FILE *f = src.get();
    ChunkSource source = [f, &local_file](char *buf, std::size_t len,
                                          Error &e) -> long long {
        const std::size_t n = std::fread(buf, 1, len, f);
        if (n == 0 && std::ferror(f)) {
            e = localError("read", local_file);
            return -1;
        }
        return static_cast<long long>(n);
    };
    bool created = false;
    return upload(*s, remote_file, source, total, created, err, progress,
                  shouldCancel);
}

bool ResilientSftpClient::putString(const std::string &text,
                                    const std::string &remote_file, Error &err,
                                    const CancelCheck &shouldCancel) {
    auto s = session(err);
    if (!s) {
        report(err);
        return false;
    }
    makeParentDirs(*s, remote_file);

    std::size_t offset = 0;
    ChunkSource source = [&text, &offset](char *buf, std::size_t len,
                                          Error &) -> long long {
        const std::size_t n = std::min(len, text.size() - offset);
        std::memcpy(buf, text.data() + offset, n);
        offset += n;
        return static_cast<long long>(n);
    };
    bool created = false;
    if (upload(*s, remote_file, source, text.size(), created, err, {},
               shouldCancel))
        return true;
    if (created && err.kind != ErrorKind::Canceled &&
        options_.policy.swallow_put_string_errors) {
        qCWarning(rsClient) << "copy text to remote failed"
                            << logPath(remote_file) << qs(err.message);
        err.clear();
        return true;
    }
    return false;
}

bool ResilientSftpClient::getFile(const std::string &remote_file,
                                  const std::string &local_file, Error &err,
                                  const ProgressCB &progress,
                                  const CancelCheck &shouldCancel) {
    auto s = session(err);
    if (!s) {
        report(err);
        return false;
    }
    std::size_t total = 0;
    FileInfo st;
    Error statErr;
    if (s->lstat(remote_file, st, statErr))
        total = static_cast<std::size_t>(st.size);

    auto src = s->open(remote_file, err);
    if (!src) {
        qCWarning(rsClient) << "error opening file" << logPath(remote_file)
                            << qs(err.message);
        report(err);
        return false;
    }
    LocalFile dst(std::fopen(local_file.c_str(), "wb"));
    if (!dst) {
        err = localError("open", local_file);
        report(err);
        return false;
    }

    std::vector<char> buf(kChunk);
    std::size_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Canceled, "download canceled: " + remote_file);
            return false;
        }
        const long long n = src->read(buf.data(), buf.size(), err);
        if (n < 0) {
            qCWarning(rsClient) << "read remote file failed"
                                << logPath(remote_file) << qs(err.message);
            report(err);
            return false;
        }
        if (n == 0)
            break;
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), dst.get()) !=
            static_cast<std::size_t>(n)) {
            err = localError("write", local_file);
            report(err);
            return false;
        }
        done += static_cast<std::size_t>(n);
        if (progress)
            progress(done, total);
    }
    if (std::fclose(dst.release()) != 0) {
        err = localError("close", local_file);
        report(err);
        return false;
    }
    if (!src->close(err)) {
        report(err);
        return false;
    }
    return true;
}

void ResilientSftpClient::close() {
    supervisor_.stop();
    auto s = supervisor_.releaseSession();
    if (s)
        s->close();
}

} // namespace resftp
