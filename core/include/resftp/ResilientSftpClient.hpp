// File operations against a remote SFTP server that survive a lost
// connection. Every error goes through connectionLostHandler(); errors that
// look like transport loss make the background supervisor dial a fresh
// session for later calls. The failing call itself always returns promptly.
#pragma once
#include "RecordParsers.hpp"
#include "ReconnectSupervisor.hpp"
#include "RemoteSession.hpp"
#include "SessionFactory.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace resftp {

// Per-operation choice between returning an error and degrading silently.
// The defaults keep the historical behaviour of this client.
struct ErrorPolicy {
    // files(): return an empty list and keep the error to itself.
    bool swallow_list_errors = true;
    // putString(): log a failed upload of the text but report success.
    bool swallow_put_string_errors = true;
    // Local I/O failures are also handed to connectionLostHandler().
    bool route_local_errors = true;
};

using TransportLossPredicate = std::function<bool(const Error &)>;

// TransportLost kind, or a message containing "connection lost".
bool isConnectionLost(const Error &err);

struct ClientOptions {
    ErrorPolicy policy;
    TransportLossPredicate is_transport_lost = isConnectionLost;
};

class ResilientSftpClient {
public:
    explicit ResilientSftpClient(std::shared_ptr<SessionFactory> factory,
                                 ClientOptions options = {});
    ~ResilientSftpClient();

    ResilientSftpClient(const ResilientSftpClient &) = delete;
    ResilientSftpClient &operator=(const ResilientSftpClient &) = delete;

    // Initial connect, on the calling thread. The supervisor runs either way,
    // so a later failing operation can still trigger a reconnect.
    bool connect(Error &err);
    bool isConnected() const;

    std::unique_ptr<RemoteFile> openFile(const std::string &remote_file,
                                         Error &err);

    // Opens the file and hands it to parser. The parser is not called when
    // the open fails.
    bool getRecords(const std::string &remote_file, const RecordParser &parser,
                    Records &out, Error &err);

    // Directory entries, or an empty list on failure (see ErrorPolicy).
    std::vector<FileInfo> files(const std::string &remote_dir,
                                Error *err = nullptr);

    // Paths of every non-directory entry below remote_dir, depth-first. On
    // failure out holds the entries collected before the failing step.
    bool walkFiles(const std::string &remote_dir, std::vector<std::string> &out,
                   Error &err, const CancelCheck &shouldCancel = {});

    bool moveFile(const std::string &source, const std::string &dest,
                  Error &err);
    bool removeFile(const std::string &remote_path, Error &err);

    // Upload; parent directories of remote_file are created as needed.
    bool putFile(const std::string &local_file, const std::string &remote_file,
                 Error &err, const ProgressCB &progress = {},
                 const CancelCheck &shouldCancel = {});
    bool putString(const std::string &text, const std::string &remote_file,
                   Error &err, const CancelCheck &shouldCancel = {});

    bool getFile(const std::string &remote_file, const std::string &local_file,
                 Error &err, const ProgressCB &progress = {},
                 const CancelCheck &shouldCancel = {});

    // Stops the supervisor and closes the current session.
    void close();

    // Single choke point for operation errors.
    void connectionLostHandler(const Error &err);

    ReconnectSupervisor &supervisor() { return supervisor_; }
    const ClientOptions &options() const { return options_; }

    // Waits for a triggered reconnect to finish.
    bool waitForReconnect(std::chrono::milliseconds timeout) const;

private:
    ClientOptions options_;
    ReconnectSupervisor supervisor_;

    std::shared_ptr<RemoteSession> session(Error &err);
    void makeParentDirs(RemoteSession &session, const std::string &remote_file);
    // Source callback: bytes read, 0 at end, -1 on error.
    using ChunkSource = std::function<long long(char *, std::size_t, Error &)>;
    // created tells whether the remote file was created before a failure.
    bool upload(RemoteSession &session, const std::string &remote_file,
                const ChunkSource &source, std::size_t total, bool &created,
                Error &err, const ProgressCB &progress,
                const CancelCheck &shouldCancel);
    // Hands err to connectionLostHandler() unless the policy keeps it local.
    void report(const Error &err);
};

} // namespace resftp
