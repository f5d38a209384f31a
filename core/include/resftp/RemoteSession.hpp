// Abstract SFTP session. Concrete backends (libssh2, mock) implement this API
// so the reconnect supervisor and the client stay decoupled from the backend.
#pragma once
#include "RemoteTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace resftp {

// Open remote file. Keeps its session's connection alive until destroyed.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    virtual const std::string &path() const = 0;

    // Returns bytes read, 0 on EOF, -1 on error (err filled).
    virtual long long read(char *buf, std::size_t len, Error &err) = 0;

    // Writes the whole buffer or fails.
    virtual bool write(const char *data, std::size_t len, Error &err) = 0;

    virtual bool close(Error &err) = 0;
};

// Reads the rest of the file into out.
bool readAll(RemoteFile &file, std::string &out, Error &err,
             const CancelCheck &shouldCancel = {});

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual bool isOpen() const = 0;

    // Open an existing file for reading.
    virtual std::unique_ptr<RemoteFile> open(const std::string &path,
                                             Error &err) = 0;

    // Create (or truncate) a file for writing.
    virtual std::unique_ptr<RemoteFile> create(const std::string &path,
                                               Error &err) = 0;

    virtual bool rename(const std::string &from, const std::string &to,
                        Error &err) = 0;

    virtual bool remove(const std::string &path, Error &err) = 0;

    virtual bool mkdir(const std::string &path, Error &err,
                       unsigned int mode = 0755) = 0;

    // Directory entries without "." and "..", in server order.
    virtual bool readDir(const std::string &path, std::vector<FileInfo> &out,
                         Error &err) = 0;

    // Metadata without following symlinks. info.name is left empty.
    virtual bool lstat(const std::string &path, FileInfo &info,
                       Error &err) = 0;

    virtual void close() = 0;
};

} // namespace resftp
