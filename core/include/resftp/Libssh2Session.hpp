#pragma once
#include "SessionFactory.hpp"
#include "RemoteSession.hpp"
#include <memory>
#include <string>
#include <vector>

namespace resftp {

// Socket + SSH session + SFTP channel. Shared by a session and the files it
// opened; libssh2 calls on it are serialised by its own mutex.
struct Libssh2Connection;

class Libssh2Session : public RemoteSession {
public:
    explicit Libssh2Session(std::shared_ptr<Libssh2Connection> conn);
    ~Libssh2Session() override;

    bool isOpen() const override;

    std::unique_ptr<RemoteFile> open(const std::string &path,
                                     Error &err) override;
    std::unique_ptr<RemoteFile> create(const std::string &path,
                                       Error &err) override;
    bool rename(const std::string &from, const std::string &to,
                Error &err) override;
    bool remove(const std::string &path, Error &err) override;
    bool mkdir(const std::string &path, Error &err,
               unsigned int mode = 0755) override;
    bool readDir(const std::string &path, std::vector<FileInfo> &out,
                 Error &err) override;
    bool lstat(const std::string &path, FileInfo &info, Error &err) override;
    void close() override;

private:
    std::shared_ptr<Libssh2Connection> conn_;

    std::unique_ptr<RemoteFile> openHandle(const std::string &path,
                                           unsigned long flags, long mode,
                                           const char *what, Error &err);
};

class Libssh2SessionFactory : public SessionFactory {
public:
    explicit Libssh2SessionFactory(Config cfg);

    std::unique_ptr<RemoteSession> connect(Error &err) override;

    const Config &config() const { return cfg_; }

private:
    Config cfg_;

    bool tcpConnect(Libssh2Connection &conn, Error &err) const;
    bool sshHandshake(Libssh2Connection &conn, Error &err) const;
    bool verifyServerKey(Libssh2Connection &conn, Error &err) const;
    bool authenticate(Libssh2Connection &conn, Error &err) const;
};

} // namespace resftp
