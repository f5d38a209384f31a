#pragma once
#include "HostKeyVerifier.hpp"
#include "RemoteSession.hpp"
#include "SessionFactory.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resftp {

// In-memory "remote" file system shared by every session a MockSessionFactory
// creates, so data survives a reconnect like it would on a real server.
class MockRemoteFs {
public:
    MockRemoteFs();

    void addDir(const std::string &path);
    void addFile(const std::string &path, const std::string &content);

    bool exists(const std::string &path) const;
    bool isDir(const std::string &path) const;
    std::optional<std::string> fileContent(const std::string &path) const;

    // Any session operation touching path fails with err.
    void failPath(const std::string &path, Error err);
    void clearFailures();

    // Every mkdir call in order, successful or not.
    std::vector<std::string> mkdirCalls() const;
    void clearMkdirCalls();

    static std::string normalize(const std::string &path);

private:
    friend class MockSession;
    friend class MockRemoteFile;

    struct Node {
        bool is_dir = false;
        std::string content;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, Error> failures_;
    std::vector<std::string> mkdirCalls_;

    static std::string parentOf(const std::string &path);
    static std::string baseName(const std::string &path);
    bool failureFor(const std::string &path, Error &err) const; // mtx_ held
};

// Fault switches shared by a session and the files it opened.
struct MockSessionState {
    std::atomic<bool> open{true};
    std::atomic<bool> broken{false};
    std::mutex mtx;
    std::map<std::string, Error> opFailures; // op name -> error
};

class MockSession : public RemoteSession {
public:
    MockSession(std::shared_ptr<MockRemoteFs> fs, int id);

    int id() const { return id_; }

    // Every later call (and on already open files) fails with
    // "connection lost".
    void breakConnection();
    // Operation ("open", "create", "rename", "remove", "mkdir", "readDir",
    // "lstat", "read", "write") fails with err until cleared.
    void failOperation(const std::string &op, Error err);
    void clearOperationFailures();

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
    std::shared_ptr<MockRemoteFs> fs_;
    std::shared_ptr<MockSessionState> state_;
    int id_ = 0;

    bool precheck(const char *op, Error &err) const;
};

// Factory with scripted results. Sessions get increasing ids starting at 1.
class MockSessionFactory : public SessionFactory {
public:
    explicit MockSessionFactory(std::shared_ptr<MockRemoteFs> fs,
                                Config cfg = defaultConfig());

    static Config defaultConfig();

    std::unique_ptr<RemoteSession> connect(Error &err) override;

    // Next connect() calls fail with these errors, in order.
    void scriptFailure(Error err);
    void setHostKey(HostKey key);
    void setConnectDelay(std::chrono::milliseconds delay);

    // While held, connect() blocks until released.
    void holdConnects();
    void releaseConnects();
    // Waits until a connect() is blocked on the hold.
    bool waitForBlockedConnect(std::chrono::milliseconds timeout);

    int connectCalls() const { return connectCalls_.load(); }
    int maxConcurrentConnects() const { return maxConcurrent_.load(); }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    Config cfg_;
    HostKey hostKey_;
    std::chrono::milliseconds delay_{0};

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Error> scripted_;
    bool held_ = false;
    int blocked_ = 0;

    std::atomic<int> connectCalls_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxConcurrent_{0};
    std::atomic<int> nextId_{1};
};

} // namespace resftp
