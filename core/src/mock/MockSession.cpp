#include "resftp/MockSession.hpp"
#include "resftp/Config.hpp"
#include "resftp/Logging.hpp"

#include <algorithm>
#include <thread>

namespace resftp {

namespace {

Error lostError(const char *op) {
    Error e;
    e.set(ErrorKind::TransportLost, std::string("connection lost: ") + op);
    return e;
}

Error transportError(const char *op, const std::string &path,
                     const char *why) {
    Error e;
    e.set(ErrorKind::Transport, std::string(op) + " " + path + ": " + why);
    return e;
}

// SSH wire string: uint32 big-endian length followed by the bytes.
void appendSshString(std::string &out, const std::string &s) {
    const auto n = static_cast<std::uint32_t>(s.size());
    out.push_back(static_cast<char>((n >> 24) & 0xff));
    out.push_back(static_cast<char>((n >> 16) & 0xff));
    out.push_back(static_cast<char>((n >> 8) & 0xff));
    out.push_back(static_cast<char>(n & 0xff));
    out += s;
}

} // namespace

// ---------------------------------------------------------------------------
// MockRemoteFs

MockRemoteFs::MockRemoteFs() { nodes_["/"] = Node{true, {}}; }

std::string MockRemoteFs::normalize(const std::string &path) {
    std::string out = "/";
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos)
            slash = path.size();
        const std::string seg = path.substr(start, slash - start);
        if (!seg.empty() && seg != ".")
            out = joinRemotePath(out, seg);
        start = slash + 1;
    }
    return out;
}

std::string MockRemoteFs::parentOf(const std::string &path) {
    const std::size_t slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0)
        return "/";
    return path.substr(0, slash);
}

std::string MockRemoteFs::baseName(const std::string &path) {
    const std::size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

void MockRemoteFs::addDir(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    for (const auto &anc : remoteAncestors(p))
        nodes_[anc].is_dir = true;
    nodes_[p].is_dir = true;
}

void MockRemoteFs::addFile(const std::string &path, const std::string &content) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    for (const auto &anc : remoteAncestors(p))
        nodes_[anc].is_dir = true;
    nodes_[p] = Node{false, content};
}

bool MockRemoteFs::exists(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalize(path)) > 0;
}

bool MockRemoteFs::isDir(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.is_dir;
}

std::optional<std::string> MockRemoteFs::fileContent(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.is_dir)
        return std::nullopt;
    return it->second.content;
}

void MockRemoteFs::failPath(const std::string &path, Error err) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_[normalize(path)] = std::move(err);
}

void MockRemoteFs::clearFailures() {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.clear();
}

std::vector<std::string> MockRemoteFs::mkdirCalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return mkdirCalls_;
}

void MockRemoteFs::clearMkdirCalls() {
    std::lock_guard<std::mutex> lk(mtx_);
    mkdirCalls_.clear();
}

bool MockRemoteFs::failureFor(const std::string &path, Error &err) const {
    auto it = failures_.find(path);
    if (it == failures_.end())
        return false;
    err = it->second;
    return true;
}

// ---------------------------------------------------------------------------
// MockRemoteFile

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockRemoteFs> fs,
                   std::shared_ptr<MockSessionState> state, std::string path,
                   bool writable)
        : fs_(std::move(fs)), state_(std::move(state)), path_(std::move(path)),
          writable_(writable) {}

    const std::string &path() const override { return path_; }

    long long read(char *buf, std::size_t len, Error &err) override {
        if (!check("read", err))
            return -1;
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto it = fs_->nodes_.find(path_);
        if (it == fs_->nodes_.end()) {
            err = transportError("read", path_, "no such file");
            return -1;
        }
        const std::string &data = it->second.content;
        if (offset_ >= data.size())
            return 0;
        const std::size_t n = std::min(len, data.size() - offset_);
        std::copy_n(data.data() + offset_, n, buf);
        offset_ += n;
        return static_cast<long long>(n);
    }

    bool write(const char *data, std::size_t len, Error &err) override {
        if (!check("write", err))
            return false;
        if (!writable_) {
            err = transportError("write", path_, "permission denied");
            return false;
        }
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        fs_->nodes_[path_].content.append(data, len);
        return true;
    }

    bool close(Error &err) override {
        if (closed_)
            return true;
        closed_ = true;
        if (state_->broken.load()) {
            err = lostError("close");
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    std::shared_ptr<MockSessionState> state_;
    std::string path_;
    bool writable_ = false;
    bool closed_ = false;
    std::size_t offset_ = 0;

    bool check(const char *op, Error &err) {
        if (closed_) {
            err.set(ErrorKind::InvalidArgument, "file already closed: " + path_);
            return false;
        }
        if (state_->broken.load() || !state_->open.load()) {
            err = lostError(op);
            return false;
        }
        std::lock_guard<std::mutex> lk(state_->mtx);
        auto it = state_->opFailures.find(op);
        if (it != state_->opFailures.end()) {
            err = it->second;
            return false;
        }
        return true;
    }
};

// ---------------------------------------------------------------------------
// MockSession

MockSession::MockSession(std::shared_ptr<MockRemoteFs> fs, int id)
    : fs_(std::move(fs)), state_(std::make_shared<MockSessionState>()), id_(id) {}

void MockSession::breakConnection() { state_->broken = true; }

void MockSession::failOperation(const std::string &op, Error err) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->opFailures[op] = std::move(err);
}

void MockSession::clearOperationFailures() {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->opFailures.clear();
}

bool MockSession::isOpen() const {
    return state_->open.load() && !state_->broken.load();
}

bool MockSession::precheck(const char *op, Error &err) const {
    if (!state_->open.load()) {
        err.set(ErrorKind::TransportLost, "connection lost: session closed");
        return false;
    }
    if (state_->broken.load()) {
        err = lostError(op);
        return false;
    }
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->opFailures.find(op);
    if (it != state_->opFailures.end()) {
        err = it->second;
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile> MockSession::open(const std::string &path,
                                              Error &err) {
    if (!precheck("open", err))
        return nullptr;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(p, err))
        return nullptr;
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err = transportError("open", p, "no such file");
        return nullptr;
    }
    if (it->second.is_dir) {
        err = transportError("open", p, "is a directory");
        return nullptr;
    }
    return std::make_unique<MockRemoteFile>(fs_, state_, p, false);
}

std::unique_ptr<RemoteFile> MockSession::create(const std::string &path,
                                                Error &err) {
    if (!precheck("create", err))
        return nullptr;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(p, err))
        return nullptr;
    auto parent = fs_->nodes_.find(MockRemoteFs::parentOf(p));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = transportError("create", p, "no such file");
        return nullptr;
    }
    auto it = fs_->nodes_.find(p);
    if (it != fs_->nodes_.end() && it->second.is_dir) {
        err = transportError("create", p, "is a directory");
        return nullptr;
    }
    fs_->nodes_[p] = MockRemoteFs::Node{false, {}};
    return std::make_unique<MockRemoteFile>(fs_, state_, p, true);
}

bool MockSession::rename(const std::string &from, const std::string &to,
                         Error &err) {
    if (!precheck("rename", err))
        return false;
    const std::string src = MockRemoteFs::normalize(from);
    const std::string dst = MockRemoteFs::normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(src, err) || fs_->failureFor(dst, err))
        return false;
    if (fs_->nodes_.count(src) == 0 || src == "/") {
        err = transportError("rename", src, "no such file");
        return false;
    }
    if (fs_->nodes_.count(dst) > 0) {
        err = transportError("rename", dst, "file already exists");
        return false;
    }
    auto parent = fs_->nodes_.find(MockRemoteFs::parentOf(dst));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = transportError("rename", dst, "no such file");
        return false;
    }
    // Move the node and, for directories, everything below it.
    std::vector<std::pair<std::string, MockRemoteFs::Node>> moved;
    const std::string prefix = src + "/";
    for (auto it = fs_->nodes_.begin(); it != fs_->nodes_.end();) {
        if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
            moved.emplace_back(dst + it->first.substr(src.size()),
                               std::move(it->second));
            it = fs_->nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto &kv : moved)
        fs_->nodes_[kv.first] = std::move(kv.second);
    return true;
}

bool MockSession::remove(const std::string &path, Error &err) {
    if (!precheck("remove", err))
        return false;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(p, err))
        return false;
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err = transportError("remove", p, "no such file");
        return false;
    }
    if (it->second.is_dir) {
        err = transportError("remove", p, "failure");
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSession::mkdir(const std::string &path, Error &err,
                        unsigned int mode) {
    (void)mode;
    if (!precheck("mkdir", err))
        return false;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    fs_->mkdirCalls_.push_back(path);
    if (fs_->failureFor(p, err))
        return false;
    if (fs_->nodes_.count(p) > 0) {
        // Real servers answer SSH_FX_FAILURE here.
        err = transportError("mkdir", p, "failure");
        return false;
    }
    auto parent = fs_->nodes_.find(MockRemoteFs::parentOf(p));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = transportError("mkdir", p, "no such file");
        return false;
    }
    fs_->nodes_[p].is_dir = true;
    return true;
}

bool MockSession::readDir(const std::string &path, std::vector<FileInfo> &out,
                          Error &err) {
    if (!precheck("readDir", err))
        return false;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(p, err))
        return false;
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err = transportError("opendir", p, "no such file");
        return false;
    }
    if (!it->second.is_dir) {
        err = transportError("opendir", p, "not a directory");
        return false;
    }
    out.clear();
    for (const auto &kv : fs_->nodes_) {
        if (kv.first == p || MockRemoteFs::parentOf(kv.first) != p)
            continue;
        FileInfo fi;
        fi.name = MockRemoteFs::baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.content.size();
        fi.mode = kv.second.is_dir ? 040755 : 0100644;
        out.push_back(std::move(fi));
    }
    return true;
}

bool MockSession::lstat(const std::string &path, FileInfo &info, Error &err) {
    if (!precheck("lstat", err))
        return false;
    const std::string p = MockRemoteFs::normalize(path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->failureFor(p, err))
        return false;
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err = transportError("lstat", p, "no such file");
        return false;
    }
    info = FileInfo{};
    info.is_dir = it->second.is_dir;
    info.size = it->second.content.size();
    info.mode = it->second.is_dir ? 040755 : 0100644;
    return true;
}

void MockSession::close() { state_->open = false; }

// ---------------------------------------------------------------------------
// MockSessionFactory

MockSessionFactory::MockSessionFactory(std::shared_ptr<MockRemoteFs> fs,
                                       Config cfg)
    : fs_(std::move(fs)), cfg_(std::move(cfg)) {
    hostKey_.type = "ssh-ed25519";
    appendSshString(hostKey_.blob, hostKey_.type);
    appendSshString(hostKey_.blob, std::string(32, '\x2a'));
}

Config MockSessionFactory::defaultConfig() {
    Config cfg;
    cfg.host = "example.test";
    cfg.port = 2022;
    cfg.username = "alice";
    cfg.password = "secret";
    return cfg;
}

void MockSessionFactory::scriptFailure(Error err) {
    std::lock_guard<std::mutex> lk(mtx_);
    scripted_.push_back(std::move(err));
}

void MockSessionFactory::setHostKey(HostKey key) {
    std::lock_guard<std::mutex> lk(mtx_);
    hostKey_ = std::move(key);
}

void MockSessionFactory::setConnectDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mtx_);
    delay_ = delay;
}

void MockSessionFactory::holdConnects() {
    std::lock_guard<std::mutex> lk(mtx_);
    held_ = true;
}

void MockSessionFactory::releaseConnects() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        held_ = false;
    }
    cv_.notify_all();
}

bool MockSessionFactory::waitForBlockedConnect(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this]() { return blocked_ > 0; });
}

std::unique_ptr<RemoteSession> MockSessionFactory::connect(Error &err) {
    ++connectCalls_;
    const int now = ++inFlight_;
    int prev = maxConcurrent_.load();
    while (now > prev && !maxConcurrent_.compare_exchange_weak(prev, now)) {
    }

    std::chrono::milliseconds delay{0};
    std::optional<Error> scripted;
    HostKey key;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        if (held_) {
            ++blocked_;
            cv_.notify_all();
            cv_.wait(lk, [this]() { return !held_; });
            --blocked_;
        }
        delay = delay_;
        key = hostKey_;
        if (!scripted_.empty()) {
            scripted = scripted_.front();
            scripted_.pop_front();
        }
    }
    if (delay.count() > 0)
        std::this_thread::sleep_for(delay);

    std::unique_ptr<RemoteSession> session;
    std::string invalid;
    if (!validateConfig(cfg_, invalid)) {
        err.set(ErrorKind::InvalidArgument, invalid);
    } else if (scripted) {
        err = *scripted;
    } else if (acceptHostKey(cfg_.trusted_host_key, key, err)) {
        session = std::make_unique<MockSession>(fs_, nextId_++);
    }
    if (!session)
        qCWarning(rsSession) << "mock connect failed:" << qs(err.message);
    --inFlight_;
    return session;
}

} // namespace resftp
