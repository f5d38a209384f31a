// Core unit tests without external framework (run via CTest).
#include "resftp/Config.hpp"
#include "resftp/HostKeyVerifier.hpp"
#include "resftp/MockSession.hpp"
#include "resftp/RecordParsers.hpp"
#include "resftp/RemoteWalker.hpp"
#include "resftp/ResilientSftpClient.hpp"

#include <QtGlobal>
#include <QString>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace resftp;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

constexpr std::chrono::milliseconds kWait{2000};

// Captured Qt log lines.
std::mutex gLogMutex;
std::vector<std::string> gLog;

void captureMessages(QtMsgType, const QMessageLogContext &, const QString &msg) {
    std::lock_guard<std::mutex> lk(gLogMutex);
    gLog.push_back(msg.toStdString());
}

void clearLog() {
    std::lock_guard<std::mutex> lk(gLogMutex);
    gLog.clear();
}

bool logContains(const std::string &needle) {
    std::lock_guard<std::mutex> lk(gLogMutex);
    for (const auto &line : gLog) {
        if (line.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

Error makeError(ErrorKind kind, const std::string &msg) {
    Error e;
    e.set(kind, msg);
    return e;
}

std::string sshString(const std::string &s) {
    std::string out;
    const auto n = static_cast<std::uint32_t>(s.size());
    out.push_back(static_cast<char>((n >> 24) & 0xff));
    out.push_back(static_cast<char>((n >> 16) & 0xff));
    out.push_back(static_cast<char>((n >> 8) & 0xff));
    out.push_back(static_cast<char>(n & 0xff));
    return out + s;
}

HostKey testKey(char fill) {
    HostKey k;
    k.type = "ssh-ed25519";
    k.blob = sshString(k.type) + sshString(std::string(32, fill));
    return k;
}

// A connected client over a fresh in-memory tree.
struct Fixture {
    std::shared_ptr<MockRemoteFs> fs = std::make_shared<MockRemoteFs>();
    std::shared_ptr<MockSessionFactory> factory =
        std::make_shared<MockSessionFactory>(fs);
    ResilientSftpClient client;
    bool connected = false;

    explicit Fixture(ClientOptions options = {})
        : client(factory, std::move(options)) {
        Error err;
        connected = client.connect(err);
    }

    std::shared_ptr<MockSession> session() {
        return std::dynamic_pointer_cast<MockSession>(
            client.supervisor().currentSession());
    }

    int sessionId() {
        auto s = session();
        return s ? s->id() : 0;
    }
};

fs::path tempDir(const std::string &tag) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path p = fs::temp_directory_path() /
                 ("resftp-" + tag + "-" + std::to_string(static_cast<long long>(now)));
    std::error_code ec;
    fs::create_directories(p, ec);
    return p;
}

bool readLocal(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

// ---------------------------------------------------------------------------
// Plain types

void test_error_basics(TestContext &t) {
    Error e;
    t.check(e.ok(), "default Error should be ok");
    e.set(ErrorKind::Transport, "boom");
    t.check(!e.ok() && e.message == "boom", "set() should store kind+message");
    e.clear();
    t.check(e.ok() && e.message.empty(), "clear() should reset the error");
    t.check(std::string(errorKindName(ErrorKind::TransportLost)) ==
                "TransportLost",
            "errorKindName(TransportLost)");
}

void test_config_defaults(TestContext &t) {
    Config c;
    t.check(c.port == 22, "default port should be 22");
    t.check(c.trusted_host_key.empty(),
            "trusted key should be empty by default");
    t.check(c.connect_timeout.count() == 30,
            "connect timeout should default to 30s");
    t.check(c.session_timeout.count() == 0,
            "session timeout should default to none");
}

void test_join_remote_path(TestContext &t) {
    t.check(joinRemotePath("/a", "b") == "/a/b", "join /a + b");
    t.check(joinRemotePath("/a/", "b") == "/a/b", "join /a/ + b");
    t.check(joinRemotePath("/a/", "/b") == "/a/b", "join /a/ + /b");
    t.check(joinRemotePath("/", "b") == "/b", "join / + b");
    t.check(joinRemotePath("", "b") == "b", "join empty base");
}

void test_remote_ancestors(TestContext &t) {
    const auto abs = remoteAncestors("/a/b/c.txt");
    t.check(abs == std::vector<std::string>({"/a", "/a/b"}),
            "ancestors of /a/b/c.txt should be /a, /a/b");
    t.check(remoteAncestors("a/b.txt") == std::vector<std::string>({"a"}),
            "relative paths should stay relative");
    t.check(remoteAncestors("/c.txt").empty(),
            "a file in / has no ancestors to create");
    t.check(remoteAncestors("c.txt").empty(),
            "a bare name has no ancestors");
    t.check(remoteAncestors("/a//b/./c") ==
                std::vector<std::string>({"/a", "/a/b"}),
            "empty and '.' segments should be skipped");
}

void test_cancel_after(TestContext &t) {
    t.check(cancelAfter(std::chrono::seconds(0))(),
            "zero deadline should fire immediately");
    t.check(!cancelAfter(std::chrono::hours(1))(),
            "distant deadline should not fire");
}

// ---------------------------------------------------------------------------
// Host keys

void test_host_key_blob_and_fingerprint(TestContext &t) {
    const HostKey k = testKey('\x2a');
    t.check(hostKeyTypeFromBlob(k.blob) == "ssh-ed25519",
            "key type should be read from the blob");
    t.check(hostKeyTypeFromBlob(std::string("\0\0\0\xff", 4)).empty(),
            "truncated blob should yield an empty type");
    t.check(hostKeyTypeFromBlob("ab").empty(),
            "short blob should yield an empty type");
    t.checkContains(hostKeyFingerprint(k), "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5",
                    "fingerprint should be '<type> <base64 blob>'");
}

void test_host_key_verdicts(TestContext &t) {
    const HostKey k = testKey('\x2a');
    const std::string fp = hostKeyFingerprint(k);
    t.check(verifyHostKey("", k) == HostKeyVerdict::AcceptedUnpinned,
            "empty trusted key should never reject");
    t.check(verifyHostKey(fp, k) == HostKeyVerdict::Accepted,
            "identical fingerprint should be accepted");
    t.check(verifyHostKey(fp + " ", k) == HostKeyVerdict::Rejected,
            "comparison should be byte-for-byte");
    t.check(verifyHostKey(hostKeyFingerprint(testKey('\x01')), k) ==
                HostKeyVerdict::Rejected,
            "different key should be rejected");

    Error err;
    t.check(!acceptHostKey("ssh-ed25519 AAAA", k, err),
            "acceptHostKey should refuse a mismatch");
    t.check(err.kind == ErrorKind::Trust, "mismatch should be a Trust error");
    t.checkContains(err.message, "SSH-key verification: expected \"ssh-ed25519 AAAA\"",
                    "mismatch message should name the expected key");
    t.checkContains(err.message, fp, "mismatch message should name the observed key");
}

void test_unpinned_connect_warns(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    Config cfg;
    cfg.host = "example.com";
    cfg.port = 2022;
    cfg.username = "alice";
    auto factory = std::make_shared<MockSessionFactory>(fs, cfg);
    factory->setHostKey(testKey('\x07'));

    clearLog();
    Error err;
    auto s = factory->connect(err);
    t.check(static_cast<bool>(s), "connect without a pinned key should succeed");
    t.check(err.ok(), "no Trust error without a pinned key");
    t.check(logContains("SSH-key verification is *NOT* in effect"),
            "insecure connect should log a warning");
    t.check(logContains(hostKeyFingerprint(testKey('\x07'))),
            "warning should carry the observed fingerprint");
}

void test_pinned_connect(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    Config cfg = MockSessionFactory::defaultConfig();
    cfg.trusted_host_key = hostKeyFingerprint(testKey('\x07'));
    auto factory = std::make_shared<MockSessionFactory>(fs, cfg);

    factory->setHostKey(testKey('\x07'));
    Error err;
    t.check(static_cast<bool>(factory->connect(err)),
            "matching pinned key should connect");

    factory->setHostKey(testKey('\x08'));
    err.clear();
    t.check(!factory->connect(err), "mismatching pinned key should not connect");
    t.check(err.kind == ErrorKind::Trust, "mismatch should surface as Trust");
}

// ---------------------------------------------------------------------------
// Config

void test_validate_config(TestContext &t) {
    std::string err;
    Config c = MockSessionFactory::defaultConfig();
    t.check(validateConfig(c, err), "default mock config should be valid");
    c.host.clear();
    t.check(!validateConfig(c, err), "empty host should be rejected");
    t.checkContains(err, "host", "error should name the host");
    c = MockSessionFactory::defaultConfig();
    c.username.clear();
    t.check(!validateConfig(c, err), "empty username should be rejected");
    c = MockSessionFactory::defaultConfig();
    c.port = 0;
    t.check(!validateConfig(c, err), "port 0 should be rejected");
}

void test_parse_port(TestContext &t) {
    std::uint16_t p = 0;
    t.check(parsePort("2022", p) && p == 2022, "2022 should parse");
    t.check(!parsePort("0", p), "0 is not a port");
    t.check(!parsePort("65536", p), "65536 is out of range");
    t.check(!parsePort("22x", p), "trailing junk should be rejected");
    t.check(!parsePort("", p), "empty string should be rejected");
}

void test_config_from_environment(TestContext &t) {
    ::setenv("RESFTP_HOST", "  sftp.example.com ", 1);
    ::setenv("RESFTP_PORT", "2200", 1);
    ::setenv("RESFTP_USER", "bob", 1);
    ::setenv("RESFTP_PASS", "pw", 1);
    ::setenv("RESFTP_TRUSTED_HOST_KEY", "ssh-ed25519 AAAA", 1);
    ::setenv("RESFTP_CONNECT_TIMEOUT", "5", 1);

    Config c;
    std::string err;
    t.check(loadConfigFromEnvironment(c, err),
            std::string("environment config should load: ") + err);
    t.check(c.host == "sftp.example.com", "host should be trimmed");
    t.check(c.port == 2200, "port should come from RESFTP_PORT");
    t.check(c.username == "bob" && c.password == "pw",
            "credentials should come from the environment");
    t.check(c.trusted_host_key == "ssh-ed25519 AAAA", "trusted key loaded");
    t.check(c.connect_timeout.count() == 5, "connect timeout loaded");

    ::setenv("RESFTP_PORT", "99999", 1);
    Config bad;
    err.clear();
    t.check(!loadConfigFromEnvironment(bad, err), "bad port should fail the load");
    t.checkContains(err, "RESFTP_PORT", "error should name RESFTP_PORT");

    ::setenv("RESFTP_PORT", "22", 1);
    ::setenv("RESFTP_CONNECT_TIMEOUT", "-1", 1);
    err.clear();
    t.check(!loadConfigFromEnvironment(bad, err),
            "negative timeout should fail the load");

    for (const char *k : {"RESFTP_HOST", "RESFTP_PORT", "RESFTP_USER", "RESFTP_PASS",
                          "RESFTP_TRUSTED_HOST_KEY", "RESFTP_CONNECT_TIMEOUT"})
        ::unsetenv(k);

    Config untouched;
    untouched.host = "kept";
    err.clear();
    t.check(loadConfigFromEnvironment(untouched, err) && untouched.host == "kept",
            "unset variables should leave fields untouched");
}

// ---------------------------------------------------------------------------
// Record parsing

void test_parse_delimited(TestContext &t) {
    const Records rows = parseDelimited("a,b\n\"c,d\",\"e\"\"f\"\r\n\nx,\n");
    t.check(rows.size() == 3, "blank lines should be skipped");
    if (rows.size() == 3) {
        t.check(rows[0] == std::vector<std::string>({"a", "b"}), "plain row");
        t.check(rows[1] == std::vector<std::string>({"c,d", "e\"f"}),
                "quoted fields with delimiter and escaped quote");
        t.check(rows[2] == std::vector<std::string>({"x", ""}),
                "trailing empty field should be kept");
    }
    const Records semi = parseDelimited("1;2;3", ';');
    t.check(semi.size() == 1 && semi[0].size() == 3,
            "custom delimiter without trailing newline");
    t.check(parseDelimited("").empty(), "empty text yields no rows");
}

// ---------------------------------------------------------------------------
// Walker

void test_walker_preorder(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/tree/b.txt", "b");
    fs->addFile("/tree/a/x.txt", "x");
    fs->addDir("/tree/a/empty");
    MockSession s(fs, 1);

    std::vector<std::string> seen;
    RemoteWalker w(s, "/tree");
    while (w.step()) {
        t.check(w.error().ok(), "walk step should not fail: " + w.path());
        seen.push_back(w.path());
    }
    t.check(seen == std::vector<std::string>({"/tree", "/tree/a",
                                              "/tree/a/empty", "/tree/a/x.txt",
                                              "/tree/b.txt"}),
            "walker should visit root first then children depth-first by name");
}

void test_walker_skip_dir(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/r/skip/in.txt", "1");
    fs->addFile("/r/z.txt", "2");
    MockSession s(fs, 1);

    std::vector<std::string> seen;
    RemoteWalker w(s, "/r");
    while (w.step()) {
        seen.push_back(w.path());
        if (w.path() == "/r/skip")
            w.skipDir();
    }
    t.check(seen == std::vector<std::string>({"/r", "/r/skip", "/r/z.txt"}),
            "skipDir should not descend into the directory");
}

void test_walker_missing_root(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    MockSession s(fs, 1);
    RemoteWalker w(s, "/nope");
    t.check(w.step(), "walker should yield the root step");
    t.check(!w.error().ok(), "missing root should be reported on its step");
    t.check(!w.step(), "walk should end after the failed root");
}

// ---------------------------------------------------------------------------
// Facade

void test_walk_files_reports_example(TestContext &t) {
    Fixture f;
    f.fs->addFile("/reports/a.txt", "a");
    f.fs->addFile("/reports/sub/b.txt", "b");
    f.fs->addDir("/reports/sub/marker");

    std::vector<std::string> out;
    Error err;
    t.check(f.client.walkFiles("/reports", out, err),
            "walkFiles(/reports) should succeed");
    t.check(err.ok(), "walkFiles should leave no error");
    t.check(out == std::vector<std::string>({"/reports/a.txt", "/reports/sub/b.txt"}),
            "walkFiles should list files only, depth-first");
}

void test_walk_files_counts(TestContext &t) {
    Fixture f;
    for (const char *p : {"/w/1", "/w/d1/2", "/w/d1/3", "/w/d1/d2/4", "/w/d3/5"})
        f.fs->addFile(p, "x");
    f.fs->addDir("/w/d4");

    std::vector<std::string> out;
    Error err;
    t.check(f.client.walkFiles("/w", out, err), "walkFiles over a tree");
    t.check(out.size() == 5, "walkFiles should return exactly the 5 files");
}

void test_walk_files_partial_on_error(TestContext &t) {
    Fixture f;
    f.fs->addFile("/p/a.txt", "a");
    f.fs->addFile("/p/sub/b.txt", "b");
    f.fs->addFile("/p/z.txt", "z");
    f.fs->failPath("/p/sub", makeError(ErrorKind::Transport, "opendir /p/sub: permission denied"));

    std::vector<std::string> out;
    Error err;
    t.check(!f.client.walkFiles("/p", out, err),
            "walkFiles should fail on the first failing step");
    t.check(err.kind == ErrorKind::Transport, "walk error should be returned");
    t.check(out == std::vector<std::string>({"/p/a.txt"}),
            "partial list should hold the entries before the failure");
    t.check(f.client.waitForReconnect(kWait), "supervisor should stay idle");
    t.check(f.factory->connectCalls() == 1,
            "a permission error should not trigger a reconnect");
}

void test_walk_files_missing_root(TestContext &t) {
    Fixture f;
    std::vector<std::string> out{"stale"};
    Error err;
    t.check(!f.client.walkFiles("/missing", out, err),
            "walkFiles on a missing dir should fail");
    t.check(out.empty(), "partial list should be empty");
}

void test_walk_files_cancel(TestContext &t) {
    Fixture f;
    f.fs->addFile("/c/a.txt", "a");
    std::vector<std::string> out;
    Error err;
    t.check(!f.client.walkFiles("/c", out, err, []() { return true; }),
            "canceled walk should fail");
    t.check(err.kind == ErrorKind::Canceled, "cancel should be reported as Canceled");
}

void test_open_file(TestContext &t) {
    Fixture f;
    t.check(f.connected, "fixture should connect");
    f.fs->addFile("/docs/readme.txt", "hello");

    Error err;
    auto file = f.client.openFile("/docs/readme.txt", err);
    t.check(static_cast<bool>(file), "openFile should open an existing file");
    std::string text;
    t.check(file && readAll(*file, text, err) && text == "hello",
            "opened file should read back its content");
    t.check(file && file->close(err), "close should succeed");

    err.clear();
    t.check(!f.client.openFile("/docs/none.txt", err), "missing file should not open");
    t.check(err.kind == ErrorKind::Transport, "missing file is a Transport error");
    t.checkContains(err.message, "no such file", "error should say why");
}

void test_get_records(TestContext &t) {
    Fixture f;
    f.fs->addFile("/data/rows.csv", "id,name\n1,\"Smith, J\"\n");

    Records rows;
    Error err;
    t.check(f.client.getRecords("/data/rows.csv", delimitedRecordParser(), rows, err),
            "getRecords should parse an existing file");
    t.check(rows.size() == 2 && rows[1].size() == 2 && rows[1][1] == "Smith, J",
            "records should hold the parsed rows");

    int parserCalls = 0;
    RecordParser counting = [&parserCalls](RemoteFile &, Records &, Error &) {
        ++parserCalls;
        return true;
    };
    err.clear();
    t.check(!f.client.getRecords("/data/missing.csv", counting, rows, err),
            "getRecords on a missing file should fail");
    t.check(parserCalls == 0, "parser should not run when the open fails");
    t.check(rows.empty(), "records should be cleared on failure");

    RecordParser failing = [](RemoteFile &, Records &out, Error &e) {
        out.push_back({"partial"});
        e.set(ErrorKind::InvalidArgument, "bad header");
        return false;
    };
    err.clear();
    t.check(!f.client.getRecords("/data/rows.csv", failing, rows, err),
            "parser failure should fail getRecords");
    t.check(rows.empty() && err.message == "bad header",
            "parser failure should return empty records and its error");

    err.clear();
    t.check(!f.client.getRecords("/data/rows.csv", RecordParser(), rows, err),
            "missing parser should be rejected");
    t.check(err.kind == ErrorKind::InvalidArgument, "missing parser is InvalidArgument");
}

void test_files_listing(TestContext &t) {
    Fixture f;
    f.fs->addFile("/in/b.txt", "bb");
    f.fs->addDir("/in/a");

    Error err;
    const auto entries = f.client.files("/in", &err);
    t.check(err.ok(), "files() should succeed");
    t.check(entries.size() == 2, "files() should list both entries");
    if (entries.size() == 2) {
        t.check(entries[0].name == "a" && entries[0].is_dir, "first entry is dir a");
        t.check(entries[1].name == "b.txt" && entries[1].size == 2,
                "second entry is b.txt with its size");
    }

    err.clear();
    t.check(f.client.files("/none", &err).empty(), "missing dir yields no entries");
    t.check(err.ok(), "list errors are swallowed by default");
    t.check(f.client.files("/none").empty(), "error out-parameter is optional");

    ClientOptions strict;
    strict.policy.swallow_list_errors = false;
    Fixture g(strict);
    err.clear();
    t.check(g.client.files("/none", &err).empty(), "strict listing still returns empty");
    t.check(err.kind == ErrorKind::Transport, "strict listing surfaces the error");
}

void test_move_and_remove(TestContext &t) {
    Fixture f;
    f.fs->addFile("/m/src.txt", "s");
    f.fs->addFile("/m/taken.txt", "t");

    Error err;
    t.check(f.client.moveFile("/m/src.txt", "/m/dst.txt", err), "moveFile should succeed");
    t.check(!f.fs->exists("/m/src.txt") && f.fs->fileContent("/m/dst.txt") == std::string("s"),
            "moveFile should rename the file");

    err.clear();
    t.check(!f.client.moveFile("/m/dst.txt", "/m/taken.txt", err),
            "moveFile onto an existing file should fail");
    t.check(err.kind == ErrorKind::Transport, "rename conflict is a Transport error");

    err.clear();
    t.check(f.client.removeFile("/m/dst.txt", err), "removeFile should succeed");
    t.check(!f.fs->exists("/m/dst.txt"), "removed file should be gone");
    err.clear();
    t.check(!f.client.removeFile("/m/dst.txt", err), "removing twice should fail");
    err.clear();
    t.check(!f.client.removeFile("/m", err), "removeFile should not remove directories");
}

void test_put_string_creates_ancestors(TestContext &t) {
    Fixture f;
    Error err;
    t.check(f.client.putString("hello", "/a/b/c.txt", err),
            std::string("putString should succeed: ") + err.message);
    t.check(f.fs->mkdirCalls() == std::vector<std::string>({"/a", "/a/b"}),
            "putString should create ancestors root-to-leaf");
    t.check(f.fs->fileContent("/a/b/c.txt") == std::string("hello"),
            "putString should write the text");

    f.fs->clearMkdirCalls();
    err.clear();
    t.check(f.client.putString("again", "/a/b/c.txt", err),
            "existing ancestors should not fail putString");
    t.check(f.fs->mkdirCalls() == std::vector<std::string>({"/a", "/a/b"}),
            "every ancestor should be attempted again");
    t.check(f.fs->fileContent("/a/b/c.txt") == std::string("again"),
            "putString should truncate and rewrite");
}

void test_put_string_errors(TestContext &t) {
    Fixture f;
    auto s = f.session();
    t.check(static_cast<bool>(s), "fixture should have a mock session");
    if (!s)
        return;

    s->failOperation("create", makeError(ErrorKind::Transport, "create: permission denied"));
    Error err;
    t.check(!f.client.putString("x", "/out/x.txt", err),
            "create failure should be returned");
    t.check(err.kind == ErrorKind::Transport, "create failure keeps its kind");
    s->clearOperationFailures();

    s->failOperation("write", makeError(ErrorKind::Transport, "write: quota exceeded"));
    err.clear();
    t.check(f.client.putString("x", "/out/y.txt", err),
            "streaming failure is swallowed by default");
    t.check(err.ok(), "swallowed failure leaves no error");
    t.check(f.fs->exists("/out/y.txt"), "remote file should have been created");
    s->clearOperationFailures();

    err.clear();
    t.check(!f.client.putString("x", "/out/z.txt", err, []() { return true; }),
            "canceled putString should fail");
    t.check(err.kind == ErrorKind::Canceled, "cancel should not be swallowed");

    ClientOptions strict;
    strict.policy.swallow_put_string_errors = false;
    Fixture g(strict);
    auto gs = g.session();
    if (!gs)
        return;
    gs->failOperation("write", makeError(ErrorKind::Transport, "write: quota exceeded"));
    err.clear();
    t.check(!g.client.putString("x", "/out/y.txt", err),
            "strict policy should return the streaming failure");
    t.checkContains(err.message, "quota exceeded", "strict error should be the write error");
}

void test_put_file_and_get_file(TestContext &t) {
    Fixture f;
    const fs::path dir = tempDir("put");
    const fs::path local = dir / "payload.bin";
    std::string payload(150 * 1024, 'p');
    payload += "tail";
    {
        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        out << payload;
    }

    std::size_t lastDone = 0, lastTotal = 0;
    int progressCalls = 0;
    ProgressCB progress = [&](std::size_t done, std::size_t total) {
        ++progressCalls;
        lastDone = done;
        lastTotal = total;
    };
    Error err;
    t.check(f.client.putFile(local.string(), "/up/x/y.bin", err, progress),
            std::string("putFile should succeed: ") + err.message);
    t.check(f.fs->mkdirCalls() == std::vector<std::string>({"/up", "/up/x"}),
            "putFile should create ancestors root-to-leaf");
    t.check(f.fs->fileContent("/up/x/y.bin") == payload, "uploaded content should match");
    t.check(progressCalls >= 3, "progress should be reported per chunk");
    t.check(lastDone == payload.size() && lastTotal == payload.size(),
            "final progress should cover the whole file");

    const fs::path back = dir / "back.bin";
    err.clear();
    t.check(f.client.getFile("/up/x/y.bin", back.string(), err),
            std::string("getFile should succeed: ") + err.message);
    std::string downloaded;
    t.check(readLocal(back, downloaded) && downloaded == payload,
            "downloaded content should match");

    err.clear();
    t.check(!f.client.putFile((dir / "missing").string(), "/up/m.bin", err),
            "missing local file should fail putFile");
    t.check(err.kind == ErrorKind::LocalIO, "missing local file is LocalIO");
    t.check(f.client.waitForReconnect(kWait), "supervisor should stay idle");
    t.check(f.factory->connectCalls() == 1,
            "a local error should not trigger a reconnect");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_connection_lost_classification(TestContext &t) {
    t.check(isConnectionLost(makeError(ErrorKind::TransportLost, "eof")),
            "TransportLost kind is a lost connection");
    t.check(isConnectionLost(makeError(ErrorKind::Transport, "read: connection lost")),
            "message substring is a lost connection");
    t.check(!isConnectionLost(makeError(ErrorKind::Transport, "Connection Lost")),
            "substring match is case-sensitive");
    t.check(!isConnectionLost(makeError(ErrorKind::Transport, "no such file")),
            "ordinary errors are not a lost connection");
}

void test_handler_forwards_only_lost_connections(TestContext &t) {
    Fixture f;
    f.client.connectionLostHandler(makeError(ErrorKind::Transport, "no such file"));
    f.client.connectionLostHandler(Error{});
    t.check(f.client.waitForReconnect(kWait), "supervisor should be idle");
    t.check(f.factory->connectCalls() == 1, "non-matching errors should not reconnect");

    f.client.connectionLostHandler(makeError(ErrorKind::Transport, "read: connection lost"));
    t.check(f.client.waitForReconnect(kWait), "reconnect should finish");
    t.check(f.factory->connectCalls() == 2, "matching error should reconnect once");
    t.check(f.sessionId() == 2, "reconnect should install a new session");

    ClientOptions never;
    never.is_transport_lost = [](const Error &) { return false; };
    Fixture g(never);
    g.client.connectionLostHandler(makeError(ErrorKind::TransportLost, "eof"));
    t.check(g.client.waitForReconnect(kWait), "supervisor should be idle");
    t.check(g.factory->connectCalls() == 1, "custom predicate should be honoured");
}

void test_operation_without_session(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/late.txt", "l");
    auto factory = std::make_shared<MockSessionFactory>(fs);
    ResilientSftpClient client(factory);

    Error err;
    t.check(!client.removeFile("/late.txt", err), "no session: operation should fail");
    t.check(err.kind == ErrorKind::TransportLost &&
                err.message == "connection lost: no active session",
            "no session should be reported as a lost connection");
    t.check(client.waitForReconnect(kWait), "background connect should finish");
    t.check(client.isConnected(), "the failure should have triggered a connect");
    err.clear();
    t.check(client.removeFile("/late.txt", err), "next call should use the new session");
}

void test_close(TestContext &t) {
    Fixture f;
    auto s = f.session();
    f.client.close();
    t.check(!f.client.isConnected(), "close should drop the session");
    t.check(s && !s->isOpen(), "close should close the session");
    t.check(f.client.supervisor().state() == ReconnectSupervisor::State::Stopped,
            "close should stop the supervisor");

    Error err;
    t.check(!f.client.moveFile("/a", "/b", err), "operations fail after close");
    t.check(f.client.supervisor().attempts() == 0, "no reconnect after close");
    f.client.close();
}

} // namespace

int main() {
    qInstallMessageHandler(captureMessages);

    TestContext t;
    test_error_basics(t);
    test_config_defaults(t);
    test_join_remote_path(t);
    test_remote_ancestors(t);
    test_cancel_after(t);
    test_host_key_blob_and_fingerprint(t);
    test_host_key_verdicts(t);
    test_unpinned_connect_warns(t);
    test_pinned_connect(t);
    test_validate_config(t);
    test_parse_port(t);
    test_config_from_environment(t);
    test_parse_delimited(t);
    test_walker_preorder(t);
    test_walker_skip_dir(t);
    test_walker_missing_root(t);
    test_walk_files_reports_example(t);
    test_walk_files_counts(t);
    test_walk_files_partial_on_error(t);
    test_walk_files_missing_root(t);
    test_walk_files_cancel(t);
    test_open_file(t);
    test_get_records(t);
    test_files_listing(t);
    test_move_and_remove(t);
    test_put_string_creates_ancestors(t);
    test_put_string_errors(t);
    test_put_file_and_get_file(t);
    test_connection_lost_classification(t);
    test_handler_forwards_only_lost_connections(t);
    test_operation_without_session(t);
    test_close(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] resftp_core_tests\n";
    return EXIT_SUCCESS;
}
