// Integration tests for the libssh2 backend behind ResilientSftpClient,
// against a test SFTP server. Skipped (exit code 77) unless the required
// RESFTP_IT_* env vars exist.
#include "resftp/Config.hpp"
#include "resftp/Libssh2Session.hpp"
#include "resftp/RecordParsers.hpp"
#include "resftp/ResilientSftpClient.hpp"
#include "resftp/RuntimeEnv.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace resftp;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool listContainsName(const std::vector<FileInfo> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const FileInfo &e) { return e.name == name; });
}

} // namespace

int main() {
    const auto host = envValue("RESFTP_IT_SFTP_HOST");
    const auto user = envValue("RESFTP_IT_SFTP_USER");
    const auto pass = envValue("RESFTP_IT_SFTP_PASS");
    const std::string remoteBase =
        envValue("RESFTP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] resftp_sftp_integration_tests requires env vars: "
                  << "RESFTP_IT_SFTP_HOST, RESFTP_IT_SFTP_USER and "
                     "RESFTP_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    Config cfg;
    cfg.host = *host;
    cfg.username = *user;
    cfg.password = *pass;
    cfg.trusted_host_key =
        envValue("RESFTP_IT_TRUSTED_HOST_KEY").value_or(std::string());
    cfg.connect_timeout = std::chrono::seconds(10);
    cfg.session_timeout = std::chrono::seconds(30);
    if (const auto rawPort = envValue("RESFTP_IT_SFTP_PORT")) {
        if (!parsePort(*rawPort, cfg.port)) {
            std::cerr << "[FAIL] RESFTP_IT_SFTP_PORT is invalid\n";
            return EXIT_FAILURE;
        }
    }

    TestContext t;
    const std::string token = uniqueToken();
    const std::string suiteDir = joinRemotePath(remoteBase, "resftp-it-" + token);
    const std::string remoteText = joinRemotePath(suiteDir, "nested/deep/rows.csv");
    const std::string remoteBin = joinRemotePath(suiteDir, "payload.bin");
    const std::string remoteMoved = joinRemotePath(suiteDir, "payload-moved.bin");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("resftp-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }
    const fs::path localSrc = localTmpRoot / "payload.bin";
    const fs::path localDst = localTmpRoot / "payload-downloaded.bin";
    const std::string payload = "resftp integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    auto factory = std::make_shared<Libssh2SessionFactory>(cfg);
    ResilientSftpClient client(factory);
    Error err;

    t.check(client.connect(err), "connect should succeed: " + err.message);
    if (t.failures == 0) {
        err.clear();
        t.check(client.putString("id,name\n1,alpha\n", remoteText, err),
                "putString into new dirs should succeed: " + err.message);
    }
    if (t.failures == 0) {
        Records rows;
        err.clear();
        t.check(client.getRecords(remoteText, delimitedRecordParser(), rows, err),
                "getRecords should succeed: " + err.message);
        t.check(rows.size() == 2 && rows[1].size() == 2 && rows[1][1] == "alpha",
                "records should match the uploaded text");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.putFile(localSrc.string(), remoteBin, err),
                "putFile should succeed: " + err.message);
    }
    if (t.failures == 0) {
        err.clear();
        const auto entries = client.files(suiteDir, &err);
        t.check(listContainsName(entries, "payload.bin"),
                "files() should include payload.bin");
        t.check(listContainsName(entries, "nested"), "files() should include nested");
    }
    if (t.failures == 0) {
        std::vector<std::string> walked;
        err.clear();
        t.check(client.walkFiles(suiteDir, walked, err),
                "walkFiles should succeed: " + err.message);
        t.check(walked == std::vector<std::string>({remoteText, remoteBin}),
                "walkFiles should list both files depth-first by name");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.getFile(remoteBin, localDst.string(), err),
                "getFile should succeed: " + err.message);
        std::string downloaded;
        t.check(readFile(localDst, downloaded) && downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.moveFile(remoteBin, remoteMoved, err),
                "moveFile should succeed: " + err.message);
        err.clear();
        t.check(!client.openFile(remoteBin, err),
                "old path should not exist after the move");
    }
    if (t.failures == 0) {
        // Drop the session underneath the client; the next call fails and
        // the supervisor dials a replacement.
        if (auto s = client.supervisor().currentSession())
            s->close();
        err.clear();
        t.check(!client.removeFile(remoteMoved, err),
                "remove on a closed session should fail");
        t.check(isConnectionLost(err), "closed session should read as a lost connection");
        t.check(client.waitForReconnect(std::chrono::seconds(30)),
                "reconnect should finish");
        t.check(client.isConnected(), "reconnect should restore the session");
        err.clear();
        t.check(client.removeFile(remoteMoved, err),
                "removeFile on the new session should succeed: " + err.message);
    }

    // Best-effort cleanup. The suite directories stay behind under remoteBase.
    Error cleanupErr;
    if (!client.removeFile(remoteText, cleanupErr))
        std::cerr << "[WARN] cleanup: " << cleanupErr.message << "\n";
    client.close();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] resftp_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
