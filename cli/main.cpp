// resftp command-line tool: one remote operation per invocation.
// Connection settings come from RESFTP_* environment variables and can be
// overridden with flags; the password is only read from RESFTP_PASS.
#include "resftp/Config.hpp"
#include "resftp/Libssh2Session.hpp"
#include "resftp/Logging.hpp"
#include "resftp/ResilientSftpClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStringList>
#include <QTextStream>

#include <cstdlib>
#include <memory>

namespace {

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &errOut() {
    static QTextStream s(stderr);
    return s;
}

int fail(const resftp::Error &err) {
    errOut() << "error (" << resftp::errorKindName(err.kind)
             << "): " << QString::fromStdString(err.message) << Qt::endl;
    return EXIT_FAILURE;
}

int usage(const QCommandLineParser &parser) {
    errOut() << parser.helpText();
    return 2;
}

std::string arg(const QStringList &args, int i) {
    return args.at(i).toStdString();
}

int runCommand(resftp::ResilientSftpClient &client, const QStringList &args,
               const QCommandLineParser &parser) {
    const QString cmd = args.value(0);
    resftp::Error err;

    if (cmd == "ls" && args.size() == 2) {
        const auto entries = client.files(arg(args, 1), &err);
        if (!err.ok())
            return fail(err);
        for (const auto &e : entries) {
            out() << (e.is_dir ? "d " : "- ") << qSetFieldWidth(12)
                  << static_cast<qulonglong>(e.size) << qSetFieldWidth(0) << ' '
                  << QString::fromStdString(e.name) << Qt::endl;
        }
        return EXIT_SUCCESS;
    }
    if (cmd == "walk" && args.size() == 2) {
        std::vector<std::string> paths;
        const bool ok = client.walkFiles(arg(args, 1), paths, err);
        for (const auto &p : paths)
            out() << QString::fromStdString(p) << Qt::endl;
        return ok ? EXIT_SUCCESS : fail(err);
    }
    if (cmd == "cat" && args.size() == 2) {
        auto file = client.openFile(arg(args, 1), err);
        if (!file)
            return fail(err);
        std::string text;
        if (!resftp::readAll(*file, text, err))
            return fail(err);
        out() << QString::fromStdString(text);
        out().flush();
        return file->close(err) ? EXIT_SUCCESS : fail(err);
    }
    if (cmd == "records" && args.size() == 2) {
        resftp::Records rows;
        if (!client.getRecords(arg(args, 1), resftp::delimitedRecordParser(),
                               rows, err))
            return fail(err);
        for (const auto &row : rows) {
            QStringList fields;
            for (const auto &f : row)
                fields << QString::fromStdString(f);
            out() << fields.join(QLatin1Char('\t')) << Qt::endl;
        }
        return EXIT_SUCCESS;
    }
    if (cmd == "put" && args.size() == 3) {
        return client.putFile(arg(args, 1), arg(args, 2), err) ? EXIT_SUCCESS
                                                               : fail(err);
    }
    if (cmd == "put-string" && args.size() == 3) {
        return client.putString(arg(args, 1), arg(args, 2), err) ? EXIT_SUCCESS
                                                                 : fail(err);
    }
    if (cmd == "get" && args.size() == 3) {
        return client.getFile(arg(args, 1), arg(args, 2), err) ? EXIT_SUCCESS
                                                               : fail(err);
    }
    if (cmd == "mv" && args.size() == 3) {
        return client.moveFile(arg(args, 1), arg(args, 2), err) ? EXIT_SUCCESS
                                                                : fail(err);
    }
    if (cmd == "rm" && args.size() == 2) {
        return client.removeFile(arg(args, 1), err) ? EXIT_SUCCESS : fail(err);
    }
    return usage(parser);
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("resftp");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Remote file operations over SFTP with automatic reconnect.\n"
        "Commands: ls DIR | walk DIR | cat FILE | records FILE |\n"
        "          put LOCAL REMOTE | put-string TEXT REMOTE |\n"
        "          get REMOTE LOCAL | mv SRC DST | rm PATH");
    parser.addHelpOption();
    const QCommandLineOption hostOpt("host", "Server host (RESFTP_HOST).", "host");
    const QCommandLineOption portOpt("port", "Server port (RESFTP_PORT).", "port");
    const QCommandLineOption userOpt("user", "User name (RESFTP_USER).", "user");
    const QCommandLineOption keyOpt(
        "trusted-key",
        "Pinned host key \"<type> <base64>\" (RESFTP_TRUSTED_HOST_KEY).", "key");
    const QCommandLineOption timeoutOpt(
        "timeout", "Per-call session timeout in seconds (default: none).",
        "seconds");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging.");
    parser.addOptions({hostOpt, portOpt, userOpt, keyOpt, timeoutOpt, verboseOpt});
    parser.addPositionalArgument("command", "Operation to run.");
    parser.addPositionalArgument("args", "Operation arguments.", "[args...]");
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOpt)
                                         ? QStringLiteral("resftp.*.debug=true")
                                         : QStringLiteral("resftp.*.debug=false"));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usage(parser);

    resftp::Config cfg;
    std::string cfgErr;
    if (!resftp::loadConfigFromEnvironment(cfg, cfgErr)) {
        errOut() << QString::fromStdString(cfgErr) << Qt::endl;
        return 2;
    }
    if (parser.isSet(hostOpt))
        cfg.host = parser.value(hostOpt).toStdString();
    if (parser.isSet(userOpt))
        cfg.username = parser.value(userOpt).toStdString();
    if (parser.isSet(keyOpt))
        cfg.trusted_host_key = parser.value(keyOpt).toStdString();
    if (parser.isSet(portOpt) &&
        !resftp::parsePort(parser.value(portOpt).toStdString(), cfg.port)) {
        errOut() << "invalid --port" << Qt::endl;
        return 2;
    }
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        const int secs = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || secs < 0) {
            errOut() << "invalid --timeout" << Qt::endl;
            return 2;
        }
        cfg.session_timeout = std::chrono::seconds(secs);
    }
    if (!resftp::validateConfig(cfg, cfgErr)) {
        errOut() << QString::fromStdString(cfgErr) << Qt::endl;
        return 2;
    }

    auto factory = std::make_shared<resftp::Libssh2SessionFactory>(cfg);
    resftp::ResilientSftpClient client(factory);
    resftp::Error err;
    if (!client.connect(err)) {
        qCCritical(rsClient) << "initial connect failed; giving up";
        return fail(err);
    }
    const int rc = runCommand(client, args, parser);
    client.close();
    return rc;
}
