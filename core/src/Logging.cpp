#include "resftp/Logging.hpp"
#include "resftp/RuntimeEnv.hpp"

Q_LOGGING_CATEGORY(rsSession, "resftp.session")
Q_LOGGING_CATEGORY(rsReconnect, "resftp.reconnect")
Q_LOGGING_CATEGORY(rsClient, "resftp.client")

namespace resftp {

QString logPath(const std::string &path) {
    static const bool sensitive = sensitiveLoggingEnabled();
    if (sensitive)
        return QString::fromStdString(path);
    return QStringLiteral("<path:%1 bytes>").arg(path.size());
}

} // namespace resftp
