// Logging categories used across the core.
#pragma once
#include <QLoggingCategory>
#include <QString>

#include <string>

Q_DECLARE_LOGGING_CATEGORY(rsSession)
Q_DECLARE_LOGGING_CATEGORY(rsReconnect)
Q_DECLARE_LOGGING_CATEGORY(rsClient)

namespace resftp {

// Remote path for log output; masked unless sensitive logging is enabled.
QString logPath(const std::string &path);

inline QString qs(const std::string &s) { return QString::fromStdString(s); }

} // namespace resftp
