#include "skiff/Logging.hpp"
#include "skiff/RuntimeLogging.hpp"

Q_LOGGING_CATEGORY(skXfer, "skiff.transfer")
Q_LOGGING_CATEGORY(skConn, "skiff.connection")
Q_LOGGING_CATEGORY(skList, "skiff.listing")
Q_LOGGING_CATEGORY(skNet, "skiff.network")

namespace skiff {

QString loggable(const std::string& value) {
    if (sensitiveLoggingEnabled())
        return QString::fromStdString(value);
    if (value.empty())
        return QStringLiteral("<empty>");
    return QStringLiteral("<redacted>");
}

} // namespace skiff
