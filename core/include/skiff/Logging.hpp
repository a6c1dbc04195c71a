// Logging categories for the core. Filter with QT_LOGGING_RULES, e.g.
//   QT_LOGGING_RULES="skiff.transfer.debug=true"
#pragma once
#include <QLoggingCategory>
#include <string>

Q_DECLARE_LOGGING_CATEGORY(skXfer)
Q_DECLARE_LOGGING_CATEGORY(skConn)
Q_DECLARE_LOGGING_CATEGORY(skList)
Q_DECLARE_LOGGING_CATEGORY(skNet)

namespace skiff {

// Host/user as they may appear in logs: verbatim only when sensitive logging
// is enabled (see RuntimeLogging.hpp), otherwise redacted.
QString loggable(const std::string& value);

} // namespace skiff
