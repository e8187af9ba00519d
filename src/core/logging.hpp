#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(pairlinkDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkClientsLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkTrustLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkServerLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkConnectLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkIdentityLog)
Q_DECLARE_LOGGING_CATEGORY(pairlinkStorageLog)

namespace pairlink {

// Route Qt messages to <log_dir>/pairlink.log, and to stderr when
// `mirror_to_stderr` is set or the file cannot be opened. Calling again
// switches the directory or the mirror.
void install_file_logging(const QString& log_dir, bool mirror_to_stderr = true);

// The open log file, or empty.
QString log_file_path();

// Turns on debug output for every pairlink.* category.
void enable_debug_logging();

} // namespace pairlink
