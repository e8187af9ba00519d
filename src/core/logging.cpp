#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>

#include <cstdio>

Q_LOGGING_CATEGORY(pairlinkDiscoveryLog, "pairlink.discovery")
Q_LOGGING_CATEGORY(pairlinkClientsLog, "pairlink.clients")
Q_LOGGING_CATEGORY(pairlinkTrustLog, "pairlink.trust")
Q_LOGGING_CATEGORY(pairlinkServerLog, "pairlink.server")
Q_LOGGING_CATEGORY(pairlinkConnectLog, "pairlink.connect")
Q_LOGGING_CATEGORY(pairlinkIdentityLog, "pairlink.identity")
Q_LOGGING_CATEGORY(pairlinkStorageLog, "pairlink.storage")

namespace pairlink {
namespace {

struct LogSink {
    QMutex mu;
    QFile file;
    bool mirror = true;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

char level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

// "<utc iso time> <level> <category> <message>"
void write_line(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                               QString(QChar::fromLatin1(level_letter(type))),
                               QString::fromLatin1(ctx.category ? ctx.category : "default"),
                               msg)
                          .toUtf8();

    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
    if (s.mirror || !s.file.isOpen()) {
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }
}

} // namespace

void install_file_logging(const QString& log_dir, bool mirror_to_stderr) {
    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        s.mirror = mirror_to_stderr;

        const auto path = log_dir.isEmpty() ? QString{} : QDir(log_dir).filePath(QStringLiteral("pairlink.log"));
        if (s.file.fileName() != path) {
            s.file.close();
            s.file.setFileName(path);
            if (!path.isEmpty() && QDir().mkpath(log_dir) &&
                !s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "pairlink: cannot open log file %s\n", qPrintable(path));
            }
        }
    }
    qInstallMessageHandler(write_line);
}

QString log_file_path() {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("pairlink.*.debug=true\n"));
}

} // namespace pairlink
