#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

Q_LOGGING_CATEGORY(strataMigrateLog, "strata.migrate")
Q_LOGGING_CATEGORY(strataStorageLog, "strata.storage")

namespace strata {
namespace {

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

bool is_strata_category(const char* category) {
    return category && qstrncmp(category, "strata.", 7) == 0;
}

struct FileSink {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

FileSink& sink() {
    static FileSink s;
    return s;
}

void forward_and_record(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        previous = s.previous;
        if (s.file.isOpen() && is_strata_category(ctx.category)) {
            const auto line = QStringLiteral("%1 %2 %3 %4\n")
                                  .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                                       QString(QChar::fromLatin1(level_letter(type))),
                                       QString::fromLatin1(ctx.category),
                                       msg);
            s.file.write(line.toUtf8());
            s.file.flush();
        }
    }
    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging() {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (s.installed) return;

    const auto path = log_file_path();
    if (path.isEmpty()) return;

    QDir(QFileInfo(path).absolutePath()).mkpath(QStringLiteral("."));
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        const auto reason = s.file.errorString();
        lock.unlock();
        qCWarning(strataStorageLog) << "cannot open log file" << path << ":" << reason;
        return;
    }
    s.installed = true;
    s.previous = qInstallMessageHandler(forward_and_record);
}

void uninstall_file_logging() {
    auto& s = sink();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        if (!s.installed) return;
        s.installed = false;
        previous = s.previous;
        s.previous = nullptr;
        s.file.close();
    }
    qInstallMessageHandler(previous);
}

QString log_file_path() {
    return qEnvironmentVariable("STRATA_LOG_FILE");
}

bool migration_debug_enabled() {
    return qEnvironmentVariableIsSet("STRATA_DEBUG_MIGRATIONS");
}

} // namespace strata
