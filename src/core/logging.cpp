#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(scoutDiscoveryLog, "scout.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(scoutWireLog, "scout.wire", QtInfoMsg)
Q_LOGGING_CATEGORY(scoutTransportLog, "scout.transport", QtInfoMsg)

namespace scout {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "scout: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

void install_message_handler(const QString& log_file_path) {
    open_log_file(state(), log_file_path);
    qInstallMessageHandler(message_handler);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("scout.*.debug=true"));
}

bool debug_logging_requested() {
    if (!qEnvironmentVariableIsSet("SCOUT_DEBUG_DISCOVERY")) {
        return false;
    }
    return qEnvironmentVariable("SCOUT_DEBUG_DISCOVERY").trimmed() != QStringLiteral("0");
}

} // namespace scout
