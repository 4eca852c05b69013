#include "cli/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(uuidv47CliLog, "uuidv47.cli")

namespace uuidv47::cli {
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
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    const auto path = log_file_path();
    if (path.isEmpty()) {
        return;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "uuidv47: cannot open log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

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

void install_logging(bool verbose) {
    const bool debug = verbose || qEnvironmentVariableIntValue("UUIDV47_DEBUG") != 0;
    QLoggingCategory::setFilterRules(debug
        ? QStringLiteral("uuidv47.*.debug=true\n")
        : QStringLiteral("uuidv47.*.debug=false\nuuidv47.*.info=false\n"));
    qInstallMessageHandler(message_handler);
}

QString log_file_path() {
    return qEnvironmentVariable("UUIDV47_LOG_FILE");
}

} // namespace uuidv47::cli
