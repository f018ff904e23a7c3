#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QStringList>

#include <cstdio>

Q_LOGGING_CATEGORY(lanmailDiscoveryLog, "lanmail.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lanmailMessagingLog, "lanmail.messaging", QtInfoMsg)
Q_LOGGING_CATEGORY(lanmailNodeLog, "lanmail.node", QtInfoMsg)

namespace lanmail::app {
namespace {

QChar level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1Char('D');
        case QtInfoMsg: return QLatin1Char('I');
        case QtWarningMsg: return QLatin1Char('W');
        case QtCriticalMsg: return QLatin1Char('C');
        case QtFatalMsg: return QLatin1Char('F');
    }
    return QLatin1Char('?');
}

class LogSink {
public:
    void open(const QString& path) {
        QMutexLocker lock(&mu_);
        file_.close();
        if (path.isEmpty()) return;

        QDir().mkpath(QFileInfo(path).absolutePath());
        rotate_if_large(path);

        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "lanmail: cannot open log file %s: %s\n",
                         qPrintable(path), qPrintable(file_.errorString()));
        }
    }

    void write(const QByteArray& line) {
        QMutexLocker lock(&mu_);
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }

private:
    static void rotate_if_large(const QString& path) {
        const QFileInfo info(path);
        if (!info.exists() || info.size() <= kMaxLogFileBytes) return;

        const auto previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        if (!QFile::rename(path, previous)) {
            std::fprintf(stderr, "lanmail: cannot rotate log file %s\n", qPrintable(path));
        }
    }

    QMutex mu_;
    QFile file_;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

void handle_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    sink().write((format_log_line(type, ctx.category, msg) + QLatin1Char('\n')).toUtf8());
}

} // namespace

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return {};
    }
    return QDir(base).filePath(QStringLiteral("logs/lanmail.log"));
}

QString format_log_line(QtMsgType type, const char* category, const QString& message) {
    return QStringLiteral("%1 %2 %3 %4")
        .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
        .arg(level_letter(type))
        .arg(category ? QString::fromLatin1(category) : QStringLiteral("default"))
        .arg(message);
}

void install_file_logging(const QString& path) {
    sink().open(path.isEmpty() ? default_log_file_path() : path);
    qInstallMessageHandler(handle_message);
}

void enable_debug_categories(bool discovery, bool messaging) {
    QStringList rules;
    if (discovery) {
        rules << QStringLiteral("lanmail.discovery.debug=true");
    }
    if (messaging) {
        rules << QStringLiteral("lanmail.messaging.debug=true")
              << QStringLiteral("lanmail.node.debug=true");
    }
    if (!rules.isEmpty()) {
        QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
    }
}

} // namespace lanmail::app
