#include "logging.h"

#include "apppaths.h"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QStringConverter>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

static QMutex g_logMutex;
static bool g_initialized = false;
static bool g_verbose = false;

void Logging::init(bool verbose)
{
    g_verbose = verbose;
    if (g_initialized)
        return;
    g_initialized = true;
    qInstallMessageHandler(&Logging::messageHandler);
}

static QString levelToString(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARN";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "FATAL";
    default:
        return "LOG";
    }
}

static QString formatLine(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const auto ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    auto line = QString("%1 [%2] %3").arg(ts, levelToString(type), msg);
    if (context.file && context.line > 0)
        line += QString(" (%1:%2)").arg(QString::fromUtf8(context.file)).arg(context.line);
    return line;
}

void Logging::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QMutexLocker locker(&g_logMutex);

    const auto line = formatLine(type, context, msg);

    if (g_verbose || type == QtFatalMsg) {
        std::fputs(qUtf8Printable(line), stderr);
        std::fputc('\n', stderr);
    }

    QFile file(AppPaths::logFilePath());
    if (file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        QTextStream out(&file);
        out.setEncoding(QStringConverter::Utf8);
        out << line << "\n";
    }

    if (type == QtFatalMsg)
        abort();
}
