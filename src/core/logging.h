#pragma once

#include <QtGlobal>

class QMessageLogContext;
class QString;

class Logging final
{
public:
    // Routes qDebug()/qInfo()/qWarning() into the log file. With verbose set,
    // every line is echoed to stderr as well.
    static void init(bool verbose = false);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
};
