#include "apppaths.h"

#include <QDir>
#include <QStandardPaths>

QString AppPaths::appDataDir()
{
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(base);
    return base;
}

QString AppPaths::commonListFilePath()
{
    return QDir(appDataDir()).filePath("common_passwords.txt");
}

QString AppPaths::logFilePath()
{
    const auto logsDir = QDir(appDataDir()).filePath("logs");
    QDir().mkpath(logsDir);
    return QDir(logsDir).filePath("password_check.log");
}
