#pragma once

#include <QString>
#include <QStringList>

#include <optional>

struct PasswordCheckOptions final
{
    std::optional<QString> password;
    bool showPassword = false;
    QString commonListPath;
    bool verbose = false;

    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;
};

// arguments[0] is the program name, as in QCoreApplication::arguments().
// Returns nullopt on unknown options or stray positional arguments.
std::optional<PasswordCheckOptions> parsePasswordCheckOptions(const QStringList &arguments, QString *errorOut = nullptr);

// Explicit --common-list wins; otherwise the per-user list if it exists.
QString resolveCommonListPath(const PasswordCheckOptions &options);
