#include "passwordcheckoptions.h"

#include "core/apppaths.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFileInfo>

std::optional<PasswordCheckOptions> parsePasswordCheckOptions(const QStringList &arguments, QString *errorOut)
{
    const auto fail = [&](const QString &msg) -> std::optional<PasswordCheckOptions> {
        if (errorOut)
            *errorOut = msg;
        return std::nullopt;
    };

    QCommandLineParser parser;
    parser.setApplicationDescription("Password Strength Checker");
    const auto helpOption = parser.addHelpOption();
    // -v belongs to --verbose, so --version is registered without a short name.
    const QCommandLineOption versionOption("version", "Displays version information.");

    const QCommandLineOption passwordOption(QStringList{"p", "password"},
                                                       "Password string (avoid using this on shared machines).",
                                                       "password");
    const QCommandLineOption showOption("show", "Show the password in output (default hides it).");
    const QCommandLineOption commonListOption("common-list", "Path to a common passwords list.", "path");
    const QCommandLineOption verboseOption(QStringList{"v", "verbose"}, "Echo log messages to stderr.");
    for (const auto &option : {versionOption, passwordOption, showOption, commonListOption, verboseOption}) {
        if (!parser.addOption(option))
            return fail(QString("cannot register option --%1").arg(option.names().constLast()));
    }

    if (!parser.parse(arguments))
        return fail(parser.errorText());

    if (!parser.positionalArguments().isEmpty())
        return fail(QString("unexpected argument: %1").arg(parser.positionalArguments().constFirst()));

    PasswordCheckOptions options;
    options.helpRequested = parser.isSet(helpOption);
    options.versionRequested = parser.isSet(versionOption);
    options.helpText = parser.helpText();
    if (parser.isSet(passwordOption))
        options.password = parser.value(passwordOption);
    options.showPassword = parser.isSet(showOption);
    options.commonListPath = parser.value(commonListOption);
    options.verbose = parser.isSet(verboseOption);
    return options;
}

QString resolveCommonListPath(const PasswordCheckOptions &options)
{
    if (!options.commonListPath.isEmpty())
        return options.commonListPath;

    const auto fallback = AppPaths::commonListFilePath();
    if (QFileInfo::exists(fallback))
        return fallback;
    return {};
}
