#include "core/logging.h"
#include "core/terminal.h"
#include "password/commonpasswords.h"
#include "password/passwordcheckoptions.h"
#include "password/passwordreport.h"
#include "password/passwordstrength.h"

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName("PasswordCheck");
    QCoreApplication::setApplicationName("PasswordCheck");
    QCoreApplication::setApplicationVersion("1.0");

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);

    QString error;
    const auto options = parsePasswordCheckOptions(app.arguments(), &error);
    if (!options.has_value()) {
        err << error << "\n" << "Try '--help' for more information.\n";
        return 2;
    }

    if (options->helpRequested) {
        out << options->helpText;
        return 0;
    }
    if (options->versionRequested) {
        out << QCoreApplication::applicationName() << " " << QCoreApplication::applicationVersion() << "\n";
        return 0;
    }

    Logging::init(options->verbose);

    const auto common = CommonPasswords::load(resolveCommonListPath(*options));

    QString password;
    if (options->password.has_value()) {
        password = options->password.value();
    } else {
        const auto entered = Terminal::readHiddenLine("Enter a password to check: ");
        if (!entered.has_value()) {
            qWarning() << "no password read from stdin";
            err << "No password entered.\n";
            return 1;
        }
        password = entered.value();
    }

    const auto result = evaluatePasswordStrength(password, common);
    qInfo().noquote() << QString("evaluated password of length %1: score %2 (%3)")
                             .arg(password.toUcs4().size())
                             .arg(result.score)
                             .arg(ratingLabel(result.rating));

    out << formatPasswordReport(password, result, options->showPassword) << "\n";
    return 0;
}
