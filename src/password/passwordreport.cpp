#include "passwordreport.h"

#include <QStringList>

QString formatEntropyBits(double bits)
{
    auto text = QString::number(bits, 'f', 2);
    while (text.endsWith('0') && !text.endsWith(".0"))
        text.chop(1);
    return text;
}

QString formatPasswordReport(const QString &password, const PasswordCheckResult &result, bool showPassword)
{
    const auto display = showPassword ? password : QString(password.toUcs4().size(), '*');

    QStringList lines;
    lines << "Password Strength Report";
    lines << QString(26, '-');
    lines << QString("Password: %1").arg(display);
    lines << QString("Score:    %1/100").arg(result.score);
    lines << QString("Rating:   %1").arg(ratingLabel(result.rating));
    lines << QString("Entropy:  ~%1 bits (rough estimate)").arg(formatEntropyBits(result.entropyBits));
    lines << QString();

    if (!result.issues.isEmpty()) {
        lines << "Issues found:";
        for (const auto &issue : result.issues)
            lines << QString(" - %1").arg(issue);
        lines << QString();
    } else {
        lines << "Issues found: none";
        lines << QString();
    }

    if (!result.suggestions.isEmpty()) {
        lines << "Suggestions:";
        for (const auto &s : result.suggestions)
            lines << QString(" - %1").arg(s);
        lines << QString();
    }

    return lines.join('\n');
}
