#include "passwordpatterns.h"

#include <QRegularExpression>
#include <QVector>

#include <algorithm>

namespace PasswordPatterns {

namespace {

QString reversed(QString s)
{
    std::reverse(s.begin(), s.end());
    return s;
}

bool isStepRun(const QVector<uint> &codes, int start, int length, int step)
{
    for (int j = start + 1; j < start + length; ++j) {
        if (static_cast<qint64>(codes.at(j)) - static_cast<qint64>(codes.at(j - 1)) != step)
            return false;
    }
    return true;
}

} // namespace

const QStringList &keyboardRows()
{
    static const QStringList kRows = {
        "qwertyuiop",
        "asdfghjkl",
        "zxcvbnm",
        "1234567890",
    };
    return kRows;
}

bool hasKeyboardSequence(const QString &lower, int minLength)
{
    if (minLength <= 0)
        return false;

    for (const auto &row : keyboardRows()) {
        for (int i = 0; i + minLength <= row.size(); ++i) {
            const auto chunk = row.mid(i, minLength);
            if (lower.contains(chunk) || lower.contains(reversed(chunk)))
                return true;
        }
    }
    return false;
}

bool hasMonotonicSequence(const QString &text, int minLength)
{
    if (minLength <= 1)
        return false;

    const auto codes = text.toUcs4();
    if (codes.size() < minLength)
        return false;

    for (int i = 0; i + minLength <= codes.size(); ++i) {
        if (isStepRun(codes, i, minLength, 1) || isStepRun(codes, i, minLength, -1))
            return true;
    }
    return false;
}

RepeatedRun findRepeatedRun(const QString &text, int minLength)
{
    const auto codes = text.toUcs4();

    int i = 0;
    while (i < codes.size()) {
        int j = i + 1;
        while (j < codes.size() && codes.at(j) == codes.at(i))
            ++j;

        const auto length = j - i;
        if (codes.at(i) != '\n' && length >= minLength)
            return {true, length};

        i = j;
    }
    return {};
}

bool matchesWordDigitsTemplate(const QString &password)
{
    static const QRegularExpression kTemplate(
        QRegularExpression::anchoredPattern(QStringLiteral("[A-Za-z]+[0-9]{1,4}[!@#$%]?")));
    return kTemplate.match(password).hasMatch();
}

} // namespace PasswordPatterns
