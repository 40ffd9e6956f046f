#include "passwordnormalizer.h"

namespace PasswordNormalizer {

const QVector<QPair<QChar, QChar>> &substitutionTable()
{
    static const QVector<QPair<QChar, QChar>> kTable = {
        {'@', 'a'},
        {'0', 'o'},
        {'1', 'l'},
        {'!', 'i'},
        {'$', 's'},
        {'3', 'e'},
        {'5', 's'},
        {'7', 't'},
    };
    return kTable;
}

QString normalize(const QString &password)
{
    auto s = password.trimmed().toLower();
    for (const auto &sub : substitutionTable())
        s.replace(sub.first, sub.second);
    return s;
}

} // namespace PasswordNormalizer
