#pragma once

#include <QChar>
#include <QPair>
#include <QString>
#include <QVector>

namespace PasswordNormalizer {

// Leetspeak and symbol substitutions, applied in this order.
const QVector<QPair<QChar, QChar>> &substitutionTable();

// Canonical form used for common-password comparisons only: trimmed,
// lower-cased, every substitution applied to the result of the previous one.
QString normalize(const QString &password);

} // namespace PasswordNormalizer
