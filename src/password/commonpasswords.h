#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>

// Known-weak passwords, lower-cased. Iteration follows insertion order so that
// capped scans over the list are reproducible.
class CommonPasswordSet final
{
public:
    CommonPasswordSet() = default;
    explicit CommonPasswordSet(const QStringList &passwords);

    bool contains(const QString &password) const;
    QString firstContainedIn(const QString &text, int minLength, int maxCandidates) const;

    const QStringList &entries() const { return entries_; }
    int size() const { return static_cast<int>(entries_.size()); }
    bool isEmpty() const { return entries_.isEmpty(); }

private:
    QStringList entries_;
    QSet<QString> index_;
};

namespace CommonPasswords {

QStringList builtinSeed();

// One password per line. Blank lines and lines starting with '#' are skipped;
// the rest are trimmed and lower-cased.
QStringList parseList(const QString &text);

std::optional<QStringList> readListFile(const QString &path, QString *errorOut = nullptr);

// Seed set plus the contents of path. Falls back to the seed set alone when
// path is empty, missing or unreadable.
CommonPasswordSet load(const QString &path = QString());

} // namespace CommonPasswords
