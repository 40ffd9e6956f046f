#include "commonpasswords.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

CommonPasswordSet::CommonPasswordSet(const QStringList &passwords)
{
    entries_.reserve(passwords.size());
    for (const auto &p : passwords) {
        const auto key = p.toLower();
        if (key.isEmpty() || index_.contains(key))
            continue;
        index_.insert(key);
        entries_.push_back(key);
    }
}

bool CommonPasswordSet::contains(const QString &password) const
{
    return index_.contains(password);
}

QString CommonPasswordSet::firstContainedIn(const QString &text, int minLength, int maxCandidates) const
{
    const auto limit = qMin(maxCandidates, static_cast<int>(entries_.size()));
    for (int i = 0; i < limit; ++i) {
        const auto &candidate = entries_.at(i);
        if (candidate.size() >= minLength && text.contains(candidate))
            return candidate;
    }
    return {};
}

namespace CommonPasswords {

QStringList builtinSeed()
{
    return {
        "password",
        "123456",
        "123456789",
        "qwerty",
        "letmein",
        "admin",
        "welcome",
        "iloveyou",
        "monkey",
        "football",
    };
}

QStringList parseList(const QString &text)
{
    QStringList out;

    auto body = text;
    if (!body.isEmpty() && body.at(0) == QChar(0xFEFF))
        body.remove(0, 1);

    body.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    body.replace('\r', '\n');

    const auto lines = body.split('\n');
    for (const auto &line : lines) {
        const auto p = line.trimmed();
        if (p.isEmpty() || p.startsWith('#'))
            continue;
        out.push_back(p.toLower());
    }

    return out;
}

std::optional<QStringList> readListFile(const QString &path, QString *errorOut)
{
    const auto fail = [&](const QString &msg) -> std::optional<QStringList> {
        if (errorOut)
            *errorOut = msg;
        return std::nullopt;
    };

    if (path.isEmpty())
        return fail("no path given");

    if (!QFileInfo::exists(path))
        return fail(QString("%1 does not exist").arg(path));

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return fail(QString("cannot open %1: %2").arg(path, file.errorString()));

    const auto data = file.readAll();
    if (file.error() != QFileDevice::NoError)
        return fail(QString("cannot read %1: %2").arg(path, file.errorString()));

    return parseList(QString::fromUtf8(data));
}

CommonPasswordSet load(const QString &path)
{
    auto passwords = builtinSeed();
    if (path.isEmpty())
        return CommonPasswordSet(passwords);

    QString error;
    const auto extra = readListFile(path, &error);
    if (!extra.has_value()) {
        qWarning().noquote() << "common password list unavailable, using built-in list:" << error;
        return CommonPasswordSet(passwords);
    }

    passwords.append(extra.value());
    const CommonPasswordSet set(passwords);
    qInfo().noquote() << QString("loaded %1 common passwords (%2 from %3)").arg(set.size()).arg(extra->size()).arg(path);
    return set;
}

} // namespace CommonPasswords
