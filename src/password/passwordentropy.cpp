#include "passwordentropy.h"

#include <cmath>

namespace PasswordEntropy {

CharacterClasses classify(const QString &password)
{
    CharacterClasses classes;
    for (const auto &ch : password) {
        const auto c = ch.unicode();
        if (c >= 'a' && c <= 'z')
            classes.lower = true;
        else if (c >= 'A' && c <= 'Z')
            classes.upper = true;
        else if (c >= '0' && c <= '9')
            classes.digit = true;
        else
            classes.symbol = true;
    }
    return classes;
}

int poolSize(const CharacterClasses &classes)
{
    int pool = 0;
    if (classes.lower)
        pool += kLowerPool;
    if (classes.upper)
        pool += kUpperPool;
    if (classes.digit)
        pool += kDigitPool;
    if (classes.symbol)
        pool += kSymbolPool;
    return pool;
}

double estimateBits(const QString &password)
{
    if (password.isEmpty())
        return 0.0;

    const auto pool = poolSize(classify(password));
    if (pool == 0)
        return 0.0;

    const auto length = password.toUcs4().size();
    return static_cast<double>(length) * std::log2(static_cast<double>(pool));
}

} // namespace PasswordEntropy
