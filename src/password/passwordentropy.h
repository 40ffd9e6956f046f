#pragma once

#include <QString>

namespace PasswordEntropy {

constexpr int kLowerPool = 26;
constexpr int kUpperPool = 26;
constexpr int kDigitPool = 10;
constexpr int kSymbolPool = 33;

struct CharacterClasses final
{
    bool lower = false;
    bool upper = false;
    bool digit = false;
    bool symbol = false;

    int count() const { return (lower ? 1 : 0) + (upper ? 1 : 0) + (digit ? 1 : 0) + (symbol ? 1 : 0); }
};

// ASCII classes; anything outside [A-Za-z0-9] counts as a symbol.
CharacterClasses classify(const QString &password);

int poolSize(const CharacterClasses &classes);

// length * log2(pool). A coarse upper bound, not a guessing-entropy measure.
double estimateBits(const QString &password);

} // namespace PasswordEntropy
