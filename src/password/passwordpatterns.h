#pragma once

#include <QString>
#include <QStringList>

namespace PasswordPatterns {

constexpr int kMinSequenceLength = 4;
constexpr int kMinRepeatLength = 4;

struct RepeatedRun final
{
    bool found = false;
    int length = 0;
};

const QStringList &keyboardRows();

// Any window of a keyboard row (or its reverse) contained in the text.
// Expects lower-cased input.
bool hasKeyboardSequence(const QString &lower, int minLength = kMinSequenceLength);

// Any window whose code points rise or fall by exactly one each step
// ("abcd", "4321").
bool hasMonotonicSequence(const QString &text, int minLength = kMinSequenceLength);

// Leftmost run of identical characters at least minLength long.
RepeatedRun findRepeatedRun(const QString &text, int minLength = kMinRepeatLength);

// Whole-string "letters + 1-4 digits + optional one of !@#$%".
bool matchesWordDigitsTemplate(const QString &password);

} // namespace PasswordPatterns
