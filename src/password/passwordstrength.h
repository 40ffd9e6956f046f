#pragma once

#include "commonpasswords.h"
#include "passwordentropy.h"

#include <QString>
#include <QStringList>
#include <QVector>

enum class PasswordRating : int
{
    VeryWeak = 0,
    Weak = 1,
    Moderate = 2,
    Strong = 3,
    VeryStrong = 4,
};

struct PasswordCheckResult final
{
    int score = 0; // 0~100
    PasswordRating rating = PasswordRating::VeryWeak;
    double entropyBits = 0.0;
    QStringList issues;
    QStringList suggestions;
};

// Everything a rule may look at, computed once per evaluation.
struct PasswordCheckContext final
{
    QString password;
    QString lower;
    QString normalized;
    int length = 0;
    PasswordEntropy::CharacterClasses classes;
    double entropyBits = 0.0;
    const CommonPasswordSet *common = nullptr;
};

struct PasswordRuleOutcome final
{
    int delta = 0;
    QStringList issues;
    QStringList suggestions;
};

using PasswordRule = PasswordRuleOutcome (*)(const PasswordCheckContext &context);

constexpr int kMaxCommonSubstringCandidates = 5000;
constexpr int kMinCommonSubstringLength = 6;

PasswordRating ratingForScore(int score);
QString ratingLabel(PasswordRating rating);

// Length, variety, common password, common substring, sequence, repeat,
// template and entropy rules, in that order.
const QVector<PasswordRule> &defaultPasswordRules();

PasswordCheckResult evaluatePasswordStrength(const QString &password, const CommonPasswordSet &common);
PasswordCheckResult evaluatePasswordStrength(const QString &password,
                                             const CommonPasswordSet &common,
                                             const QVector<PasswordRule> &rules);
