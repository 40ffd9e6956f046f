#include "passwordstrength.h"

#include "passwordnormalizer.h"
#include "passwordpatterns.h"

#include <QSet>

#include <cmath>

namespace {

PasswordRuleOutcome lengthRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (ctx.length >= 16) {
        out.delta = 40;
    } else if (ctx.length >= 12) {
        out.delta = 30;
    } else if (ctx.length >= 10) {
        out.delta = 20;
    } else if (ctx.length >= 8) {
        out.delta = 10;
    } else {
        out.issues << "Too short (aim for at least 12 characters).";
        out.suggestions << "Use 12–16+ characters (a passphrase works well).";
    }
    return out;
}

PasswordRuleOutcome varietyRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    out.delta = ctx.classes.count() * 10;

    if (!ctx.classes.lower) {
        out.issues << "No lowercase letters.";
        out.suggestions << "Add lowercase letters (a–z).";
    }
    if (!ctx.classes.upper) {
        out.issues << "No uppercase letters.";
        out.suggestions << "Add uppercase letters (A–Z).";
    }
    if (!ctx.classes.digit) {
        out.issues << "No digits.";
        out.suggestions << "Add digits (0–9).";
    }
    if (!ctx.classes.symbol) {
        out.issues << "No symbols.";
        out.suggestions << "Add symbols (e.g., !@#$%).";
    }
    return out;
}

PasswordRuleOutcome commonPasswordRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (ctx.common && ctx.common->contains(ctx.normalized)) {
        out.delta = -40;
        out.issues << "Appears in common password lists.";
        out.suggestions << "Avoid common passwords; use a unique passphrase.";
    }
    return out;
}

PasswordRuleOutcome commonSubstringRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (!ctx.common)
        return out;

    const auto word = ctx.common->firstContainedIn(ctx.normalized,
                                                   kMinCommonSubstringLength,
                                                   kMaxCommonSubstringCandidates);
    if (!word.isEmpty()) {
        out.delta = -20;
        out.issues << "Contains a common password word/pattern.";
        out.suggestions << "Remove common words (e.g., 'password', 'admin') and use a unique phrase.";
    }
    return out;
}

PasswordRuleOutcome sequenceRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (PasswordPatterns::hasKeyboardSequence(ctx.lower) || PasswordPatterns::hasMonotonicSequence(ctx.lower)) {
        out.delta = -15;
        out.issues << "Contains an easy sequence (keyboard or ordered characters).";
        out.suggestions << "Avoid sequences like 1234, abcd, qwer.";
    }
    return out;
}

PasswordRuleOutcome repeatRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    const auto run = PasswordPatterns::findRepeatedRun(ctx.password);
    if (run.found) {
        out.delta = -10;
        out.issues << QString("Contains repeated characters (e.g., '%1').").arg(QString(qMin(run.length, 6), '*'));
        out.suggestions << "Avoid long repeats like aaaa or 1111.";
    }
    return out;
}

PasswordRuleOutcome templateRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (PasswordPatterns::matchesWordDigitsTemplate(ctx.password)) {
        out.delta = -10;
        out.issues << "Looks like a common pattern (word + digits).";
        out.suggestions << "Use a passphrase or mix words in a less predictable way.";
    }
    return out;
}

// Suggestion only, no issue text.
PasswordRuleOutcome entropyRule(const PasswordCheckContext &ctx)
{
    PasswordRuleOutcome out;
    if (ctx.entropyBits >= 80.0) {
        out.delta = 10;
    } else if (ctx.entropyBits < 50.0) {
        out.delta = -10;
        out.suggestions << "Increase complexity and length to raise entropy.";
    }
    return out;
}

QStringList dedupPreservingOrder(const QStringList &items)
{
    QStringList out;
    QSet<QString> seen;
    for (const auto &item : items) {
        if (seen.contains(item))
            continue;
        seen.insert(item);
        out.push_back(item);
    }
    return out;
}

double roundToHundredths(double value)
{
    return std::round(value * 100.0) / 100.0;
}

} // namespace

PasswordRating ratingForScore(int score)
{
    if (score >= 85)
        return PasswordRating::VeryStrong;
    if (score >= 70)
        return PasswordRating::Strong;
    if (score >= 50)
        return PasswordRating::Moderate;
    if (score >= 30)
        return PasswordRating::Weak;
    return PasswordRating::VeryWeak;
}

QString ratingLabel(PasswordRating rating)
{
    switch (rating) {
    case PasswordRating::VeryWeak:
        return "Very Weak";
    case PasswordRating::Weak:
        return "Weak";
    case PasswordRating::Moderate:
        return "Moderate";
    case PasswordRating::Strong:
        return "Strong";
    case PasswordRating::VeryStrong:
        return "Very Strong";
    }
    return "Very Weak";
}

const QVector<PasswordRule> &defaultPasswordRules()
{
    static const QVector<PasswordRule> kRules = {
        &lengthRule,
        &varietyRule,
        &commonPasswordRule,
        &commonSubstringRule,
        &sequenceRule,
        &repeatRule,
        &templateRule,
        &entropyRule,
    };
    return kRules;
}

PasswordCheckResult evaluatePasswordStrength(const QString &password, const CommonPasswordSet &common)
{
    return evaluatePasswordStrength(password, common, defaultPasswordRules());
}

PasswordCheckResult evaluatePasswordStrength(const QString &password,
                                             const CommonPasswordSet &common,
                                             const QVector<PasswordRule> &rules)
{
    PasswordCheckResult result;

    if (password.isEmpty()) {
        result.issues << "Password is empty.";
        result.suggestions << "Enter a password with at least 12–16 characters.";
        return result;
    }

    PasswordCheckContext ctx;
    ctx.password = password;
    ctx.lower = password.toLower();
    ctx.normalized = PasswordNormalizer::normalize(password);
    ctx.length = static_cast<int>(password.toUcs4().size());
    ctx.classes = PasswordEntropy::classify(password);
    ctx.entropyBits = PasswordEntropy::estimateBits(password);
    ctx.common = &common;

    int score = 0;
    QStringList suggestions;
    for (const auto rule : rules) {
        const auto outcome = rule(ctx);
        score += outcome.delta;
        result.issues << outcome.issues;
        suggestions << outcome.suggestions;
    }

    result.score = qBound(0, score, 100);
    result.rating = ratingForScore(result.score);
    result.entropyBits = roundToHundredths(ctx.entropyBits);
    result.suggestions = dedupPreservingOrder(suggestions);
    return result;
}
