#pragma once

#include "passwordstrength.h"

#include <QString>

// Entropy with two decimals at most and one at least: 80.0, 52.44.
QString formatEntropyBits(double bits);

// The password is masked with one '*' per character unless showPassword is set.
QString formatPasswordReport(const QString &password, const PasswordCheckResult &result, bool showPassword);
