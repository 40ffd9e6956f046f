#pragma once

#include <QString>

#include <optional>

namespace Terminal {

// Prints the prompt to stderr and reads one line from stdin. Echo is turned
// off while reading when stdin is a terminal. Returns nullopt on end of input.
std::optional<QString> readHiddenLine(const QString &prompt);

} // namespace Terminal
