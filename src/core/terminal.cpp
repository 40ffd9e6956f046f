#include "terminal.h"

#include <QTextStream>

#include <cstdio>
#include <string>

#include <termios.h>
#include <unistd.h>

namespace Terminal {

namespace {

class EchoGuard final
{
public:
    EchoGuard()
    {
        if (!isatty(STDIN_FILENO))
            return;
        if (tcgetattr(STDIN_FILENO, &saved_) != 0)
            return;

        auto silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    ~EchoGuard()
    {
        if (!active_)
            return;
        tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        std::fputc('\n', stderr);
    }

    EchoGuard(const EchoGuard &) = delete;
    EchoGuard &operator=(const EchoGuard &) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

} // namespace

std::optional<QString> readHiddenLine(const QString &prompt)
{
    {
        QTextStream err(stderr);
        err << prompt;
        err.flush();
    }

    EchoGuard guard;

    std::string line;
    bool sawAnything = false;
    int ch = 0;
    while ((ch = std::fgetc(stdin)) != EOF) {
        sawAnything = true;
        if (ch == '\n')
            break;
        line.push_back(static_cast<char>(ch));
    }

    if (!sawAnything)
        return std::nullopt;

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return QString::fromStdString(line);
}

} // namespace Terminal
