// PasswordPrompt.cpp
#include "PasswordPrompt.h"

#include <cstdio>
#include <string>

#include <termios.h>
#include <unistd.h>

namespace {

// Restores the saved terminal mode on scope exit.
class TermiosGuard
{
public:
    TermiosGuard(int fd, const termios& saved) : m_fd(fd), m_saved(saved) {}
    ~TermiosGuard() { tcsetattr(m_fd, TCSAFLUSH, &m_saved); }

    TermiosGuard(const TermiosGuard&) = delete;
    TermiosGuard& operator=(const TermiosGuard&) = delete;

private:
    int     m_fd;
    termios m_saved;
};

bool readLine(std::string* line)
{
    line->clear();
    for (;;) {
        const int c = std::fgetc(stdin);
        if (c == EOF)
            return !line->empty();
        if (c == '\n')
            return true;
        if (c != '\r')
            line->push_back((char)c);
    }
}

void wipe(std::string& s)
{
    volatile char* p = &s[0];
    for (size_t i = 0; i < s.size(); ++i)
        p[i] = 0;
    s.clear();
}

} // namespace

namespace PasswordPrompt {

bool stdinIsTerminal()
{
    return isatty(STDIN_FILENO) == 1;
}

bool read(const QString& prompt, QString* out)
{
    std::fputs(prompt.toLocal8Bit().constData(), stderr);
    std::fflush(stderr);

    std::string line;
    bool ok = false;

    termios saved;
    if (stdinIsTerminal() && tcgetattr(STDIN_FILENO, &saved) == 0) {
        termios silent = saved;
        silent.c_lflag &= ~(tcflag_t)ECHO;
        silent.c_lflag |= ECHONL;

        TermiosGuard guard(STDIN_FILENO, saved);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0)
            return false;
        ok = readLine(&line);
    } else {
        ok = readLine(&line);
    }

    if (ok && out)
        *out = QString::fromLocal8Bit(line.data(), (int)line.size());
    wipe(line);
    return ok;
}

bool readNew(const QString& prompt, QString* out, QString* err)
{
    QString first;
    QString second;
    if (!read(prompt, &first) || !read(QStringLiteral("Repeat: "), &second)) {
        if (err) *err = QStringLiteral("No input");
        return false;
    }
    if (first.isEmpty()) {
        if (err) *err = QStringLiteral("Password must not be empty");
        return false;
    }
    if (first != second) {
        if (err) *err = QStringLiteral("Entries do not match");
        return false;
    }
    if (out) *out = first;
    return true;
}

} // namespace PasswordPrompt
