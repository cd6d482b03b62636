#pragma once

#include <QString>

// Reads secrets from the controlling terminal with echo turned off.
// When stdin is not a terminal (scripts, tests) one plain line is read.
namespace PasswordPrompt {
    // False on EOF / read error.
    bool read(const QString& prompt, QString* out);

    // Asks twice; false if the two entries differ or are empty.
    bool readNew(const QString& prompt, QString* out, QString* err = nullptr);

    bool stdinIsTerminal();
}
