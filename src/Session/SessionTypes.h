#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>

// Lifecycle of one session (tab).
//
//   Idle -> Connecting -> Authenticating -> Ready <-> {Terminal, Transferring} -> Closing -> Closed
//
// Failed is reachable from every state except Closed/Failed and only leads
// to Closed. Ready/Terminal/Transferring describe which channels are busy;
// Transferring wins while a transfer holds the SFTP lease.
enum class SessionState {
    Idle,
    Connecting,
    Authenticating,
    Ready,
    Terminal,
    Transferring,
    Closing,
    Closed,
    Failed
};

Q_DECLARE_METATYPE(SessionState)

QString sessionStateName(SessionState s);

namespace SessionStateMachine {
    bool canTransition(SessionState from, SessionState to);

    // Closed and Failed accept no further work.
    bool isFinal(SessionState s);

    // A terminal or an SFTP lease may be opened in this state.
    bool acceptsChannels(SessionState s);
}

// Snapshot for presentation / CLI.
struct SessionInfo
{
    int          id = -1;
    int          recordId = 0;
    QString      label;           // record label
    QString      target;          // user@host:port
    SessionState state = SessionState::Idle;
    bool         terminalOpen = false;
    bool         sftpLeased = false;
    QString      lastError;       // set when Failed
    QDateTime    openedAt;
};
