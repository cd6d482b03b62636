// SessionTypes.cpp
#include "SessionTypes.h"

QString sessionStateName(SessionState s)
{
    switch (s) {
        case SessionState::Idle:           return "idle";
        case SessionState::Connecting:     return "connecting";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Ready:          return "ready";
        case SessionState::Terminal:       return "terminal";
        case SessionState::Transferring:   return "transferring";
        case SessionState::Closing:        return "closing";
        case SessionState::Closed:         return "closed";
        case SessionState::Failed:         return "failed";
    }
    return "unknown";
}

namespace SessionStateMachine {

bool isFinal(SessionState s)
{
    return s == SessionState::Closed || s == SessionState::Failed;
}

bool acceptsChannels(SessionState s)
{
    return s == SessionState::Ready
        || s == SessionState::Terminal
        || s == SessionState::Transferring;
}

bool canTransition(SessionState from, SessionState to)
{
    if (from == to)
        return false;

    if (from == SessionState::Closed)
        return false;

    if (from == SessionState::Failed)
        return to == SessionState::Closed;

    if (to == SessionState::Failed)
        return true;

    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Connecting || to == SessionState::Closing;

        case SessionState::Connecting:
            return to == SessionState::Authenticating || to == SessionState::Closing;

        case SessionState::Authenticating:
            return to == SessionState::Ready || to == SessionState::Closing;

        case SessionState::Ready:
        case SessionState::Terminal:
        case SessionState::Transferring:
            return acceptsChannels(to) || to == SessionState::Closing;

        case SessionState::Closing:
            return to == SessionState::Closed;

        default:
            return false;
    }
}

} // namespace SessionStateMachine
