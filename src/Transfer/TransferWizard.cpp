// TransferWizard.cpp
#include "TransferWizard.h"

QString wizardStepName(WizardStep s)
{
    switch (s) {
        case WizardStep::SelectSession:   return "select-session";
        case WizardStep::SelectDirection: return "select-direction";
        case WizardStep::SelectSource:    return "select-source";
        case WizardStep::SelectTarget:    return "select-target";
        case WizardStep::Confirm:         return "confirm";
        case WizardStep::Done:            return "done";
    }
    return "unknown";
}

WizardStep wizardTransition(WizardStep from, WizardAction action)
{
    if (action == WizardAction::Reset)
        return WizardStep::SelectSession;

    if (from == WizardStep::Done)
        return WizardStep::Done;

    if (action == WizardAction::Next) {
        switch (from) {
            case WizardStep::SelectSession:   return WizardStep::SelectDirection;
            case WizardStep::SelectDirection: return WizardStep::SelectSource;
            case WizardStep::SelectSource:    return WizardStep::SelectTarget;
            case WizardStep::SelectTarget:    return WizardStep::Confirm;
            case WizardStep::Confirm:         return WizardStep::Done;
            default:                          return from;
        }
    }

    // Back
    switch (from) {
        case WizardStep::SelectDirection: return WizardStep::SelectSession;
        case WizardStep::SelectSource:    return WizardStep::SelectDirection;
        case WizardStep::SelectTarget:    return WizardStep::SelectSource;
        case WizardStep::Confirm:         return WizardStep::SelectTarget;
        default:                          return from;
    }
}

// ===========================================================================
// Steps
// ===========================================================================
bool TransferWizard::expectStep(WizardStep s, TransferError* code, QString* err) const
{
    if (m_step == s)
        return true;

    setError(code, err, TransferError::InvalidRequest,
             QString("Wizard is at step '%1', not '%2'").arg(wizardStepName(m_step), wizardStepName(s)));
    return false;
}

bool TransferWizard::selectSession(int sessionId, TransferError* code, QString* err)
{
    if (!expectStep(WizardStep::SelectSession, code, err))
        return false;

    if (sessionId <= 0) {
        setError(code, err, TransferError::InvalidRequest, "No session selected");
        return false;
    }

    if (sessionId != m_request.sessionId) {
        m_request = TransferRequest();
        m_request.sessionId = sessionId;
        m_directionChosen = false;
    }

    advance();
    return true;
}

bool TransferWizard::selectDirection(TransferDirection direction, TransferError* code, QString* err)
{
    if (!expectStep(WizardStep::SelectDirection, code, err))
        return false;

    if (!m_directionChosen || direction != m_request.direction) {
        m_request.direction = direction;
        m_request.sourcePath.clear();
        m_request.sourceIsDir = false;
        m_request.targetDir.clear();
        m_directionChosen = true;
    }

    advance();
    return true;
}

bool TransferWizard::selectSource(const QString& path, bool isDir, TransferError* code, QString* err)
{
    if (!expectStep(WizardStep::SelectSource, code, err))
        return false;

    const QString p = path.trimmed();
    if (p.isEmpty()) {
        setError(code, err, TransferError::InvalidRequest, "No source selected");
        return false;
    }
    if (!TransferPaths::hasCopyableName(p)) {
        setError(code, err, TransferError::InvalidPath);
        return false;
    }

    m_request.sourcePath  = p;
    m_request.sourceIsDir = isDir;

    advance();
    return true;
}

bool TransferWizard::selectTarget(const QString& dir, TransferError* code, QString* err)
{
    if (!expectStep(WizardStep::SelectTarget, code, err))
        return false;

    const QString d = dir.trimmed();
    if (d.isEmpty()) {
        setError(code, err, TransferError::InvalidRequest, "No target directory selected");
        return false;
    }

    m_request.targetDir = d;

    advance();
    return true;
}

bool TransferWizard::confirm(TransferError* code, QString* err)
{
    if (!expectStep(WizardStep::Confirm, code, err))
        return false;

    advance();
    return true;
}

bool TransferWizard::back()
{
    const WizardStep prev = wizardTransition(m_step, WizardAction::Back);
    if (prev == m_step)
        return false;
    m_step = prev;
    return true;
}

void TransferWizard::reset()
{
    m_step = wizardTransition(m_step, WizardAction::Reset);
    m_request = TransferRequest();
    m_directionChosen = false;
}

bool TransferWizard::browsesRemote() const
{
    const bool upload = m_request.direction == TransferDirection::Upload;
    if (m_step == WizardStep::SelectSource)
        return !upload;
    if (m_step == WizardStep::SelectTarget)
        return upload;
    return false;
}

QString TransferWizard::targetPath() const
{
    if (m_request.sourcePath.isEmpty() || m_request.targetDir.isEmpty())
        return QString();

    const QString name = TransferPaths::baseName(m_request.sourcePath);
    return m_request.direction == TransferDirection::Upload
        ? TransferPaths::joinRemote(m_request.targetDir, name)
        : TransferPaths::joinLocal(m_request.targetDir, name);
}
