#pragma once

#include <QString>

#include "TransferTypes.h"

enum class WizardStep {
    SelectSession,
    SelectDirection,
    SelectSource,
    SelectTarget,
    Confirm,
    Done
};

enum class WizardAction {
    Next,
    Back,
    Reset
};

QString wizardStepName(WizardStep s);

// Pure step relation. Done is final for Next/Back; Reset always returns
// to SelectSession.
WizardStep wizardTransition(WizardStep from, WizardAction action);

/*
    TransferWizard
    --------------
    Collects one TransferRequest step by step:

        session -> direction -> source -> target directory -> confirm

    Each select*() only succeeds on its own step and advances on success.
    back() returns to the previous step keeping what was chosen there;
    choosing a different session or direction clears the later choices.

    Execution is not the wizard's business: after confirm() the caller hands
    request() to TransferEngine::start().
*/
class TransferWizard
{
public:
    TransferWizard() = default;

    WizardStep step() const { return m_step; }
    bool isDone() const { return m_step == WizardStep::Done; }

    bool selectSession(int sessionId, TransferError* code = nullptr, QString* err = nullptr);
    bool selectDirection(TransferDirection direction, TransferError* code = nullptr, QString* err = nullptr);
    bool selectSource(const QString& path, bool isDir, TransferError* code = nullptr, QString* err = nullptr);
    bool selectTarget(const QString& dir, TransferError* code = nullptr, QString* err = nullptr);
    bool confirm(TransferError* code = nullptr, QString* err = nullptr);

    bool back();
    void reset();

    // Side browsed on the current step: local for an upload source or a
    // download target, remote otherwise.
    bool browsesRemote() const;

    // Destination path of the source root (targetDir/basename(source)).
    QString targetPath() const;

    TransferRequest request() const { return m_request; }

private:
    bool expectStep(WizardStep s, TransferError* code, QString* err) const;
    void advance() { m_step = wizardTransition(m_step, WizardAction::Next); }

    WizardStep      m_step = WizardStep::SelectSession;
    TransferRequest m_request;
    bool            m_directionChosen = false;
};
