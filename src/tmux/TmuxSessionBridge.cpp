/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxSessionBridge.h"

#include "TmuxControlSession.h"
#include "TmuxSyncEngine.h"

#include "Workspace.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTmuxBridge, "splitmux.tmux.bridge")

namespace Splitmux
{

TmuxSessionBridge::TmuxSessionBridge(Workspace *workspace, QObject *parent)
    : QObject(parent)
    , _workspace(workspace)
    , _tmuxPath(workspace->settings().tmuxPath)
{
}

TmuxSessionBridge::~TmuxSessionBridge()
{
    if (_engine) {
        disconnect(_engine, nullptr, this, nullptr);
    }
    if (_process) {
        disconnect(_process, nullptr, this, nullptr);
        if (_process->state() != QProcess::NotRunning) {
            // A control client detaches when its stdin closes.
            _process->closeWriteChannel();
            if (!_process->waitForFinished(1000)) {
                _process->kill();
                _process->waitForFinished(1000);
            }
        }
    }
}

QStringList TmuxSessionBridge::attachArguments(const QString &sessionName)
{
    // -C: the client talks over pipes, -CC needs a terminal.
    QStringList arguments{QStringLiteral("-C"), QStringLiteral("attach-session")};
    if (!sessionName.isEmpty()) {
        arguments << QStringLiteral("-t") << sessionName;
    }
    return arguments;
}

QStringList TmuxSessionBridge::newSessionArguments(const QString &sessionName)
{
    QStringList arguments{QStringLiteral("-C"), QStringLiteral("new-session")};
    if (!sessionName.isEmpty()) {
        arguments << QStringLiteral("-s") << sessionName;
    }
    return arguments;
}

void TmuxSessionBridge::start(const QString &sessionName)
{
    _sessionName = sessionName;
    _creatingSession = false;
    launch(attachArguments(sessionName));
}

void TmuxSessionBridge::setCreateSessionIfMissing(bool create)
{
    _createIfMissing = create;
}

TmuxControlSession *TmuxSessionBridge::session() const
{
    return _session;
}

TmuxSyncEngine *TmuxSessionBridge::syncEngine() const
{
    return _engine;
}

bool TmuxSessionBridge::isRunning() const
{
    return _process && _process->state() != QProcess::NotRunning;
}

void TmuxSessionBridge::launch(const QStringList &arguments)
{
    dispose();
    _attached = false;

    _process = new QProcess(this);
    _process->setProgram(_tmuxPath);
    _process->setArguments(arguments);

    _session = new TmuxControlSession(_process, _workspace->settings(), this);
    _engine = new TmuxSyncEngine(_session, _workspace, this);

    // A failed attach may still open with a reply block, so only a listed
    // session counts as attached.
    connect(_engine, &TmuxSyncEngine::initialWindowsOpened, this, [this]() {
        _attached = true;
        Q_EMIT attached();
    });
    connect(_engine, &TmuxSyncEngine::detached, this, &TmuxSessionBridge::onEngineDetached);
    connect(_process, &QProcess::finished, this, &TmuxSessionBridge::onProcessFinished);
    connect(_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        const QString message = _process->errorString();
        qCWarning(lcTmuxBridge) << "cannot start" << _tmuxPath << ":" << message;
        // No retry with new-session: the binary itself is unusable.
        disconnect(_engine, &TmuxSyncEngine::detached, this, &TmuxSessionBridge::onEngineDetached);
        _session->transportClosed();
        Q_EMIT failed(message);
    });

    qCInfo(lcTmuxBridge) << "starting" << _tmuxPath << arguments;
    _process->start(QIODevice::ReadWrite);
}

void TmuxSessionBridge::dispose()
{
    if (_engine) {
        disconnect(_engine, nullptr, this, nullptr);
        _engine->deleteLater();
        _engine = nullptr;
    }
    if (_session) {
        disconnect(_session, nullptr, this, nullptr);
        _session->deleteLater();
        _session = nullptr;
    }
    if (_process) {
        disconnect(_process, nullptr, this, nullptr);
        if (_process->state() != QProcess::NotRunning) {
            _process->kill();
        }
        _process->deleteLater();
        _process = nullptr;
    }
}

void TmuxSessionBridge::onEngineDetached(const QString &reason)
{
    if (!_attached && !_creatingSession && _createIfMissing) {
        qCInfo(lcTmuxBridge) << "attach failed (" << reason << "), creating a new session";
        _creatingSession = true;
        // Deferred: the engine emitting this is about to be replaced.
        QMetaObject::invokeMethod(
            this,
            [this]() {
                launch(newSessionArguments(_sessionName));
            },
            Qt::QueuedConnection);
        return;
    }

    if (!_attached) {
        Q_EMIT failed(reason);
        return;
    }
    Q_EMIT detached(reason);
}

void TmuxSessionBridge::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    const QByteArray errors = _process->readAllStandardError().trimmed();
    if (!errors.isEmpty()) {
        qCWarning(lcTmuxBridge) << "tmux:" << errors;
    }
    qCDebug(lcTmuxBridge) << "tmux client finished, exit code" << exitCode << "status" << exitStatus;

    if (!_session->isTerminated()) {
        _session->transportClosed();
    }
}

} // namespace Splitmux

#include "moc_TmuxSessionBridge.cpp"
