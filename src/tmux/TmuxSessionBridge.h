/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXSESSIONBRIDGE_H
#define TMUXSESSIONBRIDGE_H

#include <QObject>
#include <QProcess>
#include <QStringList>

#include "splitmuxprivate_export.h"

namespace Splitmux
{

class TmuxControlSession;
class TmuxSyncEngine;
class Workspace;

/**
 * Owns the tmux client process and the session/engine pair talking to it.
 *
 * Attaches to an existing tmux session and falls back to creating one when
 * there is nothing to attach to. Once tmux is gone the workspace keeps the
 * mirrored tabs as local tabs.
 */
class SPLITMUXPRIVATE_EXPORT TmuxSessionBridge : public QObject
{
    Q_OBJECT
public:
    explicit TmuxSessionBridge(Workspace *workspace, QObject *parent = nullptr);
    ~TmuxSessionBridge() override;

    // An empty name attaches to whatever tmux considers most recent.
    void start(const QString &sessionName = QString());
    // When off, a failed attach reports failed() instead of creating the session.
    void setCreateSessionIfMissing(bool create);

    TmuxControlSession *session() const;
    TmuxSyncEngine *syncEngine() const;
    bool isRunning() const;

    static QStringList attachArguments(const QString &sessionName);
    static QStringList newSessionArguments(const QString &sessionName);

Q_SIGNALS:
    void attached();
    void detached(const QString &reason);
    void failed(const QString &error);

private:
    void launch(const QStringList &arguments);
    void dispose();
    void onEngineDetached(const QString &reason);
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);

    Workspace *_workspace; // non-owning
    QString _tmuxPath;
    QString _sessionName;

    QProcess *_process = nullptr; // owned (Qt parent = this)
    TmuxControlSession *_session = nullptr; // owned (Qt parent = this)
    TmuxSyncEngine *_engine = nullptr; // owned (Qt parent = this)

    bool _attached = false;
    bool _creatingSession = false;
    bool _createIfMissing = true;
};

} // namespace Splitmux

#endif // TMUXSESSIONBRIDGE_H
