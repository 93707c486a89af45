/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACE_H
#define WORKSPACE_H

#include <QMap>
#include <QObject>
#include <QPointer>

#include "input/InputRouter.h"
#include "pane/PaneManager.h"
#include "settings/MultiplexerSettings.h"
#include "tmux/TmuxPrefixKey.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

class TerminalCore;
class TmuxSyncEngine;

/**
 * The tabs of one window.
 *
 * Owns a PaneManager per tab, tracks the active tab and delivers input:
 * bytes for local panes go to the terminal core, bytes for panes of an
 * attached tmux session go out as send-keys.
 */
class SPLITMUXPRIVATE_EXPORT Workspace : public QObject
{
    Q_OBJECT
public:
    Workspace(TerminalCore *core, const MultiplexerSettings &settings, QObject *parent = nullptr);
    ~Workspace() override;

    TerminalCore *terminalCore() const;
    const MultiplexerSettings &settings() const;

    TabId createTab(Authority authority = Authority::Local, const QString &title = QString());
    bool closeTab(TabId tab);
    PaneManager *paneManager(TabId tab) const;
    QList<TabId> tabs() const;

    TabId activeTab() const;
    bool setActiveTab(TabId tab);
    PaneManager *activePaneManager() const;

    void setTabTitle(TabId tab, const QString &title);
    QString tabTitle(TabId tab) const;
    void setWindowTitle(const QString &title);
    QString windowTitle() const;

    // Returns the panes the bytes went to; empty if the key was consumed
    // by a tmux key binding or there is no active tab.
    QList<PaneId> handleKey(const KeyInput &input);
    QList<PaneId> handlePointer(const PointerInput &input);
    bool isPrefixPending() const;

    // The engine is owned by the caller; detaching it is automatic when it goes away.
    void attachSyncEngine(TmuxSyncEngine *engine);
    TmuxSyncEngine *syncEngine() const;

Q_SIGNALS:
    void tabCreated(Splitmux::TabId tab);
    void tabClosed(Splitmux::TabId tab);
    void activeTabChanged(Splitmux::TabId tab);
    void tabTitleChanged(Splitmux::TabId tab, const QString &title);
    void windowTitleChanged(const QString &title);

private:
    QList<PaneId> deliver(PaneManager *manager, const InputRoute &route);
    // May rewrite `input` when the prefix key is pressed twice.
    bool handlePrefix(PaneManager *manager, KeyInput &input);

    TerminalCore *_core;
    MultiplexerSettings _settings;
    TmuxPrefixKey _prefixKey;
    bool _prefixPending = false;

    QMap<TabId, PaneManager *> _tabs;
    QMap<TabId, QString> _titles;
    TabId _nextTab = 0;
    TabId _activeTab = InvalidTabId;
    QString _windowTitle;

    QPointer<TmuxSyncEngine> _engine;
};

} // namespace Splitmux

#endif // WORKSPACE_H
