/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Workspace.h"

#include "session/TerminalCore.h"
#include "tmux/TmuxSyncEngine.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcWorkspace, "splitmux.input")

namespace Splitmux
{

Workspace::Workspace(TerminalCore *core, const MultiplexerSettings &settings, QObject *parent)
    : QObject(parent)
    , _core(core)
    , _settings(settings)
{
    auto prefix = TmuxPrefixKey::parse(_settings.prefixKey);
    if (prefix) {
        _prefixKey = *prefix;
    } else {
        qCWarning(lcWorkspace) << "invalid prefix key" << _settings.prefixKey << "- using" << _prefixKey.toString();
    }
}

Workspace::~Workspace()
{
    // Managers release their terminals; the core may not outlive us.
    qDeleteAll(_tabs);
    _tabs.clear();
}

TerminalCore *Workspace::terminalCore() const
{
    return _core;
}

const MultiplexerSettings &Workspace::settings() const
{
    return _settings;
}

TabId Workspace::createTab(Authority authority, const QString &title)
{
    const TabId tab = _nextTab++;
    auto *manager = new PaneManager(tab, authority, _core, _settings, this);
    connect(manager, &PaneManager::lastPaneClosed, this, [this](TabId closed) {
        closeTab(closed);
    });

    _tabs.insert(tab, manager);
    _titles.insert(tab, title);
    Q_EMIT tabCreated(tab);

    if (_activeTab == InvalidTabId) {
        setActiveTab(tab);
    }
    return tab;
}

bool Workspace::closeTab(TabId tab)
{
    PaneManager *manager = _tabs.take(tab);
    if (!manager) {
        return false;
    }
    _titles.remove(tab);

    // The manager may be the sender of the signal that got us here.
    disconnect(manager, nullptr, this, nullptr);
    manager->deleteLater();
    Q_EMIT tabClosed(tab);

    if (_activeTab == tab) {
        _prefixPending = false;
        auto next = _tabs.lowerBound(tab);
        if (next == _tabs.end() && !_tabs.isEmpty()) {
            --next;
        }
        _activeTab = next == _tabs.end() ? InvalidTabId : next.key();
        Q_EMIT activeTabChanged(_activeTab);
    }
    return true;
}

PaneManager *Workspace::paneManager(TabId tab) const
{
    return _tabs.value(tab, nullptr);
}

QList<TabId> Workspace::tabs() const
{
    return _tabs.keys();
}

TabId Workspace::activeTab() const
{
    return _activeTab;
}

bool Workspace::setActiveTab(TabId tab)
{
    if (!_tabs.contains(tab)) {
        return false;
    }
    if (_activeTab != tab) {
        _activeTab = tab;
        _prefixPending = false;
        Q_EMIT activeTabChanged(tab);
    }
    return true;
}

PaneManager *Workspace::activePaneManager() const
{
    return paneManager(_activeTab);
}

void Workspace::setTabTitle(TabId tab, const QString &title)
{
    auto it = _titles.find(tab);
    if (it == _titles.end() || it.value() == title) {
        return;
    }
    it.value() = title;
    Q_EMIT tabTitleChanged(tab, title);
}

QString Workspace::tabTitle(TabId tab) const
{
    return _titles.value(tab);
}

void Workspace::setWindowTitle(const QString &title)
{
    if (_windowTitle == title) {
        return;
    }
    _windowTitle = title;
    Q_EMIT windowTitleChanged(title);
}

QString Workspace::windowTitle() const
{
    return _windowTitle;
}

bool Workspace::isPrefixPending() const
{
    return _prefixPending;
}

void Workspace::attachSyncEngine(TmuxSyncEngine *engine)
{
    _engine = engine;
    _prefixPending = false;
}

TmuxSyncEngine *Workspace::syncEngine() const
{
    return _engine;
}

QList<PaneId> Workspace::handleKey(const KeyInput &input)
{
    PaneManager *manager = activePaneManager();
    if (!manager) {
        return {};
    }

    KeyInput event = input;
    if (manager->authority() == Authority::Remote && _engine && handlePrefix(manager, event)) {
        return {};
    }
    return deliver(manager, InputRouter::route(InputEvent(event), manager->focusState(), manager->tree(), manager->contentBounds()));
}

QList<PaneId> Workspace::handlePointer(const PointerInput &input)
{
    PaneManager *manager = activePaneManager();
    if (!manager) {
        return {};
    }
    return deliver(manager, InputRouter::route(InputEvent(input), manager->focusState(), manager->tree(), manager->contentBounds()));
}

bool Workspace::handlePrefix(PaneManager *manager, KeyInput &input)
{
    switch (input.key) {
    case Qt::Key_Shift:
    case Qt::Key_Control:
    case Qt::Key_Alt:
    case Qt::Key_Meta:
        // A bare modifier neither starts nor ends a binding.
        return _prefixPending;
    default:
        break;
    }

    if (!_prefixPending) {
        if (_prefixKey.matches(input)) {
            _prefixPending = true;
            return true;
        }
        return false;
    }

    _prefixPending = false;
    if (_prefixKey.matches(input)) {
        input.text = _prefixKey.prefixBytes();
        return false;
    }

    const int remotePane = _engine->remotePaneFor(manager->focusedPane());
    const auto command = TmuxPrefixKey::translateCommandKey(input, remotePane);
    if (!command) {
        qCDebug(lcWorkspace) << "no binding for key" << input.key << input.text;
        return true;
    }
    _engine->executeCommand(*command);
    return true;
}

QList<PaneId> Workspace::deliver(PaneManager *manager, const InputRoute &route)
{
    if (route.focusRequest != InvalidPaneId) {
        manager->focusPane(route.focusRequest);
    }
    if (route.bytes.isEmpty()) {
        return route.targets;
    }

    for (PaneId pane : route.targets) {
        if (_engine && _engine->isRemotePane(pane)) {
            _engine->sendKeys(pane, route.bytes);
        } else if (_core) {
            _core->writeInput(manager->tree().terminalHandle(pane), route.bytes);
        }
    }
    return route.targets;
}

} // namespace Splitmux

#include "moc_Workspace.cpp"
