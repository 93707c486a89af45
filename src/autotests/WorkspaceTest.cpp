/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceTest.h"

#include <QSignalSpy>
#include <QTest>

#include "../Workspace.h"
#include "../session/VirtualTerminalCore.h"

using namespace Splitmux;

static KeyInput typed(const QByteArray &text)
{
    KeyInput input;
    input.key = Qt::Key_A;
    input.text = text;
    return input;
}

void WorkspaceTest::testFirstTabBecomesActive()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    QSignalSpy createdSpy(&workspace, &Workspace::tabCreated);
    QSignalSpy activeSpy(&workspace, &Workspace::activeTabChanged);
    QCOMPARE(workspace.activeTab(), InvalidTabId);

    const TabId first = workspace.createTab(Authority::Local, QStringLiteral("one"));
    const TabId second = workspace.createTab();
    QVERIFY(first != second);
    QCOMPARE(createdSpy.count(), 2);
    QCOMPARE(activeSpy.count(), 1);
    QCOMPARE(workspace.activeTab(), first);
    QCOMPARE(workspace.tabs(), (QList<TabId>{first, second}));
    QCOMPARE(workspace.tabTitle(first), QStringLiteral("one"));
    QCOMPARE(core.liveCount(), 2);

    QVERIFY(workspace.setActiveTab(second));
    QCOMPARE(workspace.activePaneManager(), workspace.paneManager(second));
    QVERIFY(!workspace.setActiveTab(InvalidTabId));
}

void WorkspaceTest::testClosingActiveTabPicksNeighbour()
{
    Workspace workspace(nullptr, MultiplexerSettings());
    const TabId a = workspace.createTab();
    const TabId b = workspace.createTab();
    const TabId c = workspace.createTab();
    QSignalSpy closedSpy(&workspace, &Workspace::tabClosed);

    workspace.setActiveTab(b);
    QVERIFY(workspace.closeTab(b));
    QCOMPARE(closedSpy.count(), 1);
    QCOMPARE(workspace.activeTab(), c);

    QVERIFY(workspace.closeTab(c));
    QCOMPARE(workspace.activeTab(), a);

    QVERIFY(!workspace.closeTab(c));
    QVERIFY(workspace.closeTab(a));
    QCOMPARE(workspace.activeTab(), InvalidTabId);
    QVERIFY(workspace.tabs().isEmpty());
}

void WorkspaceTest::testLastPaneClosesTab()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    const TabId tab = workspace.createTab();
    QSignalSpy closedSpy(&workspace, &Workspace::tabClosed);

    QCOMPARE(workspace.paneManager(tab)->closeFocused(), PaneError::None);
    QCOMPARE(closedSpy.count(), 1);
    QVERIFY(!workspace.paneManager(tab));
    QCOMPARE(core.liveCount(), 0);
}

void WorkspaceTest::testTitles()
{
    Workspace workspace(nullptr, MultiplexerSettings());
    const TabId tab = workspace.createTab();
    QSignalSpy tabTitleSpy(&workspace, &Workspace::tabTitleChanged);
    QSignalSpy windowTitleSpy(&workspace, &Workspace::windowTitleChanged);

    workspace.setTabTitle(tab, QStringLiteral("make"));
    workspace.setTabTitle(tab, QStringLiteral("make"));
    workspace.setTabTitle(tab + 100, QStringLiteral("nowhere"));
    QCOMPARE(tabTitleSpy.count(), 1);
    QCOMPARE(workspace.tabTitle(tab), QStringLiteral("make"));

    workspace.setWindowTitle(QStringLiteral("main"));
    workspace.setWindowTitle(QStringLiteral("main"));
    QCOMPARE(windowTitleSpy.count(), 1);
    QCOMPARE(workspace.windowTitle(), QStringLiteral("main"));
}

void WorkspaceTest::testKeyGoesToFocusedTerminal()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    const TabId tab = workspace.createTab();
    PaneManager *manager = workspace.paneManager(tab);
    const PaneId first = manager->focusedPane();
    const PaneId second = manager->splitVertical().value;

    QCOMPARE(workspace.handleKey(typed("ls\r")), QList<PaneId>{first});
    QCOMPARE(core.input(manager->tree().terminalHandle(first)), QByteArray("ls\r"));
    QVERIFY(core.input(manager->tree().terminalHandle(second)).isEmpty());
}

void WorkspaceTest::testBroadcastWritesEveryPane()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    PaneManager *manager = workspace.paneManager(workspace.createTab());
    const PaneId first = manager->focusedPane();
    const PaneId second = manager->splitHorizontal().value;
    manager->toggleBroadcast();

    QCOMPARE(workspace.handleKey(typed("q")), (QList<PaneId>{first, second}));
    QCOMPARE(core.input(manager->tree().terminalHandle(first)), QByteArray("q"));
    QCOMPARE(core.input(manager->tree().terminalHandle(second)), QByteArray("q"));
}

void WorkspaceTest::testPointerPressMovesFocus()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    PaneManager *manager = workspace.paneManager(workspace.createTab());
    manager->setContentBounds(QRectF(0, 0, 80, 24));
    const PaneId second = manager->splitHorizontal().value;

    PointerInput press;
    press.position = QPointF(60, 10);
    press.press = true;
    QCOMPARE(workspace.handlePointer(press), QList<PaneId>{second});
    QCOMPARE(manager->focusedPane(), second);
    // No mouse report, nothing written.
    QVERIFY(core.input(manager->tree().terminalHandle(second)).isEmpty());
}

void WorkspaceTest::testPrefixIsPlainInputOnLocalTab()
{
    VirtualTerminalCore core;
    Workspace workspace(&core, MultiplexerSettings());
    PaneManager *manager = workspace.paneManager(workspace.createTab());

    KeyInput prefix;
    prefix.key = Qt::Key_B;
    prefix.modifiers = Qt::ControlModifier;
    prefix.text = QByteArray("\x02");
    QCOMPARE(workspace.handleKey(prefix).size(), 1);
    QVERIFY(!workspace.isPrefixPending());
    QCOMPARE(core.input(manager->tree().terminalHandle(manager->focusedPane())), QByteArray("\x02"));
}

void WorkspaceTest::testNoActiveTab()
{
    Workspace workspace(nullptr, MultiplexerSettings());
    QVERIFY(workspace.handleKey(typed("x")).isEmpty());
    QVERIFY(workspace.handlePointer(PointerInput()).isEmpty());
    QVERIFY(!workspace.activePaneManager());
}

QTEST_GUILESS_MAIN(WorkspaceTest)

#include "moc_WorkspaceTest.cpp"
