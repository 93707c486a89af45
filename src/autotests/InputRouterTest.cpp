/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InputRouterTest.h"

#include <QTest>

#include "../input/InputRouter.h"

using namespace Splitmux;

static const QRectF Bounds(0, 0, 80, 24);

// a | (b / c)
static PaneTree threePanes(PaneId &a, PaneId &b, PaneId &c)
{
    a = allocatePaneId();
    PaneTree tree(a);
    b = tree.split(a, SplitDirection::Horizontal).value;
    c = tree.split(b, SplitDirection::Vertical).value;
    return tree;
}

static KeyInput key(const char *text)
{
    KeyInput input;
    input.key = Qt::Key_A;
    input.text = text;
    return input;
}

void InputRouterTest::testKeyGoesToFocusedPane()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = b;

    const InputRoute route = InputRouter::route(key("a"), focus, tree, Bounds);
    QCOMPARE(route.targets, QList<PaneId>{b});
    QCOMPARE(route.bytes, QByteArray("a"));
    QCOMPARE(route.focusRequest, InvalidPaneId);
}

void InputRouterTest::testBroadcastUsesTreeOrder()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = c;
    focus.broadcast = true;
    focus.broadcastPanes = {c, a, b};

    const InputRoute route = InputRouter::route(key("ls\r"), focus, tree, Bounds);
    const QList<PaneId> expected{a, b, c};
    QCOMPARE(route.targets, expected);
    QCOMPARE(route.bytes, QByteArray("ls\r"));
}

void InputRouterTest::testBroadcastSkipsExcludedPanes()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = a;
    focus.broadcast = true;
    focus.broadcastPanes = {a, c, allocatePaneId()};

    const InputRoute route = InputRouter::route(key("x"), focus, tree, Bounds);
    const QList<PaneId> expected{a, c};
    QCOMPARE(route.targets, expected);
}

void InputRouterTest::testKeyWithStaleFocus()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = allocatePaneId();

    const InputRoute route = InputRouter::route(key("q"), focus, tree, Bounds);
    QVERIFY(route.targets.isEmpty());
}

void InputRouterTest::testPointerPressRequestsFocus()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = a;

    PointerInput press;
    press.position = QPointF(60, 20);
    press.press = true;
    press.bytes = QByteArray("\033[M !!");

    InputRoute route = InputRouter::route(press, focus, tree, Bounds);
    QCOMPARE(route.targets, QList<PaneId>{c});
    QCOMPARE(route.focusRequest, c);
    QCOMPARE(route.bytes, press.bytes);

    // Motion over another pane reports there without moving focus.
    PointerInput motion;
    motion.position = QPointF(60, 2);
    route = InputRouter::route(motion, focus, tree, Bounds);
    QCOMPARE(route.targets, QList<PaneId>{b});
    QCOMPARE(route.focusRequest, InvalidPaneId);

    // Pressing the focused pane does not ask for focus again.
    press.position = QPointF(5, 5);
    route = InputRouter::route(press, focus, tree, Bounds);
    QCOMPARE(route.targets, QList<PaneId>{a});
    QCOMPARE(route.focusRequest, InvalidPaneId);
}

void InputRouterTest::testPointerOutsidePanes()
{
    PaneId a, b, c;
    const PaneTree tree = threePanes(a, b, c);
    FocusState focus;
    focus.focused = a;

    PointerInput press;
    press.position = QPointF(100, 5);
    press.press = true;

    const InputRoute route = InputRouter::route(press, focus, tree, Bounds);
    QVERIFY(route.targets.isEmpty());
    QCOMPARE(route.focusRequest, InvalidPaneId);
}

QTEST_GUILESS_MAIN(InputRouterTest)

#include "moc_InputRouterTest.cpp"
