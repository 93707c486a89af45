/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INPUTEVENT_H
#define INPUTEVENT_H

#include <QByteArray>
#include <QPointF>
#include <Qt>

#include <variant>

namespace Splitmux
{

// A key press as delivered by the window system, already translated to the
// bytes the terminal expects.
struct KeyInput {
    int key = 0; // Qt::Key
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
    QByteArray text;
};

// Mouse press or report at a position in tab content coordinates. `bytes`
// is the mouse report, empty when the terminal has mouse tracking off.
struct PointerInput {
    QPointF position;
    bool press = false;
    QByteArray bytes;
};

using InputEvent = std::variant<KeyInput, PointerInput>;

} // namespace Splitmux

#endif // INPUTEVENT_H
