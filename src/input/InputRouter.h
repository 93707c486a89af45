/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INPUTROUTER_H
#define INPUTROUTER_H

#include <QByteArray>
#include <QList>

#include "InputEvent.h"
#include "pane/PaneManager.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

struct InputRoute {
    QList<PaneId> targets;
    QByteArray bytes;
    // Pointer press on a pane other than the focused one.
    PaneId focusRequest = InvalidPaneId;
};

/**
 * Decides where an input event goes. Delivery is the caller's job.
 */
class SPLITMUXPRIVATE_EXPORT InputRouter
{
public:
    static InputRoute route(const InputEvent &event, const FocusState &focus, const PaneTree &tree, const QRectF &contentBounds);
};

} // namespace Splitmux

#endif // INPUTROUTER_H
