/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InputRouter.h"

#include <QLoggingCategory>

#include <type_traits>

Q_LOGGING_CATEGORY(lcInputRouter, "splitmux.input")

namespace Splitmux
{

InputRoute InputRouter::route(const InputEvent &event, const FocusState &focus, const PaneTree &tree, const QRectF &contentBounds)
{
    InputRoute result;

    std::visit(
        [&](const auto &input) {
            using T = std::decay_t<decltype(input)>;

            if constexpr (std::is_same_v<T, KeyInput>) {
                result.bytes = input.text;
                if (focus.broadcast) {
                    // Tree order, so every pane sees the same write sequence.
                    const auto panes = tree.panes();
                    for (PaneId pane : panes) {
                        if (focus.broadcastPanes.contains(pane)) {
                            result.targets.append(pane);
                        }
                    }
                } else if (tree.contains(focus.focused)) {
                    result.targets.append(focus.focused);
                }
            } else if constexpr (std::is_same_v<T, PointerInput>) {
                const PaneId hovered = tree.paneAt(input.position, contentBounds);
                if (hovered == InvalidPaneId) {
                    qCDebug(lcInputRouter) << "pointer event outside any pane at" << input.position;
                    return;
                }
                result.targets.append(hovered);
                result.bytes = input.bytes;
                if (input.press && hovered != focus.focused) {
                    result.focusRequest = hovered;
                }
            }
        },
        event);

    return result;
}

} // namespace Splitmux
