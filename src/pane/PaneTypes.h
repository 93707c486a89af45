/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANETYPES_H
#define PANETYPES_H

#include <QMetaType>
#include <QtGlobal>

namespace Splitmux
{

// Process-unique, never reused. 0 is never handed out.
using PaneId = quint64;
using TabId = int;
// Issued by the terminal core; 0 is the null handle.
using TerminalHandle = quint64;

const PaneId InvalidPaneId = 0;
const TabId InvalidTabId = -1;
const TerminalHandle NullTerminalHandle = 0;

// Horizontal places the children side by side, Vertical stacks them.
enum class SplitDirection { Horizontal, Vertical };

enum class NavigationDirection { Left, Right, Up, Down };

enum class Authority { Local, Remote };

enum class PaneError { None, NotFound, PaneLimitExceeded, RemoteManaged, LastPaneProtected };

template<typename T>
struct PaneResult {
    T value{};
    PaneError error = PaneError::None;

    bool ok() const
    {
        return error == PaneError::None;
    }
};

inline SplitDirection axisOf(NavigationDirection direction)
{
    return (direction == NavigationDirection::Left || direction == NavigationDirection::Right) ? SplitDirection::Horizontal : SplitDirection::Vertical;
}

inline const char *paneErrorName(PaneError error)
{
    switch (error) {
    case PaneError::None:
        return "None";
    case PaneError::NotFound:
        return "NotFound";
    case PaneError::PaneLimitExceeded:
        return "PaneLimitExceeded";
    case PaneError::RemoteManaged:
        return "RemoteManaged";
    case PaneError::LastPaneProtected:
        return "LastPaneProtected";
    }
    return "Unknown";
}

/**
 * A structural request made against a remote-authoritative tab.
 * The local tree is left untouched; the sync engine turns the
 * request into a tmux command and the change arrives back as a
 * layout notification.
 */
struct PaneRequest {
    enum Kind { Split, Close, Resize, Focus };

    Kind kind = Split;
    TabId tab = InvalidTabId;
    PaneId pane = InvalidPaneId;
    SplitDirection direction = SplitDirection::Horizontal; // Split
    NavigationDirection resizeDirection = NavigationDirection::Right; // Resize
    qreal delta = 0.0; // Resize, fraction of the window extent
};

} // namespace Splitmux

Q_DECLARE_METATYPE(Splitmux::PaneRequest)

#endif // PANETYPES_H
