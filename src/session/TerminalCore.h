/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALCORE_H
#define TERMINALCORE_H

#include <QByteArray>

#include "pane/PaneTypes.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

/**
 * Boundary to the library that owns terminal emulation and PTY I/O.
 *
 * The layout core only associates handles with panes and moves bytes in;
 * styled output is read by the renderer directly from the handle.
 */
class SPLITMUXPRIVATE_EXPORT TerminalCore
{
public:
    virtual ~TerminalCore() = default;

    virtual TerminalHandle createTerminal(PaneId pane) = 0;
    virtual void destroyTerminal(TerminalHandle handle) = 0;

    // Keyboard and pointer bytes typed by the user.
    virtual void writeInput(TerminalHandle handle, const QByteArray &bytes) = 0;

    // Output produced elsewhere (a remote pane) fed into the emulation as if
    // it had come from a PTY.
    virtual void injectOutput(TerminalHandle handle, const QByteArray &bytes) = 0;

    virtual void resizeTerminal(TerminalHandle handle, int columns, int lines) = 0;
};

} // namespace Splitmux

#endif // TERMINALCORE_H
