/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "VirtualTerminalCore.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcVirtualTerminal, "splitmux.pane")

namespace Splitmux
{

VirtualTerminalCore::VirtualTerminalCore(QObject *parent)
    : QObject(parent)
{
}

VirtualTerminalCore::~VirtualTerminalCore() = default;

TerminalHandle VirtualTerminalCore::createTerminal(PaneId pane)
{
    const TerminalHandle handle = _nextHandle++;
    Terminal terminal;
    terminal.pane = pane;
    _terminals.insert(handle, terminal);
    Q_EMIT terminalCreated(handle, pane);
    return handle;
}

void VirtualTerminalCore::destroyTerminal(TerminalHandle handle)
{
    if (_terminals.remove(handle) == 0) {
        qCWarning(lcVirtualTerminal) << "destroyTerminal: unknown handle" << handle;
        return;
    }
    Q_EMIT terminalDestroyed(handle);
}

void VirtualTerminalCore::writeInput(TerminalHandle handle, const QByteArray &bytes)
{
    auto it = _terminals.find(handle);
    if (it == _terminals.end()) {
        qCWarning(lcVirtualTerminal) << "writeInput: unknown handle" << handle;
        return;
    }
    it->input.append(bytes);
    Q_EMIT inputWritten(handle, bytes);
}

void VirtualTerminalCore::injectOutput(TerminalHandle handle, const QByteArray &bytes)
{
    auto it = _terminals.find(handle);
    if (it == _terminals.end()) {
        return;
    }
    it->output.append(bytes);
    Q_EMIT outputInjected(handle, bytes);
}

void VirtualTerminalCore::resizeTerminal(TerminalHandle handle, int columns, int lines)
{
    auto it = _terminals.find(handle);
    if (it != _terminals.end()) {
        it->size = QSize(columns, lines);
    }
}

bool VirtualTerminalCore::isAlive(TerminalHandle handle) const
{
    return _terminals.contains(handle);
}

int VirtualTerminalCore::liveCount() const
{
    return _terminals.size();
}

PaneId VirtualTerminalCore::paneFor(TerminalHandle handle) const
{
    return _terminals.value(handle).pane;
}

QByteArray VirtualTerminalCore::input(TerminalHandle handle) const
{
    return _terminals.value(handle).input;
}

QByteArray VirtualTerminalCore::output(TerminalHandle handle) const
{
    return _terminals.value(handle).output;
}

QSize VirtualTerminalCore::size(TerminalHandle handle) const
{
    return _terminals.value(handle).size;
}

} // namespace Splitmux

#include "moc_VirtualTerminalCore.cpp"
