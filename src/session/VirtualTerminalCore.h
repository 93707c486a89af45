/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef VIRTUALTERMINALCORE_H
#define VIRTUALTERMINALCORE_H

#include <QHash>
#include <QObject>
#include <QSize>

#include "TerminalCore.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

/**
 * Terminal core for panes that have no PTY.
 *
 * Output is injected programmatically and accumulated per handle; input is
 * recorded. Used by the headless driver and by the tests.
 */
class SPLITMUXPRIVATE_EXPORT VirtualTerminalCore : public QObject, public TerminalCore
{
    Q_OBJECT
public:
    explicit VirtualTerminalCore(QObject *parent = nullptr);
    ~VirtualTerminalCore() override;

    TerminalHandle createTerminal(PaneId pane) override;
    void destroyTerminal(TerminalHandle handle) override;
    void writeInput(TerminalHandle handle, const QByteArray &bytes) override;
    void injectOutput(TerminalHandle handle, const QByteArray &bytes) override;
    void resizeTerminal(TerminalHandle handle, int columns, int lines) override;

    bool isAlive(TerminalHandle handle) const;
    int liveCount() const;
    PaneId paneFor(TerminalHandle handle) const;
    QByteArray input(TerminalHandle handle) const;
    QByteArray output(TerminalHandle handle) const;
    QSize size(TerminalHandle handle) const;

Q_SIGNALS:
    void terminalCreated(Splitmux::TerminalHandle handle, Splitmux::PaneId pane);
    void terminalDestroyed(Splitmux::TerminalHandle handle);
    void inputWritten(Splitmux::TerminalHandle handle, const QByteArray &bytes);
    void outputInjected(Splitmux::TerminalHandle handle, const QByteArray &bytes);

private:
    struct Terminal {
        PaneId pane = InvalidPaneId;
        QByteArray input;
        QByteArray output;
        QSize size;
    };

    QHash<TerminalHandle, Terminal> _terminals;
    TerminalHandle _nextHandle = 1;
};

} // namespace Splitmux

#endif // VIRTUALTERMINALCORE_H
