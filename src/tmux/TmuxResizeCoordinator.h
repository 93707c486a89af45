/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXRESIZECOORDINATOR_H
#define TMUXRESIZECOORDINATOR_H

#include <QHash>
#include <QObject>
#include <QSize>
#include <QTimer>

#include "splitmuxprivate_export.h"

namespace Splitmux
{

class TmuxControlSession;

/**
 * Tells tmux how big this client is.
 *
 * Size changes are collapsed for 100 ms and only sent when they differ
 * from what tmux was last told. Also remembers the cell size of every
 * remote window as reported by its layout.
 */
class SPLITMUXPRIVATE_EXPORT TmuxResizeCoordinator : public QObject
{
    Q_OBJECT
public:
    explicit TmuxResizeCoordinator(TmuxControlSession *session, QObject *parent = nullptr);

    void setClientSize(int columns, int rows);
    QSize clientSize() const;
    // Sends a pending size right away.
    void sendClientSize();
    void stop();

    void setWindowSize(int windowId, int columns, int rows);
    QSize windowSize(int windowId) const;
    void removeWindow(int windowId);
    void clear();

private:
    TmuxControlSession *_session;

    QTimer _resizeTimer;
    QSize _pendingSize;
    QSize _lastSentSize;
    QHash<int, QSize> _windowSizes;
};

} // namespace Splitmux

#endif // TMUXRESIZECOORDINATOR_H
