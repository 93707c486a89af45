/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxResizeCoordinator.h"

#include "TmuxCommand.h"
#include "TmuxControlSession.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTmuxLayout)

namespace Splitmux
{

TmuxResizeCoordinator::TmuxResizeCoordinator(TmuxControlSession *session, QObject *parent)
    : QObject(parent)
    , _session(session)
{
    _resizeTimer.setSingleShot(true);
    _resizeTimer.setInterval(100);
    connect(&_resizeTimer, &QTimer::timeout, this, &TmuxResizeCoordinator::sendClientSize);
}

void TmuxResizeCoordinator::setClientSize(int columns, int rows)
{
    // tmux refuses sizes outside 1..10000 on either axis.
    const QSize size(qBound(1, columns, 10000), qBound(1, rows, 10000));
    if (size == _pendingSize) {
        return;
    }
    _pendingSize = size;
    _resizeTimer.start();
}

QSize TmuxResizeCoordinator::clientSize() const
{
    return _pendingSize;
}

void TmuxResizeCoordinator::sendClientSize()
{
    _resizeTimer.stop();
    if (!_pendingSize.isValid() || _pendingSize == _lastSentSize || _session->isTerminated()) {
        return;
    }
    _lastSentSize = _pendingSize;
    qCDebug(lcTmuxLayout) << "client size" << _pendingSize;
    _session->sendCommand(TmuxCommand(QStringLiteral("refresh-client")).clientSize(_pendingSize.width(), _pendingSize.height()));
}

void TmuxResizeCoordinator::stop()
{
    _resizeTimer.stop();
}

void TmuxResizeCoordinator::setWindowSize(int windowId, int columns, int rows)
{
    _windowSizes.insert(windowId, QSize(columns, rows));
}

QSize TmuxResizeCoordinator::windowSize(int windowId) const
{
    return _windowSizes.value(windowId);
}

void TmuxResizeCoordinator::removeWindow(int windowId)
{
    _windowSizes.remove(windowId);
}

void TmuxResizeCoordinator::clear()
{
    _resizeTimer.stop();
    _windowSizes.clear();
    _lastSentSize = QSize();
}

} // namespace Splitmux

#include "moc_TmuxResizeCoordinator.cpp"
