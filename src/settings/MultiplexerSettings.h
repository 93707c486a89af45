/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MULTIPLEXERSETTINGS_H
#define MULTIPLEXERSETTINGS_H

#include <QString>

#include "splitmuxprivate_export.h"

class QSettings;

namespace Splitmux
{

/**
 * Read-only view of the "Multiplexer" settings group.
 *
 * The defaults below apply when a key is missing; values that make no
 * sense are replaced by a sane value and logged.
 */
struct SPLITMUXPRIVATE_EXPORT MultiplexerSettings {
    enum class LastPanePolicy { CloseTab, Protect };

    bool autoAttach = false;
    QString defaultSession; // empty: let tmux pick
    QString tmuxPath = QStringLiteral("tmux");
    int maxPanesPerTab = 64; // 0: unlimited
    double minRatio = 0.05;
    double maxRatio = 0.95;
    bool broadcastInputDefault = false;
    LastPanePolicy lastPanePolicy = LastPanePolicy::CloseTab;
    int commandTimeoutMs = 5000;
    int maxConsecutiveTimeouts = 3;
    QString prefixKey = QStringLiteral("C-b");
    bool autoResumePausedPanes = true;
    bool recoverPaneContent = true;

    static MultiplexerSettings load(QSettings &settings);
    void save(QSettings &settings) const;

    // Fixes out of range values in place; returns false if anything changed.
    bool sanitize();
};

} // namespace Splitmux

#endif // MULTIPLEXERSETTINGS_H
