/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MultiplexerSettings.h"

#include <QLoggingCategory>
#include <QSettings>

Q_LOGGING_CATEGORY(lcSettings, "splitmux.settings")

namespace Splitmux
{

static const QLatin1String GroupName("Multiplexer");

MultiplexerSettings MultiplexerSettings::load(QSettings &settings)
{
    MultiplexerSettings s;

    settings.beginGroup(GroupName);
    s.autoAttach = settings.value(QStringLiteral("autoAttach"), s.autoAttach).toBool();
    s.defaultSession = settings.value(QStringLiteral("defaultSession"), s.defaultSession).toString();
    s.tmuxPath = settings.value(QStringLiteral("tmuxPath"), s.tmuxPath).toString();
    s.maxPanesPerTab = settings.value(QStringLiteral("maxPanesPerTab"), s.maxPanesPerTab).toInt();
    s.minRatio = settings.value(QStringLiteral("minRatio"), s.minRatio).toDouble();
    s.maxRatio = settings.value(QStringLiteral("maxRatio"), s.maxRatio).toDouble();
    s.broadcastInputDefault = settings.value(QStringLiteral("broadcastInputDefault"), s.broadcastInputDefault).toBool();
    const QString policy = settings.value(QStringLiteral("lastPanePolicy"), QStringLiteral("CloseTab")).toString();
    if (policy.compare(QLatin1String("Protect"), Qt::CaseInsensitive) == 0) {
        s.lastPanePolicy = LastPanePolicy::Protect;
    } else if (policy.compare(QLatin1String("CloseTab"), Qt::CaseInsensitive) != 0) {
        qCWarning(lcSettings) << "Unknown lastPanePolicy" << policy << "- using CloseTab";
    }
    s.commandTimeoutMs = settings.value(QStringLiteral("commandTimeoutMs"), s.commandTimeoutMs).toInt();
    s.maxConsecutiveTimeouts = settings.value(QStringLiteral("maxConsecutiveTimeouts"), s.maxConsecutiveTimeouts).toInt();
    s.prefixKey = settings.value(QStringLiteral("prefixKey"), s.prefixKey).toString();
    s.autoResumePausedPanes = settings.value(QStringLiteral("autoResumePausedPanes"), s.autoResumePausedPanes).toBool();
    s.recoverPaneContent = settings.value(QStringLiteral("recoverPaneContent"), s.recoverPaneContent).toBool();
    settings.endGroup();

    s.sanitize();
    return s;
}

void MultiplexerSettings::save(QSettings &settings) const
{
    settings.beginGroup(GroupName);
    settings.setValue(QStringLiteral("autoAttach"), autoAttach);
    settings.setValue(QStringLiteral("defaultSession"), defaultSession);
    settings.setValue(QStringLiteral("tmuxPath"), tmuxPath);
    settings.setValue(QStringLiteral("maxPanesPerTab"), maxPanesPerTab);
    settings.setValue(QStringLiteral("minRatio"), minRatio);
    settings.setValue(QStringLiteral("maxRatio"), maxRatio);
    settings.setValue(QStringLiteral("broadcastInputDefault"), broadcastInputDefault);
    settings.setValue(QStringLiteral("lastPanePolicy"), lastPanePolicy == LastPanePolicy::Protect ? QStringLiteral("Protect") : QStringLiteral("CloseTab"));
    settings.setValue(QStringLiteral("commandTimeoutMs"), commandTimeoutMs);
    settings.setValue(QStringLiteral("maxConsecutiveTimeouts"), maxConsecutiveTimeouts);
    settings.setValue(QStringLiteral("prefixKey"), prefixKey);
    settings.setValue(QStringLiteral("autoResumePausedPanes"), autoResumePausedPanes);
    settings.setValue(QStringLiteral("recoverPaneContent"), recoverPaneContent);
    settings.endGroup();
}

bool MultiplexerSettings::sanitize()
{
    const MultiplexerSettings defaults;
    bool clean = true;

    if (minRatio > maxRatio) {
        qCWarning(lcSettings) << "minRatio" << minRatio << "is above maxRatio" << maxRatio << "- swapping";
        qSwap(minRatio, maxRatio);
        clean = false;
    }
    if (!(minRatio > 0.0 && minRatio < 0.5)) {
        qCWarning(lcSettings) << "minRatio" << minRatio << "out of range - using" << defaults.minRatio;
        minRatio = defaults.minRatio;
        clean = false;
    }
    if (!(maxRatio > 0.5 && maxRatio < 1.0)) {
        qCWarning(lcSettings) << "maxRatio" << maxRatio << "out of range - using" << defaults.maxRatio;
        maxRatio = defaults.maxRatio;
        clean = false;
    }
    if (maxPanesPerTab < 0) {
        qCWarning(lcSettings) << "maxPanesPerTab" << maxPanesPerTab << "is negative - using" << defaults.maxPanesPerTab;
        maxPanesPerTab = defaults.maxPanesPerTab;
        clean = false;
    }
    if (commandTimeoutMs <= 0) {
        qCWarning(lcSettings) << "commandTimeoutMs" << commandTimeoutMs << "is not positive - using" << defaults.commandTimeoutMs;
        commandTimeoutMs = defaults.commandTimeoutMs;
        clean = false;
    }
    if (maxConsecutiveTimeouts <= 0) {
        qCWarning(lcSettings) << "maxConsecutiveTimeouts" << maxConsecutiveTimeouts << "is not positive - using" << defaults.maxConsecutiveTimeouts;
        maxConsecutiveTimeouts = defaults.maxConsecutiveTimeouts;
        clean = false;
    }
    if (tmuxPath.isEmpty()) {
        tmuxPath = defaults.tmuxPath;
        clean = false;
    }
    if (prefixKey.isEmpty()) {
        prefixKey = defaults.prefixKey;
        clean = false;
    }

    return clean;
}

} // namespace Splitmux
