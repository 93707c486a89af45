/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MultiplexerSettingsTest.h"

#include <QSettings>
#include <QTemporaryDir>
#include <QTest>

#include "../settings/MultiplexerSettings.h"

using namespace Splitmux;

void MultiplexerSettingsTest::testDefaultsForEmptyFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings file(dir.filePath(QStringLiteral("splitmuxrc")), QSettings::IniFormat);

    const MultiplexerSettings settings = MultiplexerSettings::load(file);
    QCOMPARE(settings.autoAttach, false);
    QVERIFY(settings.defaultSession.isEmpty());
    QCOMPARE(settings.tmuxPath, QStringLiteral("tmux"));
    QCOMPARE(settings.maxPanesPerTab, 64);
    QCOMPARE(settings.minRatio, 0.05);
    QCOMPARE(settings.maxRatio, 0.95);
    QVERIFY(settings.lastPanePolicy == MultiplexerSettings::LastPanePolicy::CloseTab);
    QCOMPARE(settings.commandTimeoutMs, 5000);
    QCOMPARE(settings.maxConsecutiveTimeouts, 3);
    QCOMPARE(settings.prefixKey, QStringLiteral("C-b"));
    QVERIFY(settings.autoResumePausedPanes);
    QVERIFY(settings.recoverPaneContent);
}

void MultiplexerSettingsTest::testSaveThenLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("splitmuxrc"));

    MultiplexerSettings written;
    written.autoAttach = true;
    written.defaultSession = QStringLiteral("work");
    written.tmuxPath = QStringLiteral("/opt/tmux/bin/tmux");
    written.maxPanesPerTab = 8;
    written.minRatio = 0.1;
    written.maxRatio = 0.9;
    written.broadcastInputDefault = true;
    written.lastPanePolicy = MultiplexerSettings::LastPanePolicy::Protect;
    written.commandTimeoutMs = 1500;
    written.prefixKey = QStringLiteral("C-a");
    written.recoverPaneContent = false;
    {
        QSettings file(path, QSettings::IniFormat);
        written.save(file);
    }

    QSettings file(path, QSettings::IniFormat);
    QCOMPARE(file.value(QStringLiteral("Multiplexer/defaultSession")).toString(), QStringLiteral("work"));

    const MultiplexerSettings read = MultiplexerSettings::load(file);
    QCOMPARE(read.autoAttach, true);
    QCOMPARE(read.defaultSession, QStringLiteral("work"));
    QCOMPARE(read.tmuxPath, QStringLiteral("/opt/tmux/bin/tmux"));
    QCOMPARE(read.maxPanesPerTab, 8);
    QCOMPARE(read.minRatio, 0.1);
    QCOMPARE(read.maxRatio, 0.9);
    QVERIFY(read.broadcastInputDefault);
    QVERIFY(read.lastPanePolicy == MultiplexerSettings::LastPanePolicy::Protect);
    QCOMPARE(read.commandTimeoutMs, 1500);
    QCOMPARE(read.prefixKey, QStringLiteral("C-a"));
    QVERIFY(!read.recoverPaneContent);
}

void MultiplexerSettingsTest::testOutOfRangeValuesAreReplaced()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings file(dir.filePath(QStringLiteral("splitmuxrc")), QSettings::IniFormat);
    file.beginGroup(QStringLiteral("Multiplexer"));
    file.setValue(QStringLiteral("minRatio"), 0.7);
    file.setValue(QStringLiteral("maxRatio"), 1.5);
    file.setValue(QStringLiteral("maxPanesPerTab"), -3);
    file.setValue(QStringLiteral("commandTimeoutMs"), 0);
    file.setValue(QStringLiteral("maxConsecutiveTimeouts"), -1);
    file.setValue(QStringLiteral("tmuxPath"), QString());
    file.endGroup();

    const MultiplexerSettings settings = MultiplexerSettings::load(file);
    QCOMPARE(settings.minRatio, 0.05);
    QCOMPARE(settings.maxRatio, 0.95);
    QCOMPARE(settings.maxPanesPerTab, 64);
    QCOMPARE(settings.commandTimeoutMs, 5000);
    QCOMPARE(settings.maxConsecutiveTimeouts, 3);
    QCOMPARE(settings.tmuxPath, QStringLiteral("tmux"));
}

void MultiplexerSettingsTest::testUnknownPolicyFallsBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings file(dir.filePath(QStringLiteral("splitmuxrc")), QSettings::IniFormat);
    file.setValue(QStringLiteral("Multiplexer/lastPanePolicy"), QStringLiteral("Explode"));

    const MultiplexerSettings settings = MultiplexerSettings::load(file);
    QVERIFY(settings.lastPanePolicy == MultiplexerSettings::LastPanePolicy::CloseTab);

    file.setValue(QStringLiteral("Multiplexer/lastPanePolicy"), QStringLiteral("protect"));
    QVERIFY(MultiplexerSettings::load(file).lastPanePolicy == MultiplexerSettings::LastPanePolicy::Protect);
}

void MultiplexerSettingsTest::testSanitizeSwapsRatios()
{
    MultiplexerSettings settings;
    QVERIFY(settings.sanitize());

    settings.minRatio = 0.8;
    settings.maxRatio = 0.2;
    QVERIFY(!settings.sanitize());
    QCOMPARE(settings.minRatio, 0.2);
    QCOMPARE(settings.maxRatio, 0.8);
}

QTEST_GUILESS_MAIN(MultiplexerSettingsTest)

#include "moc_MultiplexerSettingsTest.cpp"
