/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QSettings>
#include <QTextStream>

#include "Workspace.h"
#include "session/VirtualTerminalCore.h"
#include "settings/MultiplexerSettings.h"
#include "tmux/TmuxControlSession.h"
#include "tmux/TmuxSessionBridge.h"
#include "tmux/TmuxSyncEngine.h"

Q_LOGGING_CATEGORY(lcAttach, "splitmux.attach")

using namespace Splitmux;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("splitmux-attach"));
    QCoreApplication::setOrganizationName(QStringLiteral("splitmux"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Mirror a tmux session into a headless split-pane workspace."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption sessionOption(QStringLiteral("session"), QStringLiteral("tmux session to attach to."), QStringLiteral("name"));
    const QCommandLineOption tmuxOption(QStringLiteral("tmux"), QStringLiteral("Path of the tmux binary."), QStringLiteral("path"));
    const QCommandLineOption sizeOption(QStringLiteral("size"), QStringLiteral("Client size in cells."), QStringLiteral("COLSxROWS"), QStringLiteral("80x24"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"), QStringLiteral("Settings file (INI)."), QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug output."));
    const QCommandLineOption listOption(QStringLiteral("list"), QStringLiteral("Print the server's sessions and exit."));
    parser.addOptions({sessionOption, tmuxOption, sizeOption, settingsOption, verboseOption, listOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("splitmux.*.debug=true"));
    }

    MultiplexerSettings settings;
    if (parser.isSet(settingsOption)) {
        QSettings file(parser.value(settingsOption), QSettings::IniFormat);
        settings = MultiplexerSettings::load(file);
    } else {
        QSettings user;
        settings = MultiplexerSettings::load(user);
    }
    if (parser.isSet(tmuxOption)) {
        settings.tmuxPath = parser.value(tmuxOption);
    }

    static const QRegularExpression sizePattern(QStringLiteral("^(\\d+)x(\\d+)$"));
    const QRegularExpressionMatch sizeMatch = sizePattern.match(parser.value(sizeOption));
    if (!sizeMatch.hasMatch()) {
        qCCritical(lcAttach) << "invalid --size" << parser.value(sizeOption) << "- expected COLSxROWS";
        return 1;
    }
    const int columns = sizeMatch.captured(1).toInt();
    const int rows = sizeMatch.captured(2).toInt();

    VirtualTerminalCore core;
    Workspace workspace(&core, settings);
    TmuxSessionBridge bridge(&workspace);

    QObject::connect(&workspace, &Workspace::tabCreated, &app, [&app, &workspace](TabId tab) {
        PaneManager *manager = workspace.paneManager(tab);
        QObject::connect(manager, &PaneManager::layoutChanged, &app, [&workspace](TabId changed) {
            const PaneManager *m = workspace.paneManager(changed);
            if (m) {
                qCInfo(lcAttach).noquote() << "tab" << changed << workspace.tabTitle(changed) << m->tree().describe(true);
            }
        });
    });
    QObject::connect(&workspace, &Workspace::tabClosed, &app, [](TabId tab) {
        qCInfo(lcAttach) << "tab" << tab << "closed";
    });
    QObject::connect(&workspace, &Workspace::windowTitleChanged, &app, [](const QString &title) {
        qCInfo(lcAttach) << "session" << title;
    });

    const bool listing = parser.isSet(listOption);
    // Listing needs a running server, not a new session.
    bridge.setCreateSessionIfMissing(!listing);

    QObject::connect(&bridge, &TmuxSessionBridge::attached, &app, [&bridge, columns, rows, listing]() {
        qCInfo(lcAttach) << "attached";
        TmuxSyncEngine *engine = bridge.syncEngine();
        engine->setClientSize(columns, rows);
        if (!listing) {
            return;
        }
        QObject::connect(engine, &TmuxSyncEngine::sessionsListed, engine, [engine](const QList<TmuxSessionInfo> &sessions) {
            QTextStream out(stdout);
            for (const TmuxSessionInfo &info : sessions) {
                out << QLatin1Char('$') << info.sessionId << QLatin1Char('\t') << info.name << QLatin1Char('\t') << info.windows
                    << (info.windows == 1 ? QStringLiteral(" window") : QStringLiteral(" windows"))
                    << (info.attached ? QStringLiteral(" (attached)") : QString()) << QLatin1Char('\n');
            }
            out.flush();
            engine->detach();
        });
        engine->listSessions();
    });
    QObject::connect(&bridge, &TmuxSessionBridge::detached, &app, [&bridge, &workspace](const QString &reason) {
        qCInfo(lcAttach) << "detached:" << reason << "-" << workspace.tabs().size() << "tab(s) left";
        const bool lost = bridge.session() && bridge.session()->state() == TmuxControlSession::State::Errored;
        QCoreApplication::exit(lost ? 1 : 0);
    });
    QObject::connect(&bridge, &TmuxSessionBridge::failed, &app, [](const QString &error) {
        qCCritical(lcAttach) << "tmux failed:" << error;
        QCoreApplication::exit(1);
    });

    const QString sessionName = parser.isSet(sessionOption) ? parser.value(sessionOption) : settings.defaultSession;
    bridge.start(sessionName);
    bridge.syncEngine()->setClientSize(columns, rows);

    return app.exec();
}
