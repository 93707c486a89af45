/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXCOMMAND_H
#define TMUXCOMMAND_H

#include <QString>
#include <QStringList>

namespace Splitmux
{

/**
 * Builds one line of the tmux command language.
 *
 *     TmuxCommand(QStringLiteral("split-window")).flag(QStringLiteral("-h")).paneTarget(3).build()
 *     // "split-window -h -t %3"
 */
class TmuxCommand
{
public:
    explicit TmuxCommand(const QString &verb)
        : _verb(verb)
    {
    }

    const QString &verb() const
    {
        return _verb;
    }

    TmuxCommand &paneTarget(int paneId)
    {
        _parts.append(QStringLiteral("-t %") + QString::number(paneId));
        return *this;
    }

    TmuxCommand &windowTarget(int windowId)
    {
        _parts.append(QStringLiteral("-t @") + QString::number(windowId));
        return *this;
    }

    // "-t :N", a window index in the current session.
    TmuxCommand &windowIndexTarget(int index)
    {
        _parts.append(QStringLiteral("-t :") + QString::number(index));
        return *this;
    }

    TmuxCommand &sessionTarget(const QString &name)
    {
        _parts.append(QStringLiteral("-t ") + quoted(name));
        return *this;
    }

    TmuxCommand &flag(const QString &f)
    {
        _parts.append(f);
        return *this;
    }

    TmuxCommand &format(const QString &fmt)
    {
        _parts.append(QStringLiteral("-F \"") + fmt + QLatin1Char('"'));
        return *this;
    }

    // "-C cols,rows" for refresh-client.
    TmuxCommand &clientSize(int columns, int rows)
    {
        _parts.append(QStringLiteral("-C %1,%2").arg(columns).arg(rows));
        return *this;
    }

    TmuxCommand &quotedArg(const QString &value)
    {
        _parts.append(quoted(value));
        return *this;
    }

    TmuxCommand &arg(const QString &value)
    {
        _parts.append(value);
        return *this;
    }

    QString build() const
    {
        QString result = _verb;
        for (const QString &part : _parts) {
            result += QLatin1Char(' ') + part;
        }
        return result;
    }

    // Single-quoted tmux word; embedded quotes are closed, escaped and reopened.
    static QString quoted(const QString &value)
    {
        QString escaped = value;
        escaped.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
        return QLatin1Char('\'') + escaped + QLatin1Char('\'');
    }

private:
    QString _verb;
    QStringList _parts;
};

} // namespace Splitmux

#endif // TMUXCOMMAND_H
