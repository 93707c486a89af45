/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxPrefixKey.h"

namespace Splitmux
{

// Modifiers that never change which key binding was pressed.
static const Qt::KeyboardModifiers IgnoredModifiers = Qt::KeypadModifier | Qt::GroupSwitchModifier;

TmuxPrefixKey::TmuxPrefixKey()
    : TmuxPrefixKey(Qt::Key_B, Qt::ControlModifier)
{
}

TmuxPrefixKey::TmuxPrefixKey(int key, Qt::KeyboardModifiers modifiers)
    : _key(key)
    , _modifiers(modifiers)
{
}

std::optional<TmuxPrefixKey> TmuxPrefixKey::parse(const QString &notation)
{
    QString rest = notation.trimmed();
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;

    while (rest.size() > 2 && rest.at(1) == QLatin1Char('-')) {
        const QChar m = rest.at(0).toUpper();
        if (m == QLatin1Char('C')) {
            modifiers |= Qt::ControlModifier;
        } else if (m == QLatin1Char('M')) {
            modifiers |= Qt::AltModifier;
        } else if (m == QLatin1Char('S')) {
            modifiers |= Qt::ShiftModifier;
        } else {
            return std::nullopt;
        }
        rest = rest.mid(2);
    }

    if (rest.compare(QLatin1String("Space"), Qt::CaseInsensitive) == 0) {
        return TmuxPrefixKey(Qt::Key_Space, modifiers);
    }
    if (rest.size() != 1) {
        return std::nullopt;
    }

    const QChar c = rest.at(0);
    if (c.isLetter() && c.unicode() < 0x80) {
        return TmuxPrefixKey(Qt::Key_A + (c.toLower().unicode() - 'a'), modifiers);
    }
    if (c.isDigit() && c.unicode() < 0x80) {
        return TmuxPrefixKey(Qt::Key_0 + (c.unicode() - '0'), modifiers);
    }
    // Plain punctuation keys share their Qt::Key value with the character.
    if (c.unicode() > 0x20 && c.unicode() < 0x7f) {
        return TmuxPrefixKey(c.unicode(), modifiers);
    }
    return std::nullopt;
}

int TmuxPrefixKey::key() const
{
    return _key;
}

Qt::KeyboardModifiers TmuxPrefixKey::modifiers() const
{
    return _modifiers;
}

QString TmuxPrefixKey::toString() const
{
    QString result;
    if (_modifiers & Qt::ControlModifier) {
        result += QLatin1String("C-");
    }
    if (_modifiers & Qt::AltModifier) {
        result += QLatin1String("M-");
    }
    if (_modifiers & Qt::ShiftModifier) {
        result += QLatin1String("S-");
    }
    if (_key == Qt::Key_Space) {
        result += QLatin1String("Space");
    } else if (_key >= Qt::Key_A && _key <= Qt::Key_Z) {
        result += QLatin1Char(char('a' + (_key - Qt::Key_A)));
    } else {
        result += QChar(_key);
    }
    return result;
}

bool TmuxPrefixKey::matches(const KeyInput &input) const
{
    return input.key == _key && (input.modifiers & ~IgnoredModifiers) == _modifiers;
}

QByteArray TmuxPrefixKey::prefixBytes() const
{
    QByteArray bytes;
    char c;
    if (_key == Qt::Key_Space) {
        c = ' ';
    } else if (_key >= Qt::Key_A && _key <= Qt::Key_Z) {
        c = char('a' + (_key - Qt::Key_A));
    } else {
        c = char(_key);
    }

    if (_modifiers & Qt::ControlModifier) {
        // C-Space is NUL, C-a..C-z are 0x01..0x1a.
        c = (c == ' ') ? '\0' : char(c & 0x1f);
    }
    if (_modifiers & Qt::AltModifier) {
        bytes.append('\033');
    }
    bytes.append(c);
    return bytes;
}

std::optional<TmuxCommand> TmuxPrefixKey::translateCommandKey(const KeyInput &input, int remotePaneId)
{
    switch (input.key) {
    case Qt::Key_Left:
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-L")).paneTarget(remotePaneId);
    case Qt::Key_Right:
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-R")).paneTarget(remotePaneId);
    case Qt::Key_Up:
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-U")).paneTarget(remotePaneId);
    case Qt::Key_Down:
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-D")).paneTarget(remotePaneId);
    case Qt::Key_Space:
        return TmuxCommand(QStringLiteral("next-layout")).paneTarget(remotePaneId);
    default:
        break;
    }

    if (input.text.size() != 1) {
        return std::nullopt;
    }

    const char c = input.text.at(0);
    if (c >= '0' && c <= '9') {
        return TmuxCommand(QStringLiteral("select-window")).windowIndexTarget(c - '0');
    }

    switch (c) {
    case '%':
        return TmuxCommand(QStringLiteral("split-window")).flag(QStringLiteral("-h")).paneTarget(remotePaneId);
    case '"':
        return TmuxCommand(QStringLiteral("split-window")).flag(QStringLiteral("-v")).paneTarget(remotePaneId);
    case 'x':
        return TmuxCommand(QStringLiteral("kill-pane")).paneTarget(remotePaneId);
    case 'z':
        return TmuxCommand(QStringLiteral("resize-pane")).flag(QStringLiteral("-Z")).paneTarget(remotePaneId);
    case 'c':
        return TmuxCommand(QStringLiteral("new-window"));
    case 'n':
        return TmuxCommand(QStringLiteral("next-window"));
    case 'p':
        return TmuxCommand(QStringLiteral("previous-window"));
    case 'o':
        return TmuxCommand(QStringLiteral("select-pane")).arg(QStringLiteral("-t :.+"));
    case ';':
        return TmuxCommand(QStringLiteral("last-pane"));
    case 'h':
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-L")).paneTarget(remotePaneId);
    case 'j':
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-D")).paneTarget(remotePaneId);
    case 'k':
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-U")).paneTarget(remotePaneId);
    case 'l':
        return TmuxCommand(QStringLiteral("select-pane")).flag(QStringLiteral("-R")).paneTarget(remotePaneId);
    case 'd':
        return TmuxCommand(QStringLiteral("detach-client"));
    default:
        return std::nullopt;
    }
}

} // namespace Splitmux
