/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXPREFIXKEY_H
#define TMUXPREFIXKEY_H

#include <QString>

#include <optional>

#include "TmuxCommand.h"
#include "input/InputEvent.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

/**
 * The tmux prefix key and the key bindings that follow it.
 *
 * Accepts tmux's own key notation: "C-b", "C-a", "C-Space", "M-x",
 * "C-M-a".
 */
class SPLITMUXPRIVATE_EXPORT TmuxPrefixKey
{
public:
    // C-b
    TmuxPrefixKey();

    static std::optional<TmuxPrefixKey> parse(const QString &notation);

    int key() const;
    Qt::KeyboardModifiers modifiers() const;
    QString toString() const;

    bool matches(const KeyInput &input) const;
    // What the terminal would have received for the prefix key itself.
    QByteArray prefixBytes() const;

    // The command bound to `input` after the prefix, acting on remotePaneId.
    static std::optional<TmuxCommand> translateCommandKey(const KeyInput &input, int remotePaneId);

private:
    TmuxPrefixKey(int key, Qt::KeyboardModifiers modifiers);

    int _key;
    Qt::KeyboardModifiers _modifiers;
};

} // namespace Splitmux

#endif // TMUXPREFIXKEY_H
