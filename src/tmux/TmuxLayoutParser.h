/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXLAYOUTPARSER_H
#define TMUXLAYOUTPARSER_H

#include <QList>
#include <QString>

#include <optional>

#include "splitmuxprivate_export.h"

namespace Splitmux
{

// HSplit is a tmux {} container (side by side), VSplit a [] container (stacked).
enum class TmuxLayoutNodeType { Leaf, HSplit, VSplit };

struct TmuxLayoutNode {
    TmuxLayoutNodeType type = TmuxLayoutNodeType::Leaf;
    int width = 0;
    int height = 0;
    int xOffset = 0;
    int yOffset = 0;
    int paneId = -1; // leaf only
    QList<TmuxLayoutNode> children; // split only
};

/**
 * Reads and writes tmux layout strings such as
 * "00f6,81x24,0,0{40x24,0,0,0,40x24,41,0,1}".
 */
class SPLITMUXPRIVATE_EXPORT TmuxLayoutParser
{
public:
    // Rejects bad checksums and trailing garbage. Containers need at least
    // two children, and those must tile the container exactly.
    static std::optional<TmuxLayoutNode> parse(const QString &layoutString);
    static QString serialize(const TmuxLayoutNode &root);
    static quint16 checksum(const QByteArray &body);

    static int leafCount(const TmuxLayoutNode &node);
    static QList<int> paneIds(const TmuxLayoutNode &node);

private:
    static std::optional<TmuxLayoutNode> parseNode(const QString &s, int &pos);
    static bool parseDimensions(const QString &s, int &pos, TmuxLayoutNode &node);
    static bool parseInt(const QString &s, int &pos, int &value);
    static bool childrenFit(const TmuxLayoutNode &node);
    static void serializeNode(const TmuxLayoutNode &node, QString &output);
};

} // namespace Splitmux

#endif // TMUXLAYOUTPARSER_H
