/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxLayoutParser.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTmuxLayoutParser, "splitmux.tmux.layout")

namespace Splitmux
{

std::optional<TmuxLayoutNode> TmuxLayoutParser::parse(const QString &layoutString)
{
    // "xxxx," checksum prefix, then the body.
    if (layoutString.length() < 5 || layoutString[4] != QLatin1Char(',')) {
        return std::nullopt;
    }

    bool ok = false;
    const quint16 expected = layoutString.left(4).toUShort(&ok, 16);
    if (!ok) {
        return std::nullopt;
    }
    const quint16 actual = checksum(layoutString.mid(5).toLatin1());
    if (expected != actual) {
        qCWarning(lcTmuxLayoutParser) << "layout checksum mismatch:" << layoutString << "expected" << Qt::hex << actual;
        return std::nullopt;
    }

    int pos = 5;
    auto result = parseNode(layoutString, pos);
    if (!result.has_value() || pos != layoutString.length()) {
        return std::nullopt;
    }
    return result;
}

quint16 TmuxLayoutParser::checksum(const QByteArray &body)
{
    quint16 csum = 0;
    for (char c : body) {
        csum = (csum >> 1) + ((csum & 1) << 15);
        csum += static_cast<unsigned char>(c);
    }
    return csum;
}

QString TmuxLayoutParser::serialize(const TmuxLayoutNode &root)
{
    QString body;
    serializeNode(root, body);
    return QStringLiteral("%1,").arg(checksum(body.toLatin1()), 4, 16, QLatin1Char('0')) + body;
}

void TmuxLayoutParser::serializeNode(const TmuxLayoutNode &node, QString &output)
{
    output += QStringLiteral("%1x%2,%3,%4").arg(node.width).arg(node.height).arg(node.xOffset).arg(node.yOffset);

    if (node.type == TmuxLayoutNodeType::Leaf) {
        output += QLatin1Char(',') + QString::number(node.paneId);
        return;
    }

    const bool horizontal = (node.type == TmuxLayoutNodeType::HSplit);
    output += horizontal ? QLatin1Char('{') : QLatin1Char('[');
    for (int i = 0; i < node.children.size(); ++i) {
        if (i > 0) {
            output += QLatin1Char(',');
        }
        serializeNode(node.children[i], output);
    }
    output += horizontal ? QLatin1Char('}') : QLatin1Char(']');
}

int TmuxLayoutParser::leafCount(const TmuxLayoutNode &node)
{
    if (node.type == TmuxLayoutNodeType::Leaf) {
        return 1;
    }
    int count = 0;
    for (const auto &child : node.children) {
        count += leafCount(child);
    }
    return count;
}

QList<int> TmuxLayoutParser::paneIds(const TmuxLayoutNode &node)
{
    if (node.type == TmuxLayoutNodeType::Leaf) {
        return {node.paneId};
    }
    QList<int> ids;
    for (const auto &child : node.children) {
        ids += paneIds(child);
    }
    return ids;
}

static bool isAsciiDigit(QChar c)
{
    return c.unicode() >= '0' && c.unicode() <= '9';
}

bool TmuxLayoutParser::parseInt(const QString &s, int &pos, int &value)
{
    // tmux never prints more than this; longer runs would overflow.
    static const int MaxDigits = 9;

    if (pos >= s.length() || !isAsciiDigit(s[pos])) {
        return false;
    }
    const int start = pos;
    value = 0;
    while (pos < s.length() && isAsciiDigit(s[pos])) {
        if (pos - start == MaxDigits) {
            return false;
        }
        value = value * 10 + (s[pos].unicode() - '0');
        pos++;
    }
    return true;
}

bool TmuxLayoutParser::parseDimensions(const QString &s, int &pos, TmuxLayoutNode &node)
{
    // WxH,X,Y
    if (!parseInt(s, pos, node.width)) {
        return false;
    }
    if (pos >= s.length() || s[pos] != QLatin1Char('x')) {
        return false;
    }
    pos++;
    if (!parseInt(s, pos, node.height)) {
        return false;
    }
    if (pos >= s.length() || s[pos] != QLatin1Char(',')) {
        return false;
    }
    pos++;
    if (!parseInt(s, pos, node.xOffset)) {
        return false;
    }
    if (pos >= s.length() || s[pos] != QLatin1Char(',')) {
        return false;
    }
    pos++;
    if (!parseInt(s, pos, node.yOffset)) {
        return false;
    }
    return node.width > 0 && node.height > 0;
}

bool TmuxLayoutParser::childrenFit(const TmuxLayoutNode &node)
{
    // Children tile the container along its axis with a one-cell separator
    // between neighbours, and span it fully across.
    const bool horizontal = (node.type == TmuxLayoutNodeType::HSplit);
    int along = node.children.size() - 1;
    for (const auto &child : node.children) {
        along += horizontal ? child.width : child.height;
        if ((horizontal ? child.height : child.width) != (horizontal ? node.height : node.width)) {
            return false;
        }
    }
    return along == (horizontal ? node.width : node.height);
}

std::optional<TmuxLayoutNode> TmuxLayoutParser::parseNode(const QString &s, int &pos)
{
    TmuxLayoutNode node;

    if (!parseDimensions(s, pos, node)) {
        return std::nullopt;
    }
    if (pos >= s.length()) {
        return std::nullopt;
    }

    const QChar next = s[pos];
    if (next == QLatin1Char(',')) {
        node.type = TmuxLayoutNodeType::Leaf;
        pos++;
        if (!parseInt(s, pos, node.paneId)) {
            return std::nullopt;
        }
        return node;
    }

    QChar close;
    if (next == QLatin1Char('{')) {
        node.type = TmuxLayoutNodeType::HSplit;
        close = QLatin1Char('}');
    } else if (next == QLatin1Char('[')) {
        node.type = TmuxLayoutNodeType::VSplit;
        close = QLatin1Char(']');
    } else {
        return std::nullopt;
    }
    pos++;

    while (true) {
        auto child = parseNode(s, pos);
        if (!child.has_value()) {
            return std::nullopt;
        }
        node.children.append(child.value());
        if (pos >= s.length()) {
            return std::nullopt;
        }
        if (s[pos] == close) {
            pos++;
            break;
        }
        if (s[pos] != QLatin1Char(',')) {
            return std::nullopt;
        }
        pos++;
    }

    if (node.children.size() < 2) {
        return std::nullopt;
    }
    if (!childrenFit(node)) {
        qCWarning(lcTmuxLayoutParser) << "layout children do not fit their" << node.width << "x" << node.height << "container";
        return std::nullopt;
    }
    return node;
}

} // namespace Splitmux
