// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QColor>
#include <QString>

struct PTermConfig;

constexpr int TerminalPaletteSize = 16;

struct TerminalPalette {
    QColor foreground;
    QColor background;
    QColor colors[TerminalPaletteSize];

    bool operator==(const TerminalPalette &other) const;
    bool operator!=(const TerminalPalette &other) const { return !(*this == other); }
};

class PaletteResolver {
  public:
    static constexpr int PaletteSize = TerminalPaletteSize;

    // Total: every slot that does not parse gets the default colour of the same slot.
    static TerminalPalette resolve(const PTermConfig &config);
    static TerminalPalette defaultPalette();

    static bool isValidColor(const QString &text);
    static QColor parseColor(const QString &text, const QColor &fallback);
};
