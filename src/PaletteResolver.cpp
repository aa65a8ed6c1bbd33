// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/PaletteResolver.hpp"
#include "PTerm/PTermConfig.hpp"

#include <QDebug>

bool TerminalPalette::operator==(const TerminalPalette &other) const {
    if (foreground != other.foreground || background != other.background) {
        return false;
    }
    for (int i = 0; i < PaletteResolver::PaletteSize; ++i) {
        if (colors[i] != other.colors[i]) {
            return false;
        }
    }
    return true;
}

bool PaletteResolver::isValidColor(const QString &text) {
    QString s = text.trimmed();
    return !s.isEmpty() && QColor(s).isValid();
}

QColor PaletteResolver::parseColor(const QString &text, const QColor &fallback) {
    if (!isValidColor(text)) {
        return fallback;
    }
    return QColor(text.trimmed());
}

TerminalPalette PaletteResolver::defaultPalette() {
    const PTermConfig config = ConfigStore::defaults();
    TerminalPalette palette;
    palette.foreground = QColor(config.foreground);
    palette.background = QColor(config.background);
    for (int i = 0; i < PaletteSize; ++i) {
        palette.colors[i] = QColor(config.palette[i]);
    }
    return palette;
}

TerminalPalette PaletteResolver::resolve(const PTermConfig &config) {
    const TerminalPalette defaults = defaultPalette();
    TerminalPalette palette;

    palette.foreground = parseColor(config.foreground, defaults.foreground);
    palette.background = parseColor(config.background, defaults.background);

    for (int i = 0; i < PaletteSize; ++i) {
        if (i >= config.palette.size()) {
            palette.colors[i] = defaults.colors[i];
            continue;
        }
        if (!isValidColor(config.palette[i])) {
            qWarning() << "palette: slot" << i << "has invalid colour" << config.palette[i];
        }
        palette.colors[i] = parseColor(config.palette[i], defaults.colors[i]);
    }
    return palette;
}
