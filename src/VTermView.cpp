// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/VTermView.hpp"
#include "PtyProcess.h"

#include <QFontMetrics>
#include <QKeyEvent>
#include <QPainter>
#include <algorithm>

namespace {

struct KeyMapping {
    int qtKey;
    VTermKey vtermKey;
};

const KeyMapping SpecialKeys[] = {
    {Qt::Key_Return, VTERM_KEY_ENTER},     {Qt::Key_Enter, VTERM_KEY_ENTER},
    {Qt::Key_Backspace, VTERM_KEY_BACKSPACE}, {Qt::Key_Tab, VTERM_KEY_TAB},
    {Qt::Key_Escape, VTERM_KEY_ESCAPE},    {Qt::Key_Up, VTERM_KEY_UP},
    {Qt::Key_Down, VTERM_KEY_DOWN},        {Qt::Key_Left, VTERM_KEY_LEFT},
    {Qt::Key_Right, VTERM_KEY_RIGHT},      {Qt::Key_Insert, VTERM_KEY_INS},
    {Qt::Key_Delete, VTERM_KEY_DEL},       {Qt::Key_Home, VTERM_KEY_HOME},
    {Qt::Key_End, VTERM_KEY_END},          {Qt::Key_PageUp, VTERM_KEY_PAGEUP},
    {Qt::Key_PageDown, VTERM_KEY_PAGEDOWN},
};

VTermModifier toVTermModifier(Qt::KeyboardModifiers modifiers) {
    int mod = VTERM_MOD_NONE;
    if (modifiers & Qt::ShiftModifier) {
        mod |= VTERM_MOD_SHIFT;
    }
    if (modifiers & Qt::ControlModifier) {
        mod |= VTERM_MOD_CTRL;
    }
    if (modifiers & Qt::AltModifier) {
        mod |= VTERM_MOD_ALT;
    }
    return (VTermModifier)mod;
}

} // namespace

static VTermColor toVTermColor(const QColor &c) {
    VTermColor vc;
    vterm_color_rgb(&vc, c.red(), c.green(), c.blue());
    return vc;
}

VTermView::VTermView(PtyProcess *pty, QWidget *parent) : QWidget(parent), m_pty(pty) {
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);
    m_palette = PaletteResolver::defaultPalette();

    m_vterm = vterm_new(m_rows, m_cols);
    vterm_set_utf8(m_vterm, 1);
    vterm_output_set_callback(m_vterm, &VTermView::onOutput, this);

    m_vtermScreen = vterm_obtain_screen(m_vterm);
    vterm_screen_enable_altscreen(m_vtermScreen, 1);

    static VTermScreenCallbacks callbacks = {
        .damage = &VTermView::onDamage,
        .moverect = nullptr,
        .movecursor = &VTermView::onMoveCursor,
        .settermprop = &VTermView::onSetTermProp,
        .bell = nullptr,
        .resize = nullptr,
        .sb_pushline = nullptr,
        .sb_popline = nullptr,
    };
    vterm_screen_set_callbacks(m_vtermScreen, &callbacks, this);
    vterm_screen_reset(m_vtermScreen, 1);

    setTerminalFont(QFont("monospace", 11));
    if (m_pty) {
        connect(m_pty, &PtyProcess::readyRead, this, &VTermView::onPtyReadyRead);
    }
}

VTermView::~VTermView() {
    if (m_vterm) {
        vterm_free(m_vterm);
    }
}

void VTermView::setColors(const TerminalPalette &palette) {
    m_palette = palette;
    VTermState *state = vterm_obtain_state(m_vterm);
    VTermColor fg = toVTermColor(palette.foreground), bg = toVTermColor(palette.background);
    vterm_state_set_default_colors(state, &fg, &bg);
    for (int i = 0; i < PaletteResolver::PaletteSize; ++i) {
        VTermColor c = toVTermColor(palette.colors[i]);
        vterm_state_set_palette_color(state, i, &c);
    }
    update();
}

void VTermView::setTerminalFont(const QFont &font) {
    m_font = font;
    m_font.setKerning(false);
    QFontMetrics fm(m_font);
    m_cellSize = QSize(fm.horizontalAdvance('W'), fm.height());
    if (m_cellSize.width() <= 0 || m_cellSize.height() <= 0) {
        m_cellSize = QSize(10, 20);
    }
    updateTerminalSize();
    update();
}

void VTermView::onPtyReadyRead(const QByteArray &data) {
    if (!data.isEmpty()) {
        vterm_input_write(m_vterm, data.constData(), data.size());
        vterm_screen_flush_damage(m_vtermScreen);
    }
}

void VTermView::updateTerminalSize() {
    if (m_cellSize.isEmpty() || width() <= 0 || height() <= 0) {
        return;
    }
    int rows = std::max(1, height() / m_cellSize.height());
    int cols = std::max(1, width() / m_cellSize.width());
    if (rows == m_rows && cols == m_cols) {
        return;
    }
    m_rows = rows;
    m_cols = cols;
    vterm_set_size(m_vterm, rows, cols);
    vterm_screen_flush_damage(m_vtermScreen);
    if (m_pty) {
        m_pty->resize(QSize(cols, rows));
    }
}

QColor VTermView::mapColor(const VTermColor &c, bool foreground) const {
    if (foreground && VTERM_COLOR_IS_DEFAULT_FG(&c)) {
        return m_palette.foreground;
    }
    if (!foreground && VTERM_COLOR_IS_DEFAULT_BG(&c)) {
        return m_palette.background;
    }
    if (VTERM_COLOR_IS_INDEXED(&c)) {
        VTermColor rgb = c;
        vterm_state_convert_color_to_rgb(vterm_obtain_state(m_vterm), &rgb);
        return QColor(rgb.rgb.red, rgb.rgb.green, rgb.rgb.blue);
    }
    return QColor(c.rgb.red, c.rgb.green, c.rgb.blue);
}

void VTermView::paintEvent(QPaintEvent *) {
    QPainter painter(this);
    painter.setFont(m_font);
    // Alpha in the configured background is not composited; paint it opaque.
    painter.fillRect(rect(), QColor::fromRgb(m_palette.background.rgb()));

    for (int row = 0; row < m_rows; ++row) {
        for (int col = 0; col < m_cols; ++col) {
            VTermScreenCell cell;
            if (!vterm_screen_get_cell(m_vtermScreen, {row, col}, &cell) || cell.width == 0) {
                continue;
            }
            QColor fg = QColor::fromRgb(mapColor(cell.fg, true).rgb());
            QColor bg = QColor::fromRgb(mapColor(cell.bg, false).rgb());
            if (cell.attrs.reverse) {
                std::swap(fg, bg);
            }

            QRect r(col * m_cellSize.width(), row * m_cellSize.height(),
                    cell.width * m_cellSize.width(), m_cellSize.height());
            painter.fillRect(r, bg);
            if (cell.chars[0] != 0) {
                int n = 0;
                while (n < VTERM_MAX_CHARS_PER_CELL && cell.chars[n]) {
                    n++;
                }
                painter.setPen(fg);
                painter.drawText(r, Qt::AlignCenter,
                                 QString::fromUcs4((const char32_t *)cell.chars, n));
            }
        }
    }

    if (m_cursorVisible && hasFocus()) {
        QRect cursorRect(m_cursorCol * m_cellSize.width(), m_cursorRow * m_cellSize.height(),
                         m_cellSize.width(), m_cellSize.height());
        painter.setCompositionMode(QPainter::CompositionMode_Difference);
        painter.fillRect(cursorRect, Qt::white);
        painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    }
}

void VTermView::resizeEvent(QResizeEvent *event) {
    updateTerminalSize();
    QWidget::resizeEvent(event);
}

void VTermView::keyPressEvent(QKeyEvent *event) {
    const VTermModifier mod = toVTermModifier(event->modifiers());
    const int key = event->key();

    if (key >= Qt::Key_F1 && key <= Qt::Key_F12) {
        vterm_keyboard_key(m_vterm, (VTermKey)VTERM_KEY_FUNCTION(1 + key - Qt::Key_F1), mod);
        return;
    }
    if (key == Qt::Key_Backtab) {
        vterm_keyboard_key(m_vterm, VTERM_KEY_TAB, (VTermModifier)(mod | VTERM_MOD_SHIFT));
        return;
    }
    for (const KeyMapping &mapping : SpecialKeys) {
        if (mapping.qtKey == key) {
            vterm_keyboard_key(m_vterm, mapping.vtermKey, mod);
            return;
        }
    }

    // Ctrl+letter becomes the matching C0 control character.
    if ((mod & VTERM_MOD_CTRL) && key >= Qt::Key_A && key <= Qt::Key_Z) {
        vterm_keyboard_unichar(m_vterm, key - Qt::Key_A + 1, VTERM_MOD_NONE);
        return;
    }
    const QList<uint> text = event->text().toUcs4();
    for (uint ucs : text) {
        vterm_keyboard_unichar(m_vterm, ucs, mod);
    }
}

bool VTermView::focusNextPrevChild(bool) { return false; }

int VTermView::onDamage(VTermRect rect, void *user) {
    auto *view = static_cast<VTermView *>(user);
    int w = view->m_cellSize.width();
    int h = view->m_cellSize.height();
    view->update(rect.start_col * w, rect.start_row * h, (rect.end_col - rect.start_col) * w,
                 (rect.end_row - rect.start_row) * h);
    return 1;
}

int VTermView::onMoveCursor(VTermPos pos, VTermPos oldpos, int visible, void *user) {
    auto *view = static_cast<VTermView *>(user);
    int w = view->m_cellSize.width();
    int h = view->m_cellSize.height();
    view->update(oldpos.col * w, oldpos.row * h, w, h);
    view->m_cursorRow = pos.row;
    view->m_cursorCol = pos.col;
    view->m_cursorVisible = visible;
    view->update(pos.col * w, pos.row * h, w, h);
    return 1;
}

int VTermView::onSetTermProp(VTermProp prop, VTermValue *val, void *user) {
    auto *view = static_cast<VTermView *>(user);
    switch (prop) {
    case VTERM_PROP_CURSORVISIBLE:
        view->m_cursorVisible = val->boolean;
        view->update();
        break;
    case VTERM_PROP_TITLE:
        // The title may arrive in several fragments.
        if (val->string.initial) {
            view->m_titleBuffer.clear();
        }
        view->m_titleBuffer.append(val->string.str, (int)val->string.len);
        if (val->string.final) {
            emit view->titleChanged(QString::fromUtf8(view->m_titleBuffer));
        }
        break;
    default:
        break;
    }
    return 1;
}

void VTermView::onOutput(const char *s, size_t len, void *user) {
    auto *view = static_cast<VTermView *>(user);
    if (view->m_pty) {
        view->m_pty->write(QByteArray(s, (int)len));
    }
}
