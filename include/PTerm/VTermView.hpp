// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QByteArray>
#include <QFont>
#include <QPointer>
#include <QWidget>
#include <vterm.h>

#include "PaletteResolver.hpp"

class PtyProcess;

// Screen of one pty child, driven by libvterm. Feeds keyboard input back to the pty.
class VTermView : public QWidget {
    Q_OBJECT

  public:
    explicit VTermView(PtyProcess *pty, QWidget *parent = nullptr);
    ~VTermView();

    void setColors(const TerminalPalette &palette);
    void setTerminalFont(const QFont &font);
    // Columns x rows.
    QSize terminalSize() const { return QSize(m_cols, m_rows); }

  signals:
    void titleChanged(const QString &title);

  public slots:
    void onPtyReadyRead(const QByteArray &data);

  protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    bool focusNextPrevChild(bool next) override; // To capture Tab

  private:
    void updateTerminalSize();
    QColor mapColor(const VTermColor &c, bool foreground) const;

    // VTerm callbacks
    static int onDamage(VTermRect rect, void *user);
    static int onMoveCursor(VTermPos pos, VTermPos oldpos, int visible, void *user);
    static int onSetTermProp(VTermProp prop, VTermValue *val, void *user);
    static void onOutput(const char *s, size_t len, void *user);

    QPointer<PtyProcess> m_pty;
    VTerm *m_vterm = nullptr;
    VTermScreen *m_vtermScreen = nullptr;

    TerminalPalette m_palette;
    QFont m_font;
    QSize m_cellSize;
    int m_rows = 24;
    int m_cols = 80;
    int m_cursorRow = 0;
    int m_cursorCol = 0;
    bool m_cursorVisible = true;
    QByteArray m_titleBuffer;
};
