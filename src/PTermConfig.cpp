// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include "PTerm/PTermConfig.hpp"
#include "PTerm/PaletteResolver.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QSaveFile>
#include <QStandardPaths>
#include <QTextStream>
#include <algorithm>
#include <limits>

static const char *const DefaultPalette[PaletteResolver::PaletteSize] = {
    "#1e2127", "#e06c75", "#98c379", "#d19a66", "#61afef", "#c678dd", "#56b6c2", "#abb2bf",
    "#5c6370", "#e06c75", "#98c379", "#d19a66", "#61afef", "#c678dd", "#56b6c2", "#ffffff"};

static const QStringList KnownKeys = {"font_family",       "font_size",
                                      "shell",             "colors.foreground",
                                      "colors.background", "colors.palette",
                                      "keys.new_tab",      "keys.close_tab",
                                      "keys.next_tab",     "keys.previous_tab",
                                      "keys.reload_config"};

namespace {

// Drops a trailing "# comment", ignoring '#' inside quoted strings.
QString stripComment(const QString &line) {
    QChar quote;
    bool escaped = false;
    for (int i = 0; i < line.size(); ++i) {
        QChar c = line[i];
        if (!quote.isNull()) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\' && quote == '"') {
                escaped = true;
            } else if (c == quote) {
                quote = QChar();
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.left(i);
        }
    }
    return line;
}

int bracketDepth(const QString &text) {
    int depth = 0;
    QChar quote;
    bool escaped = false;
    for (QChar c : text) {
        if (!quote.isNull()) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\' && quote == '"') {
                escaped = true;
            } else if (c == quote) {
                quote = QChar();
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            depth--;
        }
    }
    return depth;
}

bool parseValue(const QString &text, QVariant &out);

bool parseBasicString(const QString &text, QVariant &out) {
    QString result;
    for (int i = 1; i < text.size(); ++i) {
        QChar c = text[i];
        if (c == '"') {
            if (i != text.size() - 1) {
                return false;
            }
            out = result;
            return true;
        }
        if (c != '\\') {
            result.append(c);
            continue;
        }
        if (++i >= text.size()) {
            return false;
        }
        switch (text[i].unicode()) {
        case 'n':
            result.append('\n');
            break;
        case 't':
            result.append('\t');
            break;
        case '"':
        case '\\':
            result.append(text[i]);
            break;
        default:
            return false;
        }
    }
    return false;
}

// Elements that fail to parse are kept as invalid QVariants so positions survive.
bool parseArray(const QString &text, QVariant &out) {
    if (!text.endsWith(']')) {
        return false;
    }
    QString body = text.mid(1, text.size() - 2);
    QVariantList items;
    QString current;
    int depth = 0;
    QChar quote;
    bool escaped = false;

    auto flush = [&](bool last) {
        QString item = current.trimmed();
        current.clear();
        if (item.isEmpty()) {
            return last;
        }
        QVariant v;
        if (!parseValue(item, v)) {
            v = QVariant();
        }
        items.append(v);
        return true;
    };

    for (QChar c : body) {
        if (!quote.isNull()) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\' && quote == '"') {
                escaped = true;
            } else if (c == quote) {
                quote = QChar();
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            depth--;
        } else if (c == ',' && depth == 0) {
            if (!flush(false)) {
                return false;
            }
            continue;
        }
        current.append(c);
    }
    if (!quote.isNull() || depth != 0 || !flush(true)) {
        return false;
    }
    out = items;
    return true;
}

bool parseValue(const QString &text, QVariant &out) {
    if (text.isEmpty()) {
        return false;
    }
    if (text.startsWith('"')) {
        return parseBasicString(text, out);
    }
    if (text.startsWith('\'')) {
        int end = text.indexOf('\'', 1);
        if (end != text.size() - 1) {
            return false;
        }
        out = text.mid(1, end - 1);
        return true;
    }
    if (text.startsWith('[')) {
        return parseArray(text, out);
    }
    if (text == "true" || text == "false") {
        out = (text == "true");
        return true;
    }

    QString number = text;
    number.remove('_');
    bool ok = false;
    qlonglong integer = number.toLongLong(&ok, 10);
    if (ok) {
        out = integer;
        return true;
    }
    double real = number.toDouble(&ok);
    if (ok) {
        out = real;
        return true;
    }
    return false;
}

QString quoted(const QString &s) {
    QString escaped = s;
    escaped.replace('\\', "\\\\").replace('"', "\\\"").replace('\n', "\\n").replace('\t', "\\t");
    return '"' + escaped + '"';
}

} // namespace

QFont PTermConfig::font() const {
    QFont f(fontFamily, fontSize);
    f.setStyleHint(QFont::Monospace);
    return f;
}

ConfigStore::ConfigStore(const QString &path, QObject *parent) : QObject(parent), m_path(path) {}

QString ConfigStore::defaultPath() {
    return QStandardPaths::writableLocation(QStandardPaths::ConfigLocation) +
           "/pterm/config.toml";
}

PTermConfig ConfigStore::defaults() {
    PTermConfig config;
    config.fontFamily = "monospace";
    config.fontSize = 11;
    config.foreground = "#ababb2bf";
    config.background = "#28272c34";
    for (const char *color : DefaultPalette) {
        config.palette << QString::fromLatin1(color);
    }
    config.keys.newTab = QKeySequence(Qt::ALT | Qt::Key_T);
    config.keys.closeTab = QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_W);
    config.keys.nextTab = QKeySequence(Qt::CTRL | Qt::Key_PageDown);
    config.keys.previousTab = QKeySequence(Qt::CTRL | Qt::Key_PageUp);
    config.keys.reloadConfig = QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_R);
    return config;
}

PTermConfig ConfigStore::load() {
    QFile file(m_path);
    if (!file.exists()) {
        PTermConfig config = defaults();
        qDebug() << "No configuration at" << m_path << "- writing defaults";
        if (!save(config)) {
            qWarning() << "Could not write default configuration to" << m_path;
        }
        return config;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Cannot read configuration" << m_path << ":" << file.errorString();
        return defaults();
    }

    QTextStream in(&file);
    return fromValues(parse(in.readAll()));
}

bool ConfigStore::save(const PTermConfig &config) const {
    QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        return false;
    }
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Cannot write configuration" << m_path << ":" << file.errorString();
        return false;
    }
    file.write(serialize(config).toUtf8());
    if (!file.commit()) {
        qWarning() << "Cannot write configuration" << m_path << ":" << file.errorString();
        return false;
    }
    // The file may not have existed when watching started.
    watchFile();
    return true;
}

void ConfigStore::watchFile() const {
    if (m_watcher && !m_watcher->files().contains(m_path) && QFile::exists(m_path)) {
        m_watcher->addPath(m_path);
    }
}

void ConfigStore::setWatching(bool enable) {
    if (!enable) {
        delete m_watcher;
        m_watcher = nullptr;
        return;
    }
    if (m_watcher) {
        return;
    }
    m_watcher = new QFileSystemWatcher(this);
    watchFile();
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &ConfigStore::onFileChanged);
}

void ConfigStore::onFileChanged(const QString &path) {
    // Editors that save by renaming drop the watch, so put it back.
    Q_UNUSED(path);
    watchFile();
    emit changed();
}

QVariantMap ConfigStore::parse(const QString &text) {
    QVariantMap values;
    QString section;
    QString pending;
    int pendingLine = 0;

    const QStringList lines = text.split('\n');
    for (int n = 0; n < lines.size(); ++n) {
        QString line = stripComment(lines[n]).trimmed();
        if (!pending.isEmpty()) {
            pending += ' ' + line;
            if (bracketDepth(pending) > 0) {
                continue;
            }
            line = pending;
            pending.clear();
        } else {
            if (line.isEmpty()) {
                continue;
            }
            if (line.startsWith('[')) {
                if (!line.endsWith(']')) {
                    qWarning() << "config: malformed section header at line" << n + 1;
                    continue;
                }
                section = line.mid(1, line.size() - 2).trimmed();
                continue;
            }
            pendingLine = n;
        }

        int eq = line.indexOf('=');
        if (eq <= 0) {
            qWarning() << "config: expected key = value at line" << pendingLine + 1;
            continue;
        }
        QString key = line.left(eq).trimmed();
        QString value = line.mid(eq + 1).trimmed();
        if (key.size() >= 2 && key.startsWith('"') && key.endsWith('"')) {
            key = key.mid(1, key.size() - 2);
        }
        if (value.startsWith('[') && bracketDepth(value) > 0) {
            pending = line;
            continue;
        }

        QString fullKey = section.isEmpty() ? key : section + '.' + key;
        QVariant parsed;
        if (!parseValue(value, parsed)) {
            qWarning() << "config: cannot parse value of" << fullKey << "at line"
                       << pendingLine + 1;
            continue;
        }
        values.insert(fullKey, parsed);
    }
    if (!pending.isEmpty()) {
        qWarning() << "config: unterminated array starting at line" << pendingLine + 1;
    }
    return values;
}

PTermConfig ConfigStore::fromValues(const QVariantMap &values) {
    PTermConfig config = defaults();

    for (auto it = values.cbegin(); it != values.cend(); ++it) {
        if (!KnownKeys.contains(it.key())) {
            qWarning() << "config: ignoring unknown key" << it.key();
        }
    }

    auto isString = [](const QVariant &v) { return v.typeId() == QMetaType::QString; };
    auto fallback = [](const QString &key) {
        qWarning() << "config: invalid" << key << "- using the default";
    };

    if (values.contains("font_family")) {
        QVariant v = values.value("font_family");
        if (isString(v) && !v.toString().trimmed().isEmpty()) {
            config.fontFamily = v.toString().trimmed();
        } else {
            fallback("font_family");
        }
    }
    if (values.contains("font_size")) {
        QVariant v = values.value("font_size");
        qlonglong size = v.toLongLong();
        if (v.typeId() == QMetaType::LongLong && size > 0 &&
            size <= std::numeric_limits<int>::max()) {
            config.fontSize = (int)size;
        } else {
            fallback("font_size");
        }
    }
    if (values.contains("shell")) {
        QVariant v = values.value("shell");
        if (isString(v)) {
            config.shell = v.toString().trimmed();
        } else {
            fallback("shell");
        }
    }

    auto colorField = [&](const QString &key, QString &field) {
        if (!values.contains(key)) {
            return;
        }
        QVariant v = values.value(key);
        if (isString(v) && PaletteResolver::isValidColor(v.toString())) {
            field = v.toString().trimmed();
        } else {
            fallback(key);
        }
    };
    colorField("colors.foreground", config.foreground);
    colorField("colors.background", config.background);

    if (values.contains("colors.palette")) {
        QVariant v = values.value("colors.palette");
        if (v.typeId() == QMetaType::QVariantList) {
            QVariantList list = v.toList();
            if (list.size() != PaletteResolver::PaletteSize) {
                qWarning() << "config: colors.palette has" << list.size()
                           << "entries, expected" << PaletteResolver::PaletteSize;
            }
            for (int i = 0; i < std::min((int)list.size(), PaletteResolver::PaletteSize); ++i) {
                const QVariant &entry = list[i];
                if (isString(entry) && PaletteResolver::isValidColor(entry.toString())) {
                    config.palette[i] = entry.toString().trimmed();
                } else {
                    fallback(QString("colors.palette[%1]").arg(i));
                }
            }
        } else {
            fallback("colors.palette");
        }
    }

    auto keyField = [&](const QString &key, QKeySequence &field) {
        if (!values.contains(key)) {
            return;
        }
        QVariant v = values.value(key);
        QKeySequence seq;
        if (isString(v)) {
            seq = QKeySequence::fromString(v.toString(), QKeySequence::PortableText);
        }
        if (!seq.isEmpty() && seq[0] != QKeyCombination(Qt::Key_unknown)) {
            field = seq;
        } else {
            fallback(key);
        }
    };
    keyField("keys.new_tab", config.keys.newTab);
    keyField("keys.close_tab", config.keys.closeTab);
    keyField("keys.next_tab", config.keys.nextTab);
    keyField("keys.previous_tab", config.keys.previousTab);
    keyField("keys.reload_config", config.keys.reloadConfig);

    return config;
}

QString ConfigStore::serialize(const PTermConfig &config) {
    QString text;
    QTextStream out(&text);
    out << "# pterm configuration\n";
    out << "font_family = " << quoted(config.fontFamily) << "\n";
    out << "font_size = " << config.fontSize << "\n";
    out << "shell = " << quoted(config.shell) << "\n";
    out << "\n[colors]\n";
    out << "foreground = " << quoted(config.foreground) << "\n";
    out << "background = " << quoted(config.background) << "\n";
    out << "palette = [\n";
    for (const QString &color : config.palette) {
        out << "    " << quoted(color) << ",\n";
    }
    out << "]\n";
    out << "\n[keys]\n";
    auto key = [](const QKeySequence &seq) {
        return quoted(seq.toString(QKeySequence::PortableText));
    };
    out << "new_tab = " << key(config.keys.newTab) << "\n";
    out << "close_tab = " << key(config.keys.closeTab) << "\n";
    out << "next_tab = " << key(config.keys.nextTab) << "\n";
    out << "previous_tab = " << key(config.keys.previousTab) << "\n";
    out << "reload_config = " << key(config.keys.reloadConfig) << "\n";
    out.flush();
    return text;
}

QString ConfigStore::resolveShell(const PTermConfig &config) {
    if (!config.shell.isEmpty()) {
        return config.shell;
    }
    QString shell = qEnvironmentVariable("SHELL");
    if (!shell.isEmpty()) {
        return shell;
    }

    QFile file("/etc/shells");
    if (file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QTextStream in(&file);
        while (!in.atEnd()) {
            QString line = in.readLine().trimmed();
            if (!line.isEmpty() && !line.startsWith('#') && QFileInfo(line).isExecutable()) {
                return line;
            }
        }
    }
    return "/bin/sh";
}
