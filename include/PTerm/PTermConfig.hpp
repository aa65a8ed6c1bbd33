// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#pragma once

#include <QFont>
#include <QKeySequence>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

class QFileSystemWatcher;

struct KeyBindings {
    QKeySequence newTab;
    QKeySequence closeTab;
    QKeySequence nextTab;
    QKeySequence previousTab;
    QKeySequence reloadConfig;

    bool operator==(const KeyBindings &other) const = default;
};

struct PTermConfig {
    QString fontFamily;
    int fontSize = 0;
    QString foreground;
    QString background;
    QStringList palette;
    QString shell;
    KeyBindings keys;

    QFont font() const;

    bool operator==(const PTermConfig &other) const = default;
};

class ConfigStore : public QObject {
    Q_OBJECT

  public:
    explicit ConfigStore(const QString &path = defaultPath(), QObject *parent = nullptr);

    static QString defaultPath();
    static PTermConfig defaults();

    // Reads the file, substituting the default for every missing or invalid field.
    // A missing file is created with the defaults.
    PTermConfig load();
    bool save(const PTermConfig &config) const;

    QString path() const { return m_path; }

    void setWatching(bool enable);
    bool isWatching() const { return m_watcher != nullptr; }

    static QVariantMap parse(const QString &text);
    static PTermConfig fromValues(const QVariantMap &values);
    static QString serialize(const PTermConfig &config);
    static QString resolveShell(const PTermConfig &config);

  signals:
    void changed();

  private slots:
    void onFileChanged(const QString &path);

  private:
    void watchFile() const;

    QString m_path;
    QFileSystemWatcher *m_watcher = nullptr;
};
