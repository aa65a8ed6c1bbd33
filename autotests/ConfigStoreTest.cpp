// SPDX-License-Identifier: MIT
// Author: Diego Iastrubni <diegoiast@gmail.com>

#include <PTerm/PTermConfig.hpp>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

class ConfigStoreTest : public QObject {
    Q_OBJECT

  private:
    QString writeConfig(const QString &text) {
        QString path = m_dir->filePath("config.toml");
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
            return QString();
        }
        file.write(text.toUtf8());
        return path;
    }

    QScopedPointer<QTemporaryDir> m_dir;

  private slots:
    void init() {
        m_dir.reset(new QTemporaryDir);
        QVERIFY(m_dir->isValid());
    }

    void defaultsAreComplete() {
        PTermConfig config = ConfigStore::defaults();
        QCOMPARE(config.fontFamily, QStringLiteral("monospace"));
        QCOMPARE(config.fontSize, 11);
        QCOMPARE(config.foreground, QStringLiteral("#ababb2bf"));
        QCOMPARE(config.background, QStringLiteral("#28272c34"));
        QCOMPARE(config.palette.size(), 16);
        QCOMPARE(config.keys.newTab, QKeySequence(QStringLiteral("Alt+T")));
        QCOMPARE(config.keys.closeTab, QKeySequence(QStringLiteral("Ctrl+Shift+W")));
        QVERIFY(config.shell.isEmpty());
        QVERIFY(ConfigStore::defaults() == config);
    }

    void missingFileWritesDefaults() {
        QString path = m_dir->filePath("sub/dir/config.toml");
        ConfigStore store(path);
        PTermConfig config = store.load();
        QVERIFY(config == ConfigStore::defaults());
        QVERIFY(QFile::exists(path));

        // What was written reads back as the same configuration
        QVERIFY(store.load() == ConfigStore::defaults());
    }

    void fieldLevelFallback() {
        ConfigStore store(writeConfig(QStringLiteral("font_family = \"Fira Code\"\n"
                                                     "font_size = \"big\"\n")));
        PTermConfig config = store.load();
        QCOMPARE(config.fontFamily, QStringLiteral("Fira Code"));
        QCOMPARE(config.fontSize, 11);
        QCOMPARE(config.foreground, ConfigStore::defaults().foreground);
        QCOMPARE(config.palette, ConfigStore::defaults().palette);
    }

    void fontSizeMustBePositive() {
        QCOMPARE(ConfigStore::fromValues(ConfigStore::parse("font_size = 0")).fontSize, 11);
        QCOMPARE(ConfigStore::fromValues(ConfigStore::parse("font_size = -4")).fontSize, 11);
        QCOMPARE(ConfigStore::fromValues(ConfigStore::parse("font_size = 12.5")).fontSize, 11);
        QCOMPARE(ConfigStore::fromValues(ConfigStore::parse("font_size = 14")).fontSize, 14);
    }

    void emptyFontFamilyFallsBack() {
        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse("font_family = \"  \""));
        QCOMPARE(config.fontFamily, QStringLiteral("monospace"));
    }

    void badColorsFallBack() {
        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse(
            QStringLiteral("[colors]\nforeground = \"nope\"\nbackground = \"#101010\"\n")));
        QCOMPARE(config.foreground, ConfigStore::defaults().foreground);
        QCOMPARE(config.background, QStringLiteral("#101010"));
    }

    void paletteFallsBackBySlot() {
        QString text = QStringLiteral("[colors]\npalette = [");
        for (int i = 0; i < 16; ++i) {
            text += i == 3 ? QStringLiteral("\"not-a-colour\", ")
                           : QStringLiteral("\"#0000%1\", ").arg(i, 2, 10, QChar('0'));
        }
        text += "]\n";

        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse(text));
        QCOMPARE(config.palette.size(), 16);
        QCOMPARE(config.palette[3], ConfigStore::defaults().palette[3]);
        QCOMPARE(config.palette[2], QStringLiteral("#000002"));
        QCOMPARE(config.palette[15], QStringLiteral("#000015"));
    }

    void paletteNonStringEntry() {
        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse(
            QStringLiteral("[colors]\npalette = [\"#111111\", 7, \"#333333\"]\n")));
        QCOMPARE(config.palette.size(), 16);
        QCOMPARE(config.palette[0], QStringLiteral("#111111"));
        QCOMPARE(config.palette[1], ConfigStore::defaults().palette[1]);
        QCOMPARE(config.palette[2], QStringLiteral("#333333"));
    }

    void paletteWrongLength() {
        PTermConfig shortConfig = ConfigStore::fromValues(
            ConfigStore::parse(QStringLiteral("[colors]\npalette = [\"#010101\", \"#020202\"]")));
        QCOMPARE(shortConfig.palette.size(), 16);
        QCOMPARE(shortConfig.palette[1], QStringLiteral("#020202"));
        QCOMPARE(shortConfig.palette.mid(2), ConfigStore::defaults().palette.mid(2));

        QStringList entries;
        for (int i = 0; i < 20; ++i) {
            entries << QStringLiteral("\"#1010%1\"").arg(i, 2, 10, QChar('0'));
        }
        PTermConfig longConfig = ConfigStore::fromValues(ConfigStore::parse(
            QStringLiteral("[colors]\npalette = [%1]").arg(entries.join(", "))));
        QCOMPARE(longConfig.palette.size(), 16);
        QCOMPARE(longConfig.palette[15], QStringLiteral("#101015"));
    }

    void paletteNotAnArray() {
        PTermConfig config = ConfigStore::fromValues(
            ConfigStore::parse(QStringLiteral("[colors]\npalette = \"#ffffff\"")));
        QCOMPARE(config.palette, ConfigStore::defaults().palette);
    }

    void commentsAndMultilineArrays() {
        QVariantMap values = ConfigStore::parse(QStringLiteral(
            "# leading comment\n"
            "font_family = \"Mono # not a comment\" # trailing\n"
            "\n"
            "[colors]\n"
            "palette = [\n"
            "    \"#000000\", # black\n"
            "    '#ffffff',\n"
            "]\n"
            "foreground = \"#eeeeee\"\n"));
        QCOMPARE(values.value("font_family").toString(), QStringLiteral("Mono # not a comment"));
        QCOMPARE(values.value("colors.palette").toList().size(), 2);
        QCOMPARE(values.value("colors.palette").toList().at(1).toString(),
                 QStringLiteral("#ffffff"));
        QCOMPARE(values.value("colors.foreground").toString(), QStringLiteral("#eeeeee"));
    }

    void garbageNeverFails() {
        ConfigStore store(writeConfig(QStringLiteral("[[[\n= = =\nfont_size = [1, 2\n\x01\x02\n")));
        QVERIFY(store.load() == ConfigStore::defaults());
    }

    void unknownKeysAreIgnored() {
        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse(
            QStringLiteral("opacity = 0.5\n[colors]\ncursor = \"#ffffff\"\n")));
        QVERIFY(config == ConfigStore::defaults());
    }

    void keyBindings() {
        PTermConfig config = ConfigStore::fromValues(ConfigStore::parse(
            QStringLiteral("[keys]\nnew_tab = \"Ctrl+Shift+T\"\nclose_tab = 42\n"
                           "next_tab = \"\"\n")));
        QCOMPARE(config.keys.newTab, QKeySequence(QStringLiteral("Ctrl+Shift+T")));
        QCOMPARE(config.keys.closeTab, ConfigStore::defaults().keys.closeTab);
        QCOMPARE(config.keys.nextTab, ConfigStore::defaults().keys.nextTab);
        QCOMPARE(config.keys.previousTab, ConfigStore::defaults().keys.previousTab);
    }

    void saveAndLoad() {
        PTermConfig config = ConfigStore::defaults();
        config.fontFamily = QStringLiteral("Iosevka \"Term\"");
        config.fontSize = 14;
        config.shell = QStringLiteral("/bin/zsh");
        config.background = QStringLiteral("#202020");
        config.palette[5] = QStringLiteral("#123456");
        config.keys.reloadConfig = QKeySequence(QStringLiteral("F5"));

        ConfigStore store(m_dir->filePath("config.toml"));
        QVERIFY(store.save(config));
        QVERIFY(store.load() == config);
    }

    void resolveShell() {
        PTermConfig config = ConfigStore::defaults();
        config.shell = QStringLiteral("/usr/bin/fish");
        QCOMPARE(ConfigStore::resolveShell(config), QStringLiteral("/usr/bin/fish"));

        QByteArray saved = qgetenv("SHELL");
        qputenv("SHELL", "/bin/test-shell");
        QCOMPARE(ConfigStore::resolveShell(ConfigStore::defaults()),
                 QStringLiteral("/bin/test-shell"));
        qunsetenv("SHELL");
        QVERIFY(!ConfigStore::resolveShell(ConfigStore::defaults()).isEmpty());
        if (!saved.isEmpty()) {
            qputenv("SHELL", saved);
        }
    }

    void watchingEmitsChanged() {
        ConfigStore store(m_dir->filePath("config.toml"));
        store.load();
        store.setWatching(true);
        QVERIFY(store.isWatching());

        QSignalSpy spy(&store, &ConfigStore::changed);
        writeConfig(QStringLiteral("font_size = 20\n"));
        QVERIFY(spy.wait(5000));
        QCOMPARE(store.load().fontSize, 20);

        store.setWatching(false);
        QVERIFY(!store.isWatching());
    }

    void watchingStartsBeforeFileExists() {
        QString path = m_dir->filePath("pterm/config.toml");
        ConfigStore store(path);
        store.setWatching(true);
        QVERIFY(!QFile::exists(path));

        // Writes the defaults, which must now be watched
        QVERIFY(store.load() == ConfigStore::defaults());
        QVERIFY(QFile::exists(path));

        QSignalSpy spy(&store, &ConfigStore::changed);
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text));
        file.write("font_size = 18\n");
        file.close();
        QVERIFY(spy.wait(5000));
        QCOMPARE(store.load().fontSize, 18);
    }
};

QTEST_MAIN(ConfigStoreTest)
#include "ConfigStoreTest.moc"
