/**
 * @file appsettings_test.cpp
 * @brief Defaults and INI overrides of AppSettings
 */

#include <QtTest/QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "appsettings.h"

class AppSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void testDefaults();
    void testLoad_iniOverridesAndKeepsDefaults();
    void testSave_roundTripsFallbackColor();
};

void AppSettingsTest::testDefaults()
{
    AppSettings settings;
    settings.loadDefaults();

    QCOMPARE(settings.fallbackColor(), QColor(20, 20, 40));
    QCOMPARE(settings.fallbackColor().name(), QString("#141428"));
    QCOMPARE(settings.themeColor("tech"), QColor(10, 20, 30));
    QCOMPARE(settings.themeColor("  TECH "), QColor(10, 20, 30));
    QCOMPARE(settings.themeColor("unknown"), settings.fallbackColor());
    QCOMPARE(settings.encoding().width, 1080);
    QCOMPARE(settings.encoding().height, 1920);
    QCOMPARE(settings.platform().maxSizeBytes, 50LL * 1024 * 1024);
    QCOMPARE(settings.defaultStyle().fontSize, 85);
}

void AppSettingsTest::testLoad_iniOverridesAndKeepsDefaults()
{
    QTemporaryDir dir;
    const QString iniPath = dir.filePath("clipassembler.ini");
    {
        QSettings ini(iniPath, QSettings::IniFormat);
        ini.setValue("encoding/fps", 25);
        ini.setValue("platform/maxDuration", 90.0);
        ini.setValue("background/fallbackColor", "#102030");
        ini.setValue("themes/ocean", "#0a3050");
        ini.setValue("avatar/waitTimeoutMs", 60000);
        ini.sync();
    }

    AppSettings settings;
    settings.load(iniPath);

    QCOMPARE(settings.encoding().fps, 25);
    QCOMPARE(settings.encoding().width, 1080);
    QCOMPARE(settings.platform().maxDurationS, 90.0);
    QCOMPARE(settings.platform().minDurationS, 15.0);
    QCOMPARE(settings.fallbackColor(), QColor(0x10, 0x20, 0x30));
    QCOMPARE(settings.themeColor("ocean"), QColor(0x0a, 0x30, 0x50));
    QCOMPARE(settings.themeColor("tech"), QColor(10, 20, 30));
    QCOMPARE(settings.avatarPoll().timeoutMs, 60000);
}

void AppSettingsTest::testSave_roundTripsFallbackColor()
{
    QTemporaryDir dir;
    const QString iniPath = dir.filePath("saved.ini");

    AppSettings first;
    first.load(iniPath);
    first.setFallbackColor(QColor(1, 2, 3));
    first.save();

    AppSettings second;
    second.load(iniPath);
    QCOMPARE(second.fallbackColor(), QColor(1, 2, 3));
}

QTEST_MAIN(AppSettingsTest)
#include "appsettings_test.moc"
