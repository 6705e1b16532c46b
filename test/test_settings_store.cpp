#include <cassert>
#include <cstdio>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "app/SettingsStore.h"

static ExportSettings defaultsFor(const QTemporaryDir& dir) {
    ExportSettings d;
    d.datasetRoot = dir.filePath("dataset");
    return d;
}

void test_missing_file_keeps_defaults() {
    QTemporaryDir dir;
    SettingsStore store(dir.filePath("settings.json"), defaultsFor(dir));
    assert(store.load());

    ExportSettings s = store.current();
    assert(s.datasetRoot == dir.filePath("dataset"));
    assert(s.clipDuration == 2.0);
    assert(s.clipMode == ClipMode::Backward);
    assert(s.targetPerLabel == 50);
    assert(s.marginPerLabel == 5);
    assert(!s.alwaysReencode);
    assert(s.frameRate == 0);
    assert(s.trainingDir() == QDir(dir.filePath("dataset")).filePath("Training"));
    printf("PASS: test_missing_file_keeps_defaults\n");
}

void test_update_persists() {
    QTemporaryDir dir;
    const QString file = dir.filePath("settings.json");
    SettingsStore store(file, defaultsFor(dir));
    assert(store.load());

    int notified = 0;
    QObject::connect(&store, &SettingsStore::settingsChanged,
                     [&](const ExportSettings& s) { notified++; assert(s.clipDuration == 3.5); });

    SettingsUpdate change;
    change.clipDuration = 3.5;
    change.clipMode = QString("centered");
    change.alwaysReencode = true;
    change.datasetRoot = dir.filePath("other");
    assert(store.update(change));
    assert(notified == 1);
    assert(QDir(dir.filePath("other/Training")).exists());

    SettingsStore reloaded(file, defaultsFor(dir));
    assert(reloaded.load());
    ExportSettings s = reloaded.current();
    assert(s.clipDuration == 3.5);
    assert(s.clipMode == ClipMode::Centered);
    assert(s.alwaysReencode);
    assert(s.datasetRoot == dir.filePath("other"));
    assert(s.targetPerLabel == 50);

    QFile f(file);
    assert(f.open(QIODevice::ReadOnly));
    QJsonObject root = QJsonDocument::fromJson(f.readAll()).object();
    assert(root["version"].toInt() == 1);
    assert(root["clip_mode"].toString() == "centered");
    printf("PASS: test_update_persists\n");
}

void test_invalid_update_rejected() {
    QTemporaryDir dir;
    SettingsStore store(dir.filePath("settings.json"), defaultsFor(dir));
    assert(store.load());

    SettingsUpdate bad;
    bad.clipDuration = 1.0;
    bad.clipMode = QString("sideways");
    assert(!store.update(bad));
    assert(store.errorString().contains("sideways"));
    // Nothing applied, not even the valid field
    assert(store.current().clipDuration == 2.0);
    assert(!QFile::exists(store.filePath()));

    SettingsUpdate negative;
    negative.clipDuration = -1.0;
    assert(!store.update(negative));
    negative = SettingsUpdate();
    negative.frameRate = -5;
    assert(!store.update(negative));
    printf("PASS: test_invalid_update_rejected\n");
}

void test_bad_file_versions() {
    QTemporaryDir dir;
    const QString file = dir.filePath("settings.json");
    QFile f(file);
    assert(f.open(QIODevice::WriteOnly));
    f.write(R"({"clip_duration": 4.0})");
    f.close();

    SettingsStore store(file, defaultsFor(dir));
    assert(!store.load());
    assert(store.errorString().contains("version"));

    assert(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(R"({"version": 1, "clip_duration": -4.0, "clip_mode": "nope", "frame_rate": 25})");
    f.close();
    assert(store.load());
    assert(store.current().clipDuration == 2.0);
    assert(store.current().clipMode == ClipMode::Backward);
    assert(store.current().frameRate == 25);
    printf("PASS: test_bad_file_versions\n");
}

int main() {
    test_missing_file_keeps_defaults();
    test_update_persists();
    test_invalid_update_rejected();
    test_bad_file_versions();
    printf("All settings store tests passed.\n");
    return 0;
}
