#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QTemporaryDir>
#include "app/MixCutConfig.h"

void test_json_roundtrip() {
    MixCutSettings s;
    s.encoder.video.crf = 22;
    s.encoder.video.preset = "medium";
    s.encoder.audio.bitrate = 128000;
    s.ffmpegPath = "/opt/ffmpeg/bin/ffmpeg";
    s.endAlignment = EndAlignment::NextKeyframe;
    s.normalizeByDefault = false;
    s.outputSuffix = "_trim";
    s.outputExtension = "mkv";

    MixCutSettings back = MixCutConfig::settingsFromJson(MixCutConfig::settingsToJson(s));
    assert(back.encoder == s.encoder);
    assert(back.ffmpegPath == s.ffmpegPath);
    assert(back.endAlignment == EndAlignment::NextKeyframe);
    assert(!back.normalizeByDefault);
    assert(back.outputSuffix == "_trim");
    assert(back.outputExtension == "mkv");
    printf("PASS: test_json_roundtrip\n");
}

void test_missing_keys_keep_defaults() {
    QJsonObject video;
    video["crf"] = 28;
    QJsonObject obj;
    obj["video"] = video;

    MixCutSettings s = MixCutConfig::settingsFromJson(obj);
    assert(s.encoder.video.crf == 28);
    assert(s.encoder.video.codec == AppConstants::DefaultVideoCodec);
    assert(s.encoder.video.preset == AppConstants::DefaultPreset);
    assert(s.encoder.audio.codec == AppConstants::DefaultAudioCodec);
    assert(s.encoder.audio.bitrate == AppConstants::DefaultAudioBitrate);
    assert(s.ffmpegPath.isEmpty());
    assert(s.endAlignment == EndAlignment::Exact);
    assert(s.normalizeByDefault);
    assert(s.outputSuffix == AppConstants::DefaultOutputSuffix);
    assert(s.outputExtension == AppConstants::DefaultOutputExtension);
    printf("PASS: test_missing_keys_keep_defaults\n");
}

void test_end_alignment_strings() {
    for (EndAlignment a : {EndAlignment::Exact, EndAlignment::NextKeyframe, EndAlignment::PreviousKeyframe}) {
        assert(MixCutConfig::endAlignmentFromString(MixCutConfig::endAlignmentToString(a)) == a);
    }
    assert(MixCutConfig::endAlignmentToString(EndAlignment::PreviousKeyframe) == "previousKeyframe");
    assert(MixCutConfig::endAlignmentFromString("sideways") == EndAlignment::Exact);
    assert(MixCutConfig::endAlignmentFromString("", EndAlignment::NextKeyframe) == EndAlignment::NextKeyframe);
    printf("PASS: test_end_alignment_strings\n");
}

void test_save_load() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = dir.filePath("mixcut.json");

    MixCutSettings s;
    s.encoder.video.crf = 20;
    s.endAlignment = EndAlignment::PreviousKeyframe;

    MixCutConfig config;
    assert(config.save(path, s));

    MixCutSettings loaded;
    assert(config.load(path, loaded));
    assert(loaded.encoder.video.crf == 20);
    assert(loaded.endAlignment == EndAlignment::PreviousKeyframe);
    printf("PASS: test_save_load\n");
}

void test_load_errors() {
    QTemporaryDir dir;
    assert(dir.isValid());

    MixCutConfig config;
    MixCutSettings s;
    s.encoder.video.crf = 5;
    assert(!config.load(dir.filePath("missing.json"), s));
    assert(config.errorString().startsWith("Cannot read"));
    // Untouched on failure
    assert(s.encoder.video.crf == 5);

    const QString broken = dir.filePath("broken.json");
    QFile file(broken);
    assert(file.open(QIODevice::WriteOnly));
    file.write("{ \"settings\": ");
    file.close();

    assert(!config.load(broken, s));
    assert(config.errorString().startsWith("Invalid config format"));
    assert(s.encoder.video.crf == 5);
    printf("PASS: test_load_errors\n");
}

void test_resolve_ffmpeg_path() {
    MixCutSettings s;
    qputenv(AppConstants::FfmpegEnvVar, "/custom/ffmpeg");
    assert(MixCutConfig::resolveFfmpegPath(s) == "/custom/ffmpeg");
    qunsetenv(AppConstants::FfmpegEnvVar);

    // A configured path that is not executable is skipped
    s.ffmpegPath = "/nonexistent/dir/ffmpeg";
    QString resolved = MixCutConfig::resolveFfmpegPath(s);
    assert(resolved != s.ffmpegPath);
    assert(!resolved.isEmpty());
    assert(QFileInfo(resolved).fileName() == "ffmpeg");
    printf("PASS: test_resolve_ffmpeg_path\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_json_roundtrip();
    test_missing_keys_keep_defaults();
    test_end_alignment_strings();
    test_save_load();
    test_load_errors();
    test_resolve_ffmpeg_path();
    printf("All config tests passed.\n");
    return 0;
}
