#include <cassert>
#include <cstdio>
#include <cmath>
#include <QTemporaryDir>
#include "media/MediaProbe.h"
#include "util/TimeUtil.h"
#include "FakeProcessRunner.h"

static const char* SAMPLE_JSON = R"({
  "streams": [
    { "index": 0, "codec_type": "data", "codec_name": "bin_data" },
    { "index": 1, "codec_type": "video", "codec_name": "HEVC", "pix_fmt": "yuv420p10le",
      "width": 3840, "height": 2160, "avg_frame_rate": "0/0", "r_frame_rate": "30000/1001" },
    { "index": 2, "codec_type": "audio", "codec_name": "aac", "sample_rate": "48000", "channels": 2 },
    { "index": 3, "codec_type": "video", "codec_name": "mjpeg", "width": 160, "height": 120 }
  ],
  "format": { "format_name": "mov,mp4,m4a,3gp,3g2,mj2", "duration": "12.512000" }
})";

void test_parse_ffprobe_json() {
    QString error;
    std::optional<MediaInfo> info = MediaProbe::parse(SAMPLE_JSON, "/tmp/a.mp4", &error);
    assert(info.has_value());
    assert(info->filePath == "/tmp/a.mp4");
    assert(info->hasVideo);
    assert(info->videoCodec == "hevc");
    assert(info->videoPixelFormat == "yuv420p10le");
    assert(info->videoWidth == 3840);
    assert(info->videoHeight == 2160);
    assert(std::fabs(info->videoFps - 29.97) < 0.01);
    assert(info->hasAudio);
    assert(info->audioCodec == "aac");
    assert(info->audioSampleRate == 48000);
    assert(info->audioChannels == 2);
    assert(std::fabs(info->duration - 12.512) < 1e-6);
    printf("PASS: test_parse_ffprobe_json\n");
}

void test_parse_malformed() {
    QString error;
    assert(!MediaProbe::parse("not json", "x.mp4", &error).has_value());
    assert(!error.isEmpty());
    assert(!MediaProbe::parse("[1,2]", "x.mp4").has_value());
    printf("PASS: test_parse_malformed\n");
}

void test_parse_rational() {
    assert(std::fabs(TimeUtil::parseRational("25/1") - 25.0) < 1e-9);
    assert(TimeUtil::parseRational("0/0") == 0.0);
    assert(TimeUtil::parseRational("garbage") == 0.0);
    assert(std::fabs(TimeUtil::parseRational("24") - 24.0) < 1e-9);
    printf("PASS: test_parse_rational\n");
}

void test_probe_runs_ffprobe() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = dir.filePath("clip.mp4");
    FakeProcessRunner::writeMedia(path, "codec=h264;pix=yuv420p;w=640;h=480;audio=aac");

    FakeProcessRunner runner;
    MediaProbe probe(runner, runner.ffprobe);
    std::optional<MediaInfo> info = probe.probe(path);
    assert(info.has_value());
    assert(info->videoWidth == 640);
    assert(info->audioCodec == "aac");

    assert(runner.calls.size() == 1);
    const QStringList expected = {"-v", "error", "-print_format", "json",
                                  "-show_streams", "-show_format", path};
    assert(runner.calls[0].args == expected);
    printf("PASS: test_probe_runs_ffprobe\n");
}

void test_probe_failures_are_empty() {
    QTemporaryDir dir;
    FakeProcessRunner runner;
    MediaProbe probe(runner, runner.ffprobe);

    assert(!probe.probe(dir.filePath("missing.mp4")).has_value());
    assert(probe.errorString().contains("exited with 1"));

    const QString junk = dir.filePath("junk.mp4");
    FakeProcessRunner::writeMedia(junk, "this is not a video");
    assert(!probe.probe(junk).has_value());

    runner.ffprobeAvailable = false;
    const QString good = dir.filePath("good.mp4");
    FakeProcessRunner::writeMedia(good, "codec=h264;pix=yuv420p;w=640;h=480");
    assert(!probe.probe(good).has_value());
    assert(!probe.errorString().isEmpty());
    printf("PASS: test_probe_failures_are_empty\n");
}

int main() {
    test_parse_ffprobe_json();
    test_parse_malformed();
    test_parse_rational();
    test_probe_runs_ffprobe();
    test_probe_failures_are_empty();
    printf("All media probe tests passed.\n");
    return 0;
}
