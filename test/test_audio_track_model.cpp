#include <cassert>
#include <cstdio>
#include "audio/AudioTrackModel.h"
#include "FakeMediaEngine.h"

void test_load_from_streams() {
    AudioTrackModel model;
    MediaInfo info = makeTestMediaInfo();
    info.streams[2].language = "ita";
    info.streams[2].title = "Commentary";
    model.load(info.audioStreams());

    assert(model.trackCount() == 2);
    assert(model.tracks()[0].streamIndex == 1);
    assert(model.tracks()[1].streamIndex == 2);
    assert(model.tracks()[1].audioOrdinal == 1);
    assert(model.tracks()[0].enabled);
    assert(model.tracks()[0].gainDb == 0.0);
    assert(model.tracks()[1].label == "Track 2 - Commentary [ita]");
    assert(model.enabledCount() == 2);
    printf("PASS: test_load_from_streams\n");
}

void test_enable_and_gain() {
    AudioTrackModel model;
    model.load(makeTestMediaInfo().audioStreams());
    int changes = 0;
    QObject::connect(&model, &AudioTrackModel::trackChanged, [&changes](int) { ++changes; });

    assert(model.setEnabled(2, false));
    assert(!model.track(2)->enabled);
    assert(model.enabledCount() == 1);
    assert(model.setGainDb(1, -6.0));
    assert(model.track(1)->gainDb == -6.0);
    assert(changes == 2);

    // No-op updates do not signal
    assert(model.setGainDb(1, -6.0));
    assert(changes == 2);

    assert(!model.setEnabled(7, true));
    assert(!model.setGainDb(7, 1.0));
    assert(model.track(7) == nullptr);
    printf("PASS: test_enable_and_gain\n");
}

void test_gain_clamped_at_boundary() {
    AudioTrackModel model;
    model.load(makeTestMediaInfo().audioStreams());
    assert(model.setGainDb(1, 45.0));
    assert(model.track(1)->gainDb == 30.0);
    assert(model.setGainDb(1, -99.0));
    assert(model.track(1)->gainDb == -30.0);
    printf("PASS: test_gain_clamped_at_boundary\n");
}

void test_snapshot_is_detached() {
    AudioTrackModel model;
    model.load(makeTestMediaInfo().audioStreams());
    std::vector<AudioTrackState> snap = model.snapshot();
    model.setGainDb(1, 12.0);
    model.setEnabled(2, false);
    assert(snap[0].gainDb == 0.0);
    assert(snap[1].enabled);
    printf("PASS: test_snapshot_is_detached\n");
}

void test_clear() {
    AudioTrackModel model;
    model.load(makeTestMediaInfo().audioStreams());
    model.clear();
    assert(model.trackCount() == 0);
    assert(model.enabledCount() == 0);
    printf("PASS: test_clear\n");
}

int main() {
    test_load_from_streams();
    test_enable_and_gain();
    test_gain_clamped_at_boundary();
    test_snapshot_is_detached();
    test_clear();
    printf("All audio track model tests passed.\n");
    return 0;
}
