#include "support/fakes.hpp"
#include "support/manual_scheduler.hpp"
#include "voice/audio_player.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace jukebox;
using namespace jukebox::testing;

namespace {

// Never yields data; read blocks until close()
class BlockingStream : public AudioStream {
public:
    size_t read(uint8_t*, size_t) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_; });
        return 0;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        cv_.notify_all();
        run_close_hooks();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

class AudioPlayerTest : public ::testing::Test {
protected:
    ManualScheduler scheduler;
    RecordingSink sink;
    PcmAudioPlayer player{scheduler, PlayerConfig{2.0, std::chrono::milliseconds(1)}};

    std::vector<PlayerState> states;
    std::vector<std::string> errors;
    Subscription sub;

    void SetUp() override {
        player.attach_sink(&sink);
        sub = player.subscribe([this](const PlayerEvent& event) {
            if (auto* change = std::get_if<PlayerStateChanged>(&event)) {
                states.push_back(change->new_state);
            } else {
                errors.push_back(std::get<PlayerErrored>(event).message);
            }
        });
    }

    bool wait_for(PlayerState state) {
        return scheduler.run_until([&] { return player.state() == state; });
    }

    bool saw(PlayerState state) const {
        return std::find(states.begin(), states.end(), state) != states.end();
    }
};

} // namespace

TEST_F(AudioPlayerTest, PlaysStreamToCompletion) {
    std::vector<uint8_t> pcm(kPcmFrameBytes * 3, 0x11);
    player.play(AudioResource{std::make_unique<MemoryAudioStream>(pcm, 4096), std::nullopt});
    EXPECT_EQ(player.state(), PlayerState::Buffering);

    ASSERT_TRUE(wait_for(PlayerState::Idle));
    EXPECT_EQ(sink.received_bytes(), pcm.size());
    ASSERT_GE(states.size(), 3u);
    EXPECT_EQ(states.front(), PlayerState::Buffering);
    EXPECT_TRUE(saw(PlayerState::Playing));
    EXPECT_EQ(states.back(), PlayerState::Idle);
    EXPECT_TRUE(errors.empty());
}

TEST_F(AudioPlayerTest, StreamErrorIsReported) {
    std::vector<uint8_t> pcm(kPcmFrameBytes, 0x22);
    player.play(AudioResource{std::make_unique<MemoryAudioStream>(pcm, kPcmFrameBytes, "decoder exited with status 1"),
                              std::nullopt});

    ASSERT_TRUE(wait_for(PlayerState::Idle));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "decoder exited with status 1");
}

TEST_F(AudioPlayerTest, WaitsForSinkThenResumes) {
    sink.ready_flag = false;
    std::vector<uint8_t> pcm(kPcmFrameBytes * 2, 0x33);
    player.play(AudioResource{std::make_unique<MemoryAudioStream>(pcm, kPcmFrameBytes), std::nullopt});

    ASSERT_TRUE(wait_for(PlayerState::AutoPaused));
    EXPECT_EQ(sink.received_bytes(), 0u);

    sink.ready_flag = true;
    ASSERT_TRUE(wait_for(PlayerState::Idle));
    EXPECT_TRUE(saw(PlayerState::Playing));
    EXPECT_EQ(sink.received_bytes(), pcm.size());
}

TEST_F(AudioPlayerTest, ForcedStopDiscardsQueuedAudio) {
    auto tracker_closed = std::make_shared<bool>(false);
    auto stream = std::make_unique<BlockingStream>();
    stream->add_close_hook([tracker_closed]() { *tracker_closed = true; });

    player.play(AudioResource{std::move(stream), std::nullopt});
    player.stop(true);

    EXPECT_EQ(player.state(), PlayerState::Idle);
    EXPECT_TRUE(*tracker_closed);
    EXPECT_EQ(sink.discards, 1);

    // Nothing from the halted pump may change state afterwards
    scheduler.run_pending();
    EXPECT_EQ(player.state(), PlayerState::Idle);
}

TEST_F(AudioPlayerTest, PauseAndUnpause) {
    EXPECT_FALSE(player.pause());

    player.play(AudioResource{std::make_unique<BlockingStream>(), std::nullopt});
    EXPECT_TRUE(player.pause());
    EXPECT_EQ(player.state(), PlayerState::Paused);
    EXPECT_FALSE(player.pause());

    EXPECT_TRUE(player.unpause());
    EXPECT_EQ(player.state(), PlayerState::Playing);
    EXPECT_FALSE(player.unpause());

    player.stop();
    EXPECT_EQ(player.state(), PlayerState::Idle);
    EXPECT_EQ(sink.discards, 0);
}
