#include <gtest/gtest.h>
#include "keyframe_detector.hpp"
#include "synthetic_frame_source.hpp"
#include <cmath>

namespace kfx {

using testing_support::SyntheticFrameSource;

class KeyframeDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_keyframes = 20;
        config_.min_interval_s = 0.5;
        config_.flow_step = 2;
    }

    void expect_output_invariants(const DetectionResult& result) {
        ASSERT_LE(result.keyframes.size(), static_cast<size_t>(config_.max_keyframes));
        for (size_t i = 1; i < result.keyframes.size(); ++i) {
            const double prev = result.keyframes[i - 1].timestamp_s;
            const double curr = result.keyframes[i].timestamp_s;
            EXPECT_GT(curr, prev);
            EXPECT_GE(curr - prev, config_.min_interval_s - 1e-9);
        }
        for (const auto& kf : result.keyframes) {
            ASSERT_TRUE(result.method.has_value());
            EXPECT_EQ(kf.method, *result.method);
        }
    }

    ExtractionConfig config_;
    CancellationToken cancel_;
};

TEST_F(KeyframeDetectorTest, SingleHardCutYieldsOneDifferenceKeyframe) {
    // 10 seconds at 30 fps, cut at 5.0s
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150));
    config_.methods = {Method::Difference};
    config_.threshold = 12.0;

    KeyframeDetector detector(config_);
    auto result = detector.detect(source, cancel_);

    ASSERT_EQ(result.state, RunState::Resolved);
    ASSERT_EQ(result.keyframes.size(), 1u);
    const Keyframe& kf = result.keyframes[0];
    EXPECT_NEAR(kf.timestamp_s, 5.0, 1.0 / 30.0 + 1e-9);
    EXPECT_EQ(kf.method, Method::Difference);
    ASSERT_TRUE(kf.score.has_value());
    EXPECT_GT(*kf.score, 12.0);
    EXPECT_EQ(method_name(*result.method), "difference");
}

TEST_F(KeyframeDetectorTest, FallsThroughWhenContainerHasNoIndexFrames) {
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150));
    config_.methods = parse_method_list("I_frame,difference");

    KeyframeDetector detector(config_);
    DetectionResult result;
    ASSERT_NO_THROW(result = detector.detect(source, cancel_));

    ASSERT_EQ(result.state, RunState::Resolved);
    EXPECT_EQ(*result.method, Method::Difference);
    ASSERT_EQ(result.keyframes.size(), 1u);

    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[0].method, Method::IFrame);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::Unavailable);
    EXPECT_EQ(result.attempts[1].outcome, AttemptOutcome::Selected);
}

TEST_F(KeyframeDetectorTest, FallbackReturnsExactlyTheSecondMethodsList) {
    auto index = SyntheticFrameSource::index_every(45, 300, 30.0);
    // Static video: difference finds nothing, the container index does
    SyntheticFrameSource source(300, 30.0, testing_support::solid_gray([](int64_t) { return 90; }), index);

    config_.methods = {Method::IFrame};
    auto alone = KeyframeDetector(config_).detect(source, cancel_);

    config_.methods = {Method::Difference, Method::IFrame};
    auto chained = KeyframeDetector(config_).detect(source, cancel_);

    ASSERT_EQ(chained.state, RunState::Resolved);
    EXPECT_EQ(*chained.method, Method::IFrame);
    EXPECT_EQ(chained.attempts[0].outcome, AttemptOutcome::Empty);
    ASSERT_EQ(chained.keyframes.size(), alone.keyframes.size());
    for (size_t i = 0; i < alone.keyframes.size(); ++i) {
        EXPECT_EQ(chained.keyframes[i].frame_index, alone.keyframes[i].frame_index);
        EXPECT_DOUBLE_EQ(chained.keyframes[i].timestamp_s, alone.keyframes[i].timestamp_s);
        EXPECT_EQ(chained.keyframes[i].method, Method::IFrame);
        EXPECT_FALSE(chained.keyframes[i].score.has_value());
    }
    expect_output_invariants(chained);
}

TEST_F(KeyframeDetectorTest, FirstNonEmptyMethodWinsAndLaterMethodsAreSkipped) {
    auto index = SyntheticFrameSource::index_every(30, 300, 30.0);
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150), index);
    config_.methods = {Method::IFrame, Method::Difference};

    auto result = KeyframeDetector(config_).detect(source, cancel_);

    EXPECT_EQ(*result.method, Method::IFrame);
    EXPECT_EQ(result.attempts.size(), 1u);
    EXPECT_EQ(source.sessions_opened(), 0);
}

TEST_F(KeyframeDetectorTest, GreedyCapKeepsFirstThreeInTime) {
    // Cuts every second from 1s to 10s
    SyntheticFrameSource source(330, 30.0, testing_support::periodic_cuts(30));
    config_.methods = {Method::Difference};
    config_.max_keyframes = 3;

    auto result = KeyframeDetector(config_).detect(source, cancel_);

    ASSERT_EQ(result.keyframes.size(), 3u);
    EXPECT_EQ(result.keyframes[0].frame_index, 30);
    EXPECT_EQ(result.keyframes[1].frame_index, 60);
    EXPECT_EQ(result.keyframes[2].frame_index, 90);
    // The scorer stopped at the cap and closed its session
    EXPECT_EQ(result.attempts[0].candidates, 90u);
    EXPECT_EQ(source.open_sessions(), 0);
}

TEST_F(KeyframeDetectorTest, WithoutCapAllTenCutsAreFound) {
    SyntheticFrameSource source(330, 30.0, testing_support::periodic_cuts(30));
    config_.methods = {Method::Difference};

    auto result = KeyframeDetector(config_).detect(source, cancel_);

    EXPECT_EQ(result.keyframes.size(), 10u);
    expect_output_invariants(result);
}

TEST_F(KeyframeDetectorTest, InvariantsHoldForEveryMethod) {
    // A cut every 0.2s is denser than the minimum interval
    auto index = SyntheticFrameSource::index_every(6, 600, 30.0);
    config_.max_keyframes = 7;

    for (Method m : {Method::IFrame, Method::Difference, Method::Histogram, Method::OpticalFlow}) {
        // Flat frames carry no motion, so optical flow gets a moving texture instead
        auto generator = m == Method::OpticalFlow ? testing_support::moving_texture(2.0)
                                                  : testing_support::periodic_cuts(6);
        SyntheticFrameSource source(600, 30.0, generator, index);
        config_.methods = {m};
        config_.threshold.reset();

        auto result = KeyframeDetector(config_).detect(source, cancel_);

        SCOPED_TRACE(method_name(m));
        EXPECT_EQ(result.state, RunState::Resolved);
        EXPECT_FALSE(result.keyframes.empty());
        expect_output_invariants(result);
        EXPECT_EQ(source.open_sessions(), 0);
    }
}

TEST_F(KeyframeDetectorTest, RepeatedRunsAreIdentical) {
    SyntheticFrameSource source(300, 30.0, testing_support::moving_texture(1.5));
    config_.methods = {Method::OpticalFlow};
    config_.threshold = 0.5;

    KeyframeDetector detector(config_);
    auto first = detector.detect(source, cancel_);
    auto second = detector.detect(source, cancel_);

    ASSERT_EQ(first.keyframes.size(), second.keyframes.size());
    ASSERT_FALSE(first.keyframes.empty());
    for (size_t i = 0; i < first.keyframes.size(); ++i) {
        EXPECT_EQ(first.keyframes[i].frame_index, second.keyframes[i].frame_index);
        EXPECT_DOUBLE_EQ(first.keyframes[i].timestamp_s, second.keyframes[i].timestamp_s);
        EXPECT_DOUBLE_EQ(*first.keyframes[i].score, *second.keyframes[i].score);
    }
}

TEST_F(KeyframeDetectorTest, AllMethodsEmptyIsExhaustedNotAnError) {
    SyntheticFrameSource source(120, 30.0, testing_support::solid_gray([](int64_t) { return 128; }));
    config_.methods = {Method::IFrame, Method::Difference, Method::Histogram};

    DetectionResult result;
    ASSERT_NO_THROW(result = KeyframeDetector(config_).detect(source, cancel_));

    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_FALSE(result.method.has_value());
    EXPECT_TRUE(result.keyframes.empty());
    EXPECT_EQ(result.attempts.size(), 3u);
}

TEST_F(KeyframeDetectorTest, MidStreamDecodeFailureFallsBackWithoutPartialResult) {
    auto index = SyntheticFrameSource::index_every(60, 300, 30.0);
    SyntheticFrameSource source(300, 30.0, testing_support::periodic_cuts(30), index);
    // Cuts at 1s..4s are seen before the failure but must not leak out
    source.fail_decode_at(150);
    config_.methods = {Method::Difference, Method::IFrame};

    auto result = KeyframeDetector(config_).detect(source, cancel_);

    ASSERT_EQ(result.state, RunState::Resolved);
    EXPECT_EQ(*result.method, Method::IFrame);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::DecodeFailed);
    for (const auto& kf : result.keyframes) {
        EXPECT_EQ(kf.method, Method::IFrame);
    }
    EXPECT_EQ(source.open_sessions(), 0);
}

TEST_F(KeyframeDetectorTest, SourceErrorIsFatal) {
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150));
    source.fail_open();
    config_.methods = {Method::Difference, Method::Histogram};

    KeyframeDetector detector(config_);
    EXPECT_THROW(detector.detect(source, cancel_), SourceError);
}

TEST_F(KeyframeDetectorTest, CancellationEndsRunAsCancelled) {
    SyntheticFrameSource source(300, 30.0, testing_support::periodic_cuts(30));
    CancellationToken cancel;
    source.on_frame([&cancel](int64_t index) {
        if (index == 100) cancel.cancel();
    });
    config_.methods = {Method::OpticalFlow, Method::Difference};

    auto result = KeyframeDetector(config_).detect(source, cancel);

    EXPECT_EQ(result.state, RunState::Cancelled);
    EXPECT_TRUE(result.cancelled());
    EXPECT_TRUE(result.keyframes.empty());
    // The second method never ran
    ASSERT_EQ(result.attempts.size(), 1u);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::Cancelled);
    EXPECT_EQ(source.open_sessions(), 0);
}

TEST_F(KeyframeDetectorTest, ExpiredDeadlineCancelsBeforeScoring) {
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150));
    CancellationToken expired(std::chrono::milliseconds(0));
    config_.methods = {Method::Difference};

    auto result = KeyframeDetector(config_).detect(source, expired);

    EXPECT_EQ(result.state, RunState::Cancelled);
}

TEST_F(KeyframeDetectorTest, ThresholdOverrideAppliesToScoredMethods) {
    SyntheticFrameSource source(300, 30.0, testing_support::single_cut(150));
    config_.methods = {Method::Difference};
    config_.threshold = 200.0;

    auto result = KeyframeDetector(config_).detect(source, cancel_);

    EXPECT_EQ(result.state, RunState::Exhausted);
}

TEST_F(KeyframeDetectorTest, InvalidConfigIsRejected) {
    config_.max_keyframes = 0;
    EXPECT_THROW({ KeyframeDetector detector(config_); }, std::invalid_argument);
}

} // namespace kfx
