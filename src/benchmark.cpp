#include "cancellation.hpp"
#include "keyframe_extractor.hpp"
#include "video_file_source.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <iostream>
#include <random>
#include <thread>

namespace kfx {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        config_ = ExtractionConfig{};
        config_.max_keyframes = 20;
        config_.min_interval_s = 0.5;

        create_synthetic_video();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::remove(kVideoPath);
    }

protected:
    static constexpr const char* kVideoPath = "benchmark_video.avi";

    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');

        if (!writer.open(kVideoPath, fourcc, 30.0, cv::Size(640, 360))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);

        // 300 frames (10 seconds at 30fps), a new tiled background every 2 seconds
        cv::Mat background;
        for (int i = 0; i < 300; ++i) {
            if (i % 60 == 0) {
                background = cv::Mat::zeros(360, 640, CV_8UC3);
                for (int y = 0; y < background.rows; y += 20) {
                    for (int x = 0; x < background.cols; x += 20) {
                        cv::Scalar color(dis(gen), dis(gen), dis(gen));
                        cv::rectangle(background, cv::Point(x, y), cv::Point(x + 18, y + 18), color, -1);
                    }
                }
            }

            cv::Mat frame = background.clone();
            int circle_x = (i * 5) % frame.cols;
            int circle_y = 180 + static_cast<int>(60 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 30, cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();
    }

    ExtractionConfig config_;
};

// Full method pass, one benchmark argument per Method enumerator
BENCHMARK_DEFINE_F(BenchmarkFixture, MethodExtraction)(benchmark::State& state) {
    const Method method = static_cast<Method>(state.range(0));
    config_.methods = {method};
    KeyframeExtractor extractor(config_);

    size_t keyframes = 0;
    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = extractor.extract(kVideoPath);
        keyframes = result.size();

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
    }

    state.counters["keyframes"] = static_cast<double>(keyframes);
    state.SetLabel(method_name(method));
}

BENCHMARK_DEFINE_F(BenchmarkFixture, FlowStepScaling)(benchmark::State& state) {
    config_.methods = {Method::OpticalFlow};
    config_.flow_step = static_cast<int>(state.range(0));
    KeyframeExtractor extractor(config_);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = extractor.extract(kVideoPath);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["keyframes"] = static_cast<double>(result.size());
        state.counters["flow_step"] = static_cast<double>(config_.flow_step);
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, ContainerIndexProbe)(benchmark::State& state) {
    VideoFileSource source(kVideoPath);
    CancellationToken cancel;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto entries = source.probe_keyframe_indices(cancel);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["index_frames"] = static_cast<double>(entries.size());
    }
}

// Register benchmarks
BENCHMARK_REGISTER_F(BenchmarkFixture, MethodExtraction)
    ->DenseRange(static_cast<int>(Method::IFrame), static_cast<int>(Method::OpticalFlow))
    ->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, FlowStepScaling)->RangeMultiplier(2)->Range(1, 8)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, ContainerIndexProbe)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace kfx

int main(int argc, char** argv) {
    std::cout << "Keyframe Extraction - Performance Benchmarks" << std::endl;
    std::cout << "============================================" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
