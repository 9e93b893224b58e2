#include "compensation_analyzer.hpp"
#include "key_moment_selector.hpp"
#include "overlay_renderer.hpp"
#include "report.hpp"
#include "synthetic_session.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <opencv2/opencv.hpp>
#include <iostream>
#include <thread>

namespace insidemotion {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        records_ = SyntheticSession::frames();
        analysis_ = SyntheticSession::analysis();

        frame_ = cv::Mat::zeros(1080, 1920, CV_8UC3);
        cv::randu(frame_, cv::Scalar(0, 0, 0), cv::Scalar(255, 255, 255));
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        records_.clear();
        frame_.release();
    }

protected:
    std::vector<FrameRecord> records_;
    CompensationAnalysis analysis_;
    cv::Mat frame_;
};

// Session-level aggregation over the 360-record synthetic session
BENCHMARK_DEFINE_F(BenchmarkFixture, CompensationAnalysis)(benchmark::State& state) {
    CompensationAnalyzer analyzer;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = analyzer.analyze(records_);
        benchmark::DoNotOptimize(result);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["records"] = static_cast<double>(records_.size());
        state.counters["records_per_second"] = static_cast<double>(records_.size()) / elapsed_seconds.count();
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, KeyMomentSelection)(benchmark::State& state) {
    KeyMomentSelector selector(SyntheticSession::kStride, SyntheticSession::kFps);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto selections = selector.select(records_);
        benchmark::DoNotOptimize(selections);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["moments"] = static_cast<double>(selections.size());
    }
}

// Overlay on a full-HD frame, one render per iteration
BENCHMARK_DEFINE_F(BenchmarkFixture, OverlayRendering)(benchmark::State& state) {
    OverlayRenderer renderer;
    const auto& keypoints = records_[records_.size() / 2].keypoints;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        cv::Mat annotated = renderer.render(frame_, keypoints, analysis_.metrics);
        benchmark::DoNotOptimize(annotated.data);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["width"] = frame_.cols;
        state.counters["height"] = frame_.rows;
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, ReportSerialization)(benchmark::State& state) {
    AnalysisReport report;
    report.fps = SyntheticSession::kFps;
    report.total_frames = SyntheticSession::kTotalFrames;
    report.duration = SyntheticSession::kDuration;
    report.keypoints_data = records_;
    report.analysis = analysis_;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        nlohmann::json j = report;
        std::string text = j.dump();
        benchmark::DoNotOptimize(text);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["bytes"] = static_cast<double>(text.size());
    }
}

BENCHMARK_REGISTER_F(BenchmarkFixture, CompensationAnalysis)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, KeyMomentSelection)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, OverlayRendering)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, ReportSerialization)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace insidemotion

int main(int argc, char** argv) {
    std::cout << "InsideMotion Compensation Analysis - Performance Benchmarks" << std::endl;
    std::cout << "===========================================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  OpenCV: " << CV_VERSION << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
