#pragma once

#include "compensation_analyzer.hpp"
#include "pose_types.hpp"
#include <vector>

namespace insidemotion {

// Placeholder session used when no pose detector can be initialized:
// 24 s at 30 fps, every 2nd frame, six squat cycles with a lateral drift.
struct SyntheticSession {
    static constexpr double kFps = 30.0;
    static constexpr int kTotalFrames = 720;
    static constexpr int kStride = 2;
    static constexpr double kDuration = kTotalFrames / kFps;
    static constexpr double kCycles = 6.0;  // full squat periods over the session

    static std::vector<FrameRecord> frames();

    // Canned analysis reported in place of a measured one
    static CompensationAnalysis analysis(int knee_flexion_angle = 32);
};

} // namespace insidemotion
