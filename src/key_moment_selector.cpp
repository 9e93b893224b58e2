#include "key_moment_selector.hpp"
#include <cmath>
#include <iostream>

namespace insidemotion {

std::string moment_type_name(MomentType type) {
    switch (type) {
        case MomentType::Neutral: return "neutral";
        case MomentType::Peak: return "peak";
        case MomentType::Recovery: return "recovery";
    }
    return "unknown";
}

KeyMomentSelector::KeyMomentSelector(int stride, double fps)
    : stride_(stride)
    , fps_(fps) {}

const std::vector<MomentTarget>& KeyMomentSelector::targets() {
    static const std::vector<MomentTarget> key_targets = {
        {"Neutral", MomentType::Neutral, 0.2},
        {"Compensation peak", MomentType::Peak, 0.5},
        {"Recovery phase", MomentType::Recovery, 0.8}
    };
    return key_targets;
}

double KeyMomentSelector::session_duration(size_t sampled_frames) const {
    if (fps_ <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(sampled_frames) * stride_ / fps_;
}

std::vector<MomentSelection> KeyMomentSelector::select(const std::vector<FrameRecord>& records) const {
    std::vector<MomentSelection> selections;
    double duration = session_duration(records.size());

    for (const auto& target : targets()) {
        double target_time = duration * target.fraction;

        bool found = false;
        size_t best = 0;
        double best_distance = 0.0;
        for (size_t i = 0; i < records.size(); ++i) {
            if (!records[i].has_detection()) {
                continue;
            }
            double distance = std::abs(records[i].timestamp - target_time);
            if (!found || distance < best_distance) {
                found = true;
                best = i;
                best_distance = distance;
            }
        }
        if (!found) {
            break;
        }

        MomentSelection selection;
        selection.moment.label = target.label;
        selection.moment.type = target.type;
        selection.moment.time = records[best].timestamp;
        selection.moment.frame_index = records[best].frame_index;
        selection.record_index = best;
        selections.push_back(selection);
    }
    return selections;
}

std::vector<MomentFrame> KeyMomentSelector::extract(const std::vector<FrameRecord>& records,
                                                    VideoSource& source) const {
    std::cout << "Extracting key moments..." << std::endl;

    std::vector<MomentFrame> moments;
    for (const auto& selection : select(records)) {
        int index = selection.moment.frame_index;
        if (!source.seek(index)) {
            std::cerr << "Could not seek to frame " << index << ", skipping "
                      << moment_type_name(selection.moment.type) << " moment" << std::endl;
            continue;
        }
        auto frame = source.next_frame();
        if (!frame) {
            std::cerr << "Could not read frame " << index << ", skipping "
                      << moment_type_name(selection.moment.type) << " moment" << std::endl;
            continue;
        }

        MomentFrame moment;
        moment.moment = selection.moment;
        moment.record_index = selection.record_index;
        moment.frame = std::move(*frame);
        moments.push_back(std::move(moment));
    }
    return moments;
}

} // namespace insidemotion
