#include "pose_detector.hpp"
#include <onnxruntime_cxx_api.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace insidemotion {

namespace {

constexpr size_t kMoveNetKeypoints = 17;

// COCO keypoint index for each landmark, in all_landmarks() order
constexpr std::array<int, kLandmarkCount> kCocoIndex = {
    0,      // nose
    5, 6,   // shoulders
    11, 12, // hips
    13, 14, // knees
    15, 16  // ankles
};

} // namespace

class MoveNetPoseDetector::Impl {
public:
    explicit Impl(const PoseDetectorConfig& config)
        : config_(config)
        , env_(ORT_LOGGING_LEVEL_WARNING, "insidemotion") {

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(config_.intra_op_threads);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wide_path(config_.model_path.begin(), config_.model_path.end());
        session_ = std::make_unique<Ort::Session>(env_, wide_path.c_str(), session_options);
#else
        session_ = std::make_unique<Ort::Session>(env_, config_.model_path.c_str(), session_options);
#endif
        get_model_info();
    }

    std::optional<Landmarks> detect(const cv::Mat& rgb_frame) {
        if (rgb_frame.empty()) {
            return std::nullopt;
        }

        cv::Mat resized;
        cv::resize(rgb_frame, resized, cv::Size(input_width_, input_height_), 0, 0, cv::INTER_LINEAR);

        std::vector<int64_t> input_shape = {1, input_height_, input_width_, 3};
        size_t element_count = static_cast<size_t>(input_height_ * input_width_ * 3);
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        Ort::Value input_tensor{nullptr};
        if (input_is_int32_) {
            cv::Mat as_int;
            resized.convertTo(as_int, CV_32SC3);
            const int32_t* begin = as_int.ptr<int32_t>();
            int32_buffer_.assign(begin, begin + element_count);
            input_tensor = Ort::Value::CreateTensor<int32_t>(
                memory_info, int32_buffer_.data(), int32_buffer_.size(),
                input_shape.data(), input_shape.size());
        } else {
            cv::Mat as_float;
            resized.convertTo(as_float, CV_32FC3);
            const float* begin = as_float.ptr<float>();
            float_buffer_.assign(begin, begin + element_count);
            input_tensor = Ort::Value::CreateTensor<float>(
                memory_info, float_buffer_.data(), float_buffer_.size(),
                input_shape.data(), input_shape.size());
        }

        const char* input_names[] = {input_name_.c_str()};
        const char* output_names[] = {output_name_.c_str()};
        auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                     input_names, &input_tensor, 1,
                                     output_names, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            throw std::runtime_error("MoveNet returned no keypoint tensor");
        }
        size_t output_count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        if (output_count < kMoveNetKeypoints * 3) {
            throw std::runtime_error("MoveNet output too small: " + std::to_string(output_count));
        }
        const float* raw = outputs[0].GetTensorData<float>();

        Landmarks landmarks;
        double score_sum = 0.0;
        const auto& names = all_landmarks();
        for (size_t i = 0; i < kLandmarkCount; ++i) {
            const float* kp = raw + kCocoIndex[i] * 3;
            landmarks[i].name = names[i];
            landmarks[i].y = kp[0];
            landmarks[i].x = kp[1];
            landmarks[i].z = 0.0;
            landmarks[i].visibility = kp[2];
            score_sum += kp[2];
        }

        if (score_sum / kLandmarkCount < config_.min_pose_confidence) {
            return std::nullopt;
        }
        return landmarks;
    }

private:
    void get_model_info() {
        if (session_->GetInputCount() < 1 || session_->GetOutputCount() < 1) {
            throw std::runtime_error("Pose model must have at least one input and one output");
        }

        Ort::AllocatorWithDefaultOptions allocator;
        input_name_ = session_->GetInputNameAllocated(0, allocator).get();
        output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

        Ort::TypeInfo input_type_info = session_->GetInputTypeInfo(0);
        auto input_tensor_info = input_type_info.GetTensorTypeAndShapeInfo();
        auto input_shape = input_tensor_info.GetShape();
        input_is_int32_ = input_tensor_info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;

        // Dynamic spatial dims fall back to the configured size
        input_height_ = config_.input_size;
        input_width_ = config_.input_size;
        if (input_shape.size() == 4) {
            if (input_shape[1] > 0) input_height_ = input_shape[1];
            if (input_shape[2] > 0) input_width_ = input_shape[2];
        }

        std::cout << "Pose model input " << input_name_ << " ["
                  << input_height_ << "x" << input_width_ << "x3, "
                  << (input_is_int32_ ? "int32" : "float32") << "], output "
                  << output_name_ << std::endl;
    }

    PoseDetectorConfig config_;
    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;

    std::string input_name_;
    std::string output_name_;
    int64_t input_height_ = 0;
    int64_t input_width_ = 0;
    bool input_is_int32_ = true;

    std::vector<int32_t> int32_buffer_;
    std::vector<float> float_buffer_;
};

MoveNetPoseDetector::MoveNetPoseDetector(const PoseDetectorConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

MoveNetPoseDetector::~MoveNetPoseDetector() = default;

std::optional<Landmarks> MoveNetPoseDetector::detect(const cv::Mat& rgb_frame) {
    return pimpl_->detect(rgb_frame);
}

std::string MoveNetPoseDetector::get_name() const {
    return "MoveNet (ONNX Runtime)";
}

std::shared_ptr<PoseDetector> create_pose_detector(const PoseDetectorConfig& config) {
    if (!std::filesystem::exists(config.model_path)) {
        std::cerr << "Pose model not found at " << config.model_path
                  << ", pose detection unavailable" << std::endl;
        return nullptr;
    }

    try {
        auto detector = std::make_shared<MoveNetPoseDetector>(config);
        std::cout << "Initialized pose detector: " << detector->get_name() << std::endl;
        return detector;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize pose detector: " << e.what() << std::endl;
        return nullptr;
    }
}

} // namespace insidemotion
