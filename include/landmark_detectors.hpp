#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

#include <opencv2/objdetect.hpp>

#include "detector.hpp"

struct FaceDetectorConfig {
  std::string model_path{"models/face_detection_yunet_2023mar.onnx"};
  size_t queue_capacity{2};
  float score_threshold{0.6f};
  float nms_threshold{0.3f};
  int top_k{50};
  double gaze_left{0.45};   // ratio below this looks left
  double gaze_right{0.55};  // ratio above this looks right
  double gaze_alpha{0.5};
  bool mirrored{true};  // frames arrive flipped, so left and right swap
};

// YuNet face detector. Head angles come from the five facial landmarks,
// gaze from the darkest spot inside each eye patch.
class FaceLandmarkDetector : public AsyncDetector {
public:
  explicit FaceLandmarkDetector(FaceDetectorConfig cfg,
                                std::shared_ptr<spdlog::logger> log = nullptr);
  ~FaceLandmarkDetector() override;

  // Left/center/right label for a smoothed gaze ratio.
  static std::string gaze_label(double ratio, double left, double right, bool mirrored);

protected:
  std::shared_ptr<const LandmarkAccessor> infer(const cv::Mat& image) override;

private:
  std::optional<double> eye_ratio(const cv::Mat& gray, cv::Point2f eye, float patch) const;

  FaceDetectorConfig cfg_;
  cv::Ptr<cv::FaceDetectorYN> net_;
  std::optional<double> gaze_ema_;
};

struct BodyDetectorConfig {
  size_t queue_capacity{2};
  double hit_threshold{0.0};
  int win_stride{8};
  double scale{1.05};
};

// HOG people detector. Height is how far the top of the person
// sits above the bottom of the frame, in percent. The largest detection wins.
class BodyHeightDetector : public AsyncDetector {
public:
  explicit BodyHeightDetector(BodyDetectorConfig cfg = {},
                              std::shared_ptr<spdlog::logger> log = nullptr);
  ~BodyHeightDetector() override;

  static double height_percent(const cv::Rect& body, int frame_rows);

protected:
  std::shared_ptr<const LandmarkAccessor> infer(const cv::Mat& image) override;

private:
  BodyDetectorConfig cfg_;
  cv::HOGDescriptor hog_;
};
