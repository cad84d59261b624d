#include "landmark_detectors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "logging.hpp"

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
// Nose tip position between the eye line and the mouth line when facing the camera.
constexpr double kNeutralNoseDrop = 0.55;
constexpr double kAngleGain = 90.0;

// YuNet output row: box, right eye, left eye, nose tip, mouth corners, score.
cv::Point2f landmark(const cv::Mat& faces, int row, int i) {
  return {faces.at<float>(row, 4 + 2 * i), faces.at<float>(row, 5 + 2 * i)};
}

}  // namespace

FaceLandmarkDetector::FaceLandmarkDetector(FaceDetectorConfig cfg,
                                           std::shared_ptr<spdlog::logger> log)
    : AsyncDetector(DetectionKind::Face, cfg.queue_capacity, std::move(log)),
      cfg_(std::move(cfg)) {
  if (!(cfg_.gaze_left < cfg_.gaze_right)) {
    throw std::invalid_argument("gaze_left must be below gaze_right");
  }
  if (!(cfg_.gaze_alpha > 0.0 && cfg_.gaze_alpha <= 1.0)) {
    throw std::invalid_argument("gaze_alpha must be in (0, 1]");
  }
  try {
    net_ = cv::FaceDetectorYN::create(cfg_.model_path, "", cv::Size(320, 320),
                                      cfg_.score_threshold, cfg_.nms_threshold, cfg_.top_k);
  } catch (const cv::Exception& e) {
    throw std::runtime_error("Cannot load face model '" + cfg_.model_path + "': " + e.what());
  }
  if (net_.empty()) throw std::runtime_error("Cannot load face model '" + cfg_.model_path + "'");
  log_->info("Face model loaded from {}", cfg_.model_path);
}

FaceLandmarkDetector::~FaceLandmarkDetector() { shutdown(); }

std::string FaceLandmarkDetector::gaze_label(double ratio, double left, double right,
                                             bool mirrored) {
  if (ratio < left) return mirrored ? "right" : "left";
  if (ratio > right) return mirrored ? "left" : "right";
  return "center";
}

std::optional<double> FaceLandmarkDetector::eye_ratio(const cv::Mat& gray, cv::Point2f eye,
                                                      float patch) const {
  const int side = static_cast<int>(std::lround(patch));
  cv::Rect roi(static_cast<int>(eye.x) - side / 2, static_cast<int>(eye.y) - side / 2, side, side);
  roi &= cv::Rect(0, 0, gray.cols, gray.rows);
  if (roi.width < 4 || roi.height < 4) return std::nullopt;

  cv::Mat blurred;
  cv::GaussianBlur(gray(roi), blurred, cv::Size(3, 3), 0);
  cv::Point darkest;
  cv::minMaxLoc(blurred, nullptr, nullptr, &darkest, nullptr);
  return static_cast<double>(darkest.x) / (roi.width - 1);
}

std::shared_ptr<const LandmarkAccessor> FaceLandmarkDetector::infer(const cv::Mat& image) {
  if (image.empty()) return nullptr;
  net_->setInputSize(image.size());
  cv::Mat faces;
  net_->detect(image, faces);
  if (faces.empty() || faces.rows == 0) return nullptr;

  // Largest face wins.
  int best = 0;
  for (int r = 1; r < faces.rows; ++r) {
    if (faces.at<float>(r, 2) * faces.at<float>(r, 3) >
        faces.at<float>(best, 2) * faces.at<float>(best, 3)) {
      best = r;
    }
  }
  const cv::Point2f right_eye = landmark(faces, best, 0);
  const cv::Point2f left_eye = landmark(faces, best, 1);
  const cv::Point2f nose = landmark(faces, best, 2);
  const cv::Point2f mouth = (landmark(faces, best, 3) + landmark(faces, best, 4)) * 0.5f;
  const cv::Point2f eye_mid = (right_eye + left_eye) * 0.5f;

  const double eye_dx = left_eye.x - right_eye.x;
  const double drop = mouth.y - eye_mid.y;
  if (std::abs(eye_dx) < 1.0 || drop < 1.0) return nullptr;

  auto reading = std::make_shared<PoseReading>();
  reading->roll_deg = std::atan2(left_eye.y - right_eye.y, eye_dx) * kRadToDeg;
  reading->yaw_deg = ((nose.x - right_eye.x) / eye_dx - 0.5) * kAngleGain;
  reading->pitch_deg = (kNeutralNoseDrop - (nose.y - eye_mid.y) / drop) * kAngleGain;

  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else {
    gray = image;
  }
  const float patch = static_cast<float>(std::abs(eye_dx)) * 0.3f;
  auto r1 = eye_ratio(gray, right_eye, patch);
  auto r2 = eye_ratio(gray, left_eye, patch);
  if (r1 && r2) {
    const double raw = (*r1 + *r2) / 2.0;
    gaze_ema_ = gaze_ema_ ? cfg_.gaze_alpha * raw + (1.0 - cfg_.gaze_alpha) * *gaze_ema_ : raw;
    reading->gaze_reading =
        Gaze{gaze_label(*gaze_ema_, cfg_.gaze_left, cfg_.gaze_right, cfg_.mirrored), *gaze_ema_};
  }
  return reading;
}

BodyHeightDetector::BodyHeightDetector(BodyDetectorConfig cfg, std::shared_ptr<spdlog::logger> log)
    : AsyncDetector(DetectionKind::Pose, cfg.queue_capacity, std::move(log)), cfg_(cfg) {
  if (cfg_.win_stride <= 0 || !(cfg_.scale > 1.0)) {
    throw std::invalid_argument("HOG stride must be positive and scale above 1");
  }
  hog_.setSVMDetector(cv::HOGDescriptor::getDefaultPeopleDetector());
}

BodyHeightDetector::~BodyHeightDetector() { shutdown(); }

double BodyHeightDetector::height_percent(const cv::Rect& body, int frame_rows) {
  if (frame_rows <= 0) return 0.0;
  const double top = std::clamp(body.y, 0, frame_rows);
  return 100.0 * (1.0 - top / frame_rows);
}

std::shared_ptr<const LandmarkAccessor> BodyHeightDetector::infer(const cv::Mat& image) {
  if (image.empty()) return nullptr;
  std::vector<cv::Rect> bodies;
  hog_.detectMultiScale(image, bodies, cfg_.hit_threshold,
                        cv::Size(cfg_.win_stride, cfg_.win_stride), cv::Size(), cfg_.scale);
  if (bodies.empty()) return nullptr;

  const auto largest = std::max_element(
      bodies.begin(), bodies.end(),
      [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });
  auto reading = std::make_shared<PoseReading>();
  reading->height_pct = height_percent(*largest, image.rows);
  return reading;
}
