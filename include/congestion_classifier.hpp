// congestion_classifier.hpp
#pragma once

#include <array>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "traffic_types.hpp"

namespace traffic {

struct ScoreConfig {
  // Normalization: values at or above the scale count as fully congested.
  double queue_scale = 20.0;   // vehicles
  double wait_scale_s = 60.0;  // seconds

  double w_queue = 0.4;
  double w_wait = 0.3;
  double w_occupancy = 0.3;
};

struct ClassifierConfig {
  enum class Mode { Thresholds, Clusters };
  Mode mode = Mode::Thresholds;

  ScoreConfig score;

  // Thresholds mode: score >= high_threshold -> High, >= medium_threshold -> Medium.
  double medium_threshold = 0.3;
  double high_threshold = 0.6;

  // Clusters mode: CSV of historical features (queueLength, meanWait, occupancy).
  std::string cluster_model_path;
  int max_iterations = 100;
};

using FeatureVector = std::array<double, 3>;

// Fit once before the run, then only read. classify() is a pure function of
// the feature and the fitted state.
class CongestionClassifier {
public:
  // Throws ClassifierFitFailure on unusable config or data.
  static CongestionClassifier fit(const ClassifierConfig& cfg);
  static CongestionClassifier from_thresholds(const ClassifierConfig& cfg);
  static CongestionClassifier fit_clusters(const ClassifierConfig& cfg,
                                           const std::vector<IntersectionFeature>& history);

  CongestionLabel classify(const IntersectionFeature& f) const;

  // Weighted congestion score in [0,1].
  double score(const IntersectionFeature& f) const;

  FeatureVector normalize(const IntersectionFeature& f) const;

  ClassifierConfig::Mode mode() const { return cfg_.mode; }

  // Clusters mode only; index = label level.
  const std::array<FeatureVector, kLabelCount>& centroids() const { return centroids_; }

private:
  explicit CongestionClassifier(ClassifierConfig cfg) : cfg_(std::move(cfg)) {}

  double score_normalized_(const FeatureVector& v) const;
  CongestionLabel nearest_centroid_(const FeatureVector& v) const;

  ClassifierConfig cfg_;
  std::array<FeatureVector, kLabelCount> centroids_{};
};

// Reads (queueLength, meanWait, occupancy) rows by header name. Throws
// ClassifierFitFailure on missing columns or malformed numbers.
std::vector<IntersectionFeature> read_feature_history(std::istream& in, const std::string& source_name);

} // namespace traffic
