// congestion_classifier.cpp
#include "congestion_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>

#include "csv.hpp"
#include "errors.hpp"

namespace traffic {

static double clamp01(double x) {
  return std::max(0.0, std::min(1.0, x));
}

static double squared_distance(const FeatureVector& a, const FeatureVector& b) {
  double d = 0.0;
  for (size_t i = 0; i < a.size(); ++i) d += (a[i] - b[i]) * (a[i] - b[i]);
  return d;
}

static void check_score_config(const ScoreConfig& s) {
  if (!(s.queue_scale > 0.0) || !(s.wait_scale_s > 0.0)) {
    throw ClassifierFitFailure("queue and wait scales must be positive");
  }
  if (s.w_queue < 0.0 || s.w_wait < 0.0 || s.w_occupancy < 0.0 ||
      (s.w_queue + s.w_wait + s.w_occupancy) <= 0.0) {
    throw ClassifierFitFailure("score weights must be non-negative and not all zero");
  }
}

FeatureVector CongestionClassifier::normalize(const IntersectionFeature& f) const {
  return FeatureVector{clamp01(f.queue_length / cfg_.score.queue_scale),
                       clamp01(f.mean_wait_s / cfg_.score.wait_scale_s),
                       clamp01(f.occupancy)};
}

double CongestionClassifier::score_normalized_(const FeatureVector& v) const {
  const auto& w = cfg_.score;
  const double total = w.w_queue + w.w_wait + w.w_occupancy;
  return clamp01((w.w_queue * v[0] + w.w_wait * v[1] + w.w_occupancy * v[2]) / total);
}

double CongestionClassifier::score(const IntersectionFeature& f) const {
  return score_normalized_(normalize(f));
}

CongestionLabel CongestionClassifier::nearest_centroid_(const FeatureVector& v) const {
  int best = 0;
  double best_d = squared_distance(v, centroids_[0]);
  for (int k = 1; k < kLabelCount; ++k) {
    const double d = squared_distance(v, centroids_[k]);
    if (d < best_d) {
      best_d = d;
      best = k;
    }
  }
  return static_cast<CongestionLabel>(best);
}

CongestionLabel CongestionClassifier::classify(const IntersectionFeature& f) const {
  // Idle intersections are always Low, whatever the fitted model says.
  if (f.is_empty()) return CongestionLabel::Low;

  if (cfg_.mode == ClassifierConfig::Mode::Clusters) return nearest_centroid_(normalize(f));

  const double s = score(f);
  if (s >= cfg_.high_threshold) return CongestionLabel::High;
  if (s >= cfg_.medium_threshold) return CongestionLabel::Medium;
  return CongestionLabel::Low;
}

CongestionClassifier CongestionClassifier::from_thresholds(const ClassifierConfig& cfg) {
  check_score_config(cfg.score);
  if (!(cfg.medium_threshold > 0.0) || !(cfg.high_threshold > cfg.medium_threshold) ||
      cfg.high_threshold > 1.0) {
    throw ClassifierFitFailure("thresholds must satisfy 0 < medium < high <= 1");
  }
  ClassifierConfig c = cfg;
  c.mode = ClassifierConfig::Mode::Thresholds;
  return CongestionClassifier(c);
}

// k-means with k = kLabelCount. Seeds sit at score quantiles of the data so
// the fit is deterministic; clusters are then ordered by centroid score.
CongestionClassifier CongestionClassifier::fit_clusters(const ClassifierConfig& cfg,
                                                        const std::vector<IntersectionFeature>& history) {
  check_score_config(cfg.score);
  ClassifierConfig c = cfg;
  c.mode = ClassifierConfig::Mode::Clusters;
  CongestionClassifier out(c);

  const size_t n = history.size();
  if (n < static_cast<size_t>(kLabelCount)) {
    throw ClassifierFitFailure("need at least " + std::to_string(kLabelCount) +
                               " feature vectors, got " + std::to_string(n));
  }

  std::vector<FeatureVector> pts;
  pts.reserve(n);
  for (const auto& f : history) {
    if (!std::isfinite(f.queue_length) || !std::isfinite(f.mean_wait_s) || !std::isfinite(f.occupancy)) {
      throw ClassifierFitFailure("non-finite value in feature history");
    }
    pts.push_back(out.normalize(f));
  }

  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return out.score_normalized_(pts[a]) < out.score_normalized_(pts[b]);
  });

  std::array<FeatureVector, kLabelCount> centroids{};
  for (int k = 0; k < kLabelCount; ++k) {
    const size_t q = ((2 * static_cast<size_t>(k) + 1) * n) / (2 * kLabelCount);
    centroids[k] = pts[order[std::min(q, n - 1)]];
  }
  for (int a = 0; a < kLabelCount; ++a) {
    for (int b = a + 1; b < kLabelCount; ++b) {
      if (centroids[a] == centroids[b]) {
        throw ClassifierFitFailure("feature history has fewer than " + std::to_string(kLabelCount) +
                                   " distinct congestion levels");
      }
    }
  }

  std::vector<int> assign(n, -1);
  const int max_iter = std::max(1, cfg.max_iterations);
  for (int iter = 0; iter < max_iter; ++iter) {
    bool changed = false;
    for (size_t i = 0; i < n; ++i) {
      int best = 0;
      double best_d = squared_distance(pts[i], centroids[0]);
      for (int k = 1; k < kLabelCount; ++k) {
        const double d = squared_distance(pts[i], centroids[k]);
        if (d < best_d) {
          best_d = d;
          best = k;
        }
      }
      if (assign[i] != best) {
        assign[i] = best;
        changed = true;
      }
    }

    std::array<FeatureVector, kLabelCount> sums{};
    std::array<size_t, kLabelCount> counts{};
    for (size_t i = 0; i < n; ++i) {
      for (size_t d = 0; d < pts[i].size(); ++d) sums[assign[i]][d] += pts[i][d];
      counts[assign[i]]++;
    }
    for (int k = 0; k < kLabelCount; ++k) {
      if (counts[k] == 0) throw ClassifierFitFailure("k-means left cluster " + std::to_string(k) + " empty");
      for (size_t d = 0; d < sums[k].size(); ++d) {
        centroids[k][d] = sums[k][d] / static_cast<double>(counts[k]);
      }
    }
    if (!changed) break;
  }

  std::array<int, kLabelCount> rank{};
  std::iota(rank.begin(), rank.end(), 0);
  std::stable_sort(rank.begin(), rank.end(), [&](int a, int b) {
    return out.score_normalized_(centroids[a]) < out.score_normalized_(centroids[b]);
  });
  for (int level = 0; level < kLabelCount; ++level) out.centroids_[level] = centroids[rank[level]];
  return out;
}

std::vector<IntersectionFeature> read_feature_history(std::istream& in, const std::string& source_name) {
  std::string line;
  if (!std::getline(in, line)) throw ClassifierFitFailure(source_name + ": empty file");

  const auto header = split_csv_line(line);
  auto column = [&](const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) throw ClassifierFitFailure(source_name + ": missing column '" + name + "'");
    return static_cast<size_t>(it - header.begin());
  };
  const size_t c_queue = column("queueLength");
  const size_t c_wait = column("meanWait");
  const size_t c_occ = column("occupancy");
  const size_t needed = std::max(c_queue, std::max(c_wait, c_occ)) + 1;

  std::vector<IntersectionFeature> out;
  int line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line == "\r") continue;
    const auto fields = split_csv_line(line);
    if (fields.size() < needed) {
      throw ClassifierFitFailure(source_name + ":" + std::to_string(line_no) + ": too few columns");
    }
    const auto where = source_name + ":" + std::to_string(line_no);
    double queue = 0.0, wait = 0.0, occ = 0.0;
    try {
      queue = std::stod(fields[c_queue]);
      wait = std::stod(fields[c_wait]);
      occ = std::stod(fields[c_occ]);
    } catch (const std::exception&) {
      throw ClassifierFitFailure(where + ": malformed number");
    }
    if (!std::isfinite(queue) || !std::isfinite(wait) || !std::isfinite(occ)) {
      throw ClassifierFitFailure(where + ": non-finite value in feature history");
    }
    out.push_back(IntersectionFeature::make("", queue, wait, occ, 0));
  }
  return out;
}

CongestionClassifier CongestionClassifier::fit(const ClassifierConfig& cfg) {
  if (cfg.mode == ClassifierConfig::Mode::Thresholds) return from_thresholds(cfg);

  std::ifstream in(cfg.cluster_model_path);
  if (!in) throw ClassifierFitFailure("cannot open cluster model data '" + cfg.cluster_model_path + "'");
  return fit_clusters(cfg, read_feature_history(in, cfg.cluster_model_path));
}

} // namespace traffic
