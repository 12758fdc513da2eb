#include <algorithm>
#include <cmath>
#include <deque>
#include <format>
#include <railog/dbscan.hpp>
#include <railog/tracy.hpp>
#include <stdexcept>

namespace railog {

  namespace {

    constexpr int UNASSIGNED = -1;

    class RegionQuery {
    public:
      RegionQuery(const EmbeddingMatrix& points, float epsilon)
          : points_(points), eps_sq_(epsilon * epsilon) {}

      std::vector<Eigen::Index> operator()(Eigen::Index i) const {
        Eigen::VectorXf dist_sq = (points_.rowwise() - points_.row(i)).rowwise().squaredNorm();
        std::vector<Eigen::Index> neighbors;
        for (Eigen::Index j = 0; j < dist_sq.size(); ++j) {
          if (dist_sq(j) < eps_sq_) neighbors.push_back(j);
        }
        return neighbors;
      }

    private:
      const EmbeddingMatrix& points_;
      float eps_sq_;
    };

  }  // namespace

  void DbscanParams::validate() const {
    if (!(epsilon > 0.0f) || !std::isfinite(epsilon)) {
      throw std::invalid_argument(std::format("epsilon must be positive, got {}", epsilon));
    }
    if (min_points < 1) {
      throw std::invalid_argument(std::format("min_points must be at least 1, got {}", min_points));
    }
  }

  std::vector<ClassificationTag> dbscan(const EmbeddingMatrix& points, const DbscanParams& params) {
    RAILOG_ZONE;
    params.validate();

    const auto n = static_cast<size_t>(points.rows());
    RegionQuery region_query(points, params.epsilon);

    std::vector<int> label(n, UNASSIGNED);
    std::vector<bool> visited(n, false);
    std::vector<bool> core(n, false);
    int next_cluster = 0;

    for (size_t i = 0; i < n; ++i) {
      if (visited[i]) continue;
      visited[i] = true;

      auto neighbors = region_query(static_cast<Eigen::Index>(i));
      if (neighbors.size() < params.min_points) continue;

      const int cluster = next_cluster++;
      label[i] = cluster;
      core[i] = true;

      std::deque<Eigen::Index> frontier(neighbors.begin(), neighbors.end());
      while (!frontier.empty()) {
        auto j = static_cast<size_t>(frontier.front());
        frontier.pop_front();

        if (label[j] == UNASSIGNED) label[j] = cluster;
        if (visited[j]) continue;
        visited[j] = true;

        auto expansion = region_query(static_cast<Eigen::Index>(j));
        if (expansion.size() >= params.min_points) {
          core[j] = true;
          frontier.insert(frontier.end(), expansion.begin(), expansion.end());
        }
      }
    }

    std::vector<ClassificationTag> tags;
    tags.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      if (label[i] == UNASSIGNED) {
        tags.emplace_back(Noise{});
      } else if (core[i]) {
        tags.emplace_back(Core{static_cast<size_t>(label[i])});
      } else {
        tags.emplace_back(Edge{static_cast<size_t>(label[i])});
      }
    }
    return tags;
  }

  ClusteringResult reduce_clusters(const EmbeddingMatrix& points,
                                   std::span<const ClassificationTag> tags) {
    if (tags.size() != static_cast<size_t>(points.rows())) {
      throw std::invalid_argument(std::format("got {} tags for {} points", tags.size(), points.rows()));
    }

    ClusteringResult result;
    result.tags.assign(tags.begin(), tags.end());

    size_t n_ids = 0;
    for (const auto& tag : tags) {
      if (is_noise(tag)) {
        ++result.noise_points;
      } else {
        n_ids = std::max(n_ids, cluster_of(tag) + 1);
      }
    }

    const auto dim = points.cols();
    EmbeddingMatrix sums = EmbeddingMatrix::Zero(static_cast<Eigen::Index>(n_ids), dim);
    std::vector<size_t> counts(n_ids, 0);
    for (size_t i = 0; i < tags.size(); ++i) {
      if (is_noise(tags[i])) continue;
      auto id = cluster_of(tags[i]);
      sums.row(static_cast<Eigen::Index>(id)) += points.row(static_cast<Eigen::Index>(i));
      ++counts[id];
    }

    size_t n_clusters = 0;
    for (auto count : counts) n_clusters += count > 0 ? 1 : 0;

    result.centroids.resize(static_cast<Eigen::Index>(n_clusters), dim);
    result.cluster_sizes.reserve(n_clusters);
    Eigen::Index row = 0;
    for (size_t id = 0; id < n_ids; ++id) {
      if (counts[id] == 0) continue;
      result.centroids.row(row++)
          = sums.row(static_cast<Eigen::Index>(id)) / static_cast<float>(counts[id]);
      result.cluster_sizes.push_back(counts[id]);
    }
    return result;
  }

}  // namespace railog
