#pragma once
#include <cstddef>
#include <railog/types.hpp>
#include <span>
#include <usearch/index_plugins.hpp>
#include <utility>

namespace railog {

  /**
   * Nearest-centroid search over a CentroidSet.
   *
   * The engine does not own the centroids: it scans whatever matrix it is
   * handed, so in-place updates between calls are seen immediately. The scan
   * is linear; with OpenMP and more than PARALLEL_THRESHOLD rows it runs in
   * parallel, still returning the lowest index among equally distant rows.
   */
  class ClusterEngine {
  public:
    static constexpr int PARALLEL_THRESHOLD = 100;

    explicit ClusterEngine(size_t dim);

    ClusterEngine(ClusterEngine&&) = default;
    ClusterEngine& operator=(ClusterEngine&&) = default;
    ClusterEngine(const ClusterEngine&) = delete;
    ClusterEngine& operator=(const ClusterEngine&) = delete;

    // Returns (cluster_id, distance); (-1, +inf) when `centroids` is empty.
    // Throws ShapeError when the dimensions disagree.
    [[nodiscard]] std::pair<int, float> assign(const EmbeddingMatrix& centroids,
                                               std::span<const float> embedding) const;

    [[nodiscard]] std::pair<int, float> assign(const EmbeddingMatrix& centroids,
                                               const EmbeddingVector& embedding) const {
      return assign(centroids, std::span<const float>(embedding.data(), embedding.size()));
    }

    // Euclidean distance between two `dim()`-long vectors
    [[nodiscard]] float distance(const float* a, const float* b) const;

    [[nodiscard]] size_t dim() const noexcept { return dim_; }

  private:
    unum::usearch::metric_punned_t metric_;
    size_t dim_ = 0;
  };

  // Applies the match threshold to an assignment: strictly closer than
  // `threshold` is a match
  [[nodiscard]] MatchDecision decide(std::pair<int, float> assignment, float threshold) noexcept;

}  // namespace railog
