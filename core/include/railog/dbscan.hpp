#pragma once
#include <cstddef>
#include <railog/types.hpp>
#include <span>
#include <vector>

namespace railog {

  struct DbscanParams {
    float epsilon = 0.5f;   // neighborhood radius (Euclidean), > 0
    size_t min_points = 3;  // neighborhood size, self included, for a core point

    // Throws std::invalid_argument
    void validate() const;
  };

  struct ClusteringResult {
    EmbeddingMatrix centroids;  // row k is the mean of cluster k
    std::vector<size_t> cluster_sizes;
    size_t noise_points = 0;
    std::vector<ClassificationTag> tags;  // one per input point
  };

  // Classifies every row of `points`. A neighborhood holds the points strictly
  // closer than epsilon, the point itself included. Clusters are numbered in
  // the order their first core point appears; a border point reachable from
  // several clusters stays with the first one that reaches it.
  [[nodiscard]] std::vector<ClassificationTag> dbscan(const EmbeddingMatrix& points,
                                                      const DbscanParams& params);

  // Drops noise and reduces each cluster to the coordinate-wise mean of its
  // members. Clusters without members are skipped, keeping ascending id order.
  [[nodiscard]] ClusteringResult reduce_clusters(const EmbeddingMatrix& points,
                                                 std::span<const ClassificationTag> tags);

}  // namespace railog
