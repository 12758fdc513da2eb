#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <variant>

namespace railog {

  // Row-major so that each centroid is contiguous (persistence, distance kernels)
  using EmbeddingMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
  using EmbeddingVector = Eigen::VectorXf;

  template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

  // =============================================================================
  // DBSCAN point classification
  // =============================================================================

  struct Noise {
    bool operator==(const Noise&) const = default;
  };

  struct Core {
    std::size_t cluster;
    bool operator==(const Core&) const = default;
  };

  struct Edge {
    std::size_t cluster;
    bool operator==(const Edge&) const = default;
  };

  using ClassificationTag = std::variant<Noise, Core, Edge>;

  [[nodiscard]] inline bool is_noise(const ClassificationTag& tag) noexcept {
    return std::holds_alternative<Noise>(tag);
  }

  // Cluster index of a Core/Edge tag. Must not be called on Noise.
  [[nodiscard]] inline std::size_t cluster_of(const ClassificationTag& tag) {
    return std::visit(overloaded{[](const Core& c) { return c.cluster; },
                                 [](const Edge& e) { return e.cluster; },
                                 [](const Noise&) -> std::size_t {
                                   throw std::bad_variant_access();
                                 }},
                      tag);
  }

  // =============================================================================
  // Nearest-centroid outcome
  // =============================================================================

  struct Matched {
    std::size_t centroid;
    float distance;
  };

  struct Unmatched {
    float distance;
  };

  using MatchDecision = std::variant<Matched, Unmatched>;

}  // namespace railog
