#include <cmath>
#include <format>
#include <limits>
#include <railog/cluster.hpp>
#include <railog/errors.hpp>
#include <stdexcept>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace railog {

  namespace {

    struct MinDistanceResult {
      float dist_sq;
      int idx;
    };

    // Keeps the lower index on equal distances so the parallel scan agrees
    // with the sequential one
    inline MinDistanceResult closer(const MinDistanceResult& a, const MinDistanceResult& b) {
      if (a.dist_sq < b.dist_sq) return a;
      if (b.dist_sq < a.dist_sq) return b;
      return (a.idx >= 0 && (b.idx < 0 || a.idx < b.idx)) ? a : b;
    }

#ifdef _OPENMP
#  ifndef _MSC_VER
#    pragma omp declare reduction(first_min:MinDistanceResult : omp_out = closer(omp_in, omp_out)) \
        initializer(omp_priv = {std::numeric_limits<float>::infinity(), -1})
#  endif
#endif

  }  // namespace

  ClusterEngine::ClusterEngine(size_t dim) : dim_(dim) {
    if (dim == 0) [[unlikely]] {
      throw std::invalid_argument("dim must be positive");
    }
    using namespace unum::usearch;
    metric_ = metric_punned_t(dim, metric_kind_t::l2sq_k, scalar_kind_t::f32_k);
  }

  float ClusterEngine::distance(const float* a, const float* b) const {
    const auto* a_bytes = reinterpret_cast<const unum::usearch::byte_t*>(a);
    const auto* b_bytes = reinterpret_cast<const unum::usearch::byte_t*>(b);
    return std::sqrt(static_cast<float>(metric_(a_bytes, b_bytes)));
  }

  std::pair<int, float> ClusterEngine::assign(const EmbeddingMatrix& centroids,
                                              std::span<const float> embedding) const {
    if (embedding.size() != dim_) [[unlikely]] {
      throw ShapeError(std::format("embedding has dimension {}, expected {}", embedding.size(), dim_));
    }
    const auto n_clusters = static_cast<int>(centroids.rows());
    if (n_clusters == 0) return {-1, std::numeric_limits<float>::infinity()};
    if (static_cast<size_t>(centroids.cols()) != dim_) [[unlikely]] {
      throw ShapeError(std::format("centroids have dimension {}, expected {}", centroids.cols(), dim_));
    }

    const auto* emb_bytes = reinterpret_cast<const unum::usearch::byte_t*>(embedding.data());
    const float* base = centroids.data();
    const auto stride = static_cast<size_t>(centroids.cols());

    auto dist_sq_to = [&](int i) {
      const auto* centroid_bytes = reinterpret_cast<const unum::usearch::byte_t*>(
          base + static_cast<size_t>(i) * stride);
      return static_cast<float>(metric_(emb_bytes, centroid_bytes));
    };

    MinDistanceResult result{std::numeric_limits<float>::infinity(), -1};

#if defined(_OPENMP) && !defined(_MSC_VER)
    if (n_clusters > PARALLEL_THRESHOLD) {
#  pragma omp parallel for schedule(static) reduction(first_min : result)
      for (int i = 0; i < n_clusters; ++i) {
        result = closer(result, MinDistanceResult{dist_sq_to(i), i});
      }
    } else {
      for (int i = 0; i < n_clusters; ++i) {
        result = closer(result, MinDistanceResult{dist_sq_to(i), i});
      }
    }
#else
    for (int i = 0; i < n_clusters; ++i) {
      result = closer(result, MinDistanceResult{dist_sq_to(i), i});
    }
#endif

    return {result.idx, std::sqrt(result.dist_sq)};
  }

  MatchDecision decide(std::pair<int, float> assignment, float threshold) noexcept {
    auto [cluster_id, distance] = assignment;
    if (cluster_id >= 0 && distance < threshold) {
      return Matched{static_cast<size_t>(cluster_id), distance};
    }
    return Unmatched{distance};
  }

}  // namespace railog
