#include <benchmark/benchmark.h>

#include <railog/cluster.hpp>
#include <railog/ingest.hpp>
#include <random>
#include <string>
#include <vector>

using namespace railog;

namespace {

EmbeddingMatrix random_centroids(int n_clusters, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  EmbeddingMatrix centroids(n_clusters, dim);
  for (Eigen::Index k = 0; k < centroids.size(); ++k) {
    centroids.data()[k] = dist(rng);
  }
  return centroids;
}

EmbeddingVector generate_embedding(int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  EmbeddingVector emb(dim);
  for (Eigen::Index i = 0; i < emb.size(); ++i) {
    emb(i) = dist(rng);
  }
  return emb;
}

}  // namespace

static void BM_ClusterAssign_CPU(benchmark::State& state) {
  const int n_clusters = state.range(0);
  const int dim = state.range(1);

  ClusterEngine engine(static_cast<size_t>(dim));
  auto centroids = random_centroids(n_clusters, dim);
  auto query = generate_embedding(dim, 7);

  for (auto _ : state) {
    auto [cluster_id, distance] = engine.assign(centroids, query);
    benchmark::DoNotOptimize(cluster_id);
    benchmark::DoNotOptimize(distance);
  }

  state.SetLabel(std::to_string(n_clusters) + "c/" + std::to_string(dim) + "d");
}

static void BM_CentroidUpdate(benchmark::State& state) {
  const int n_clusters = state.range(0);
  const int dim = state.range(1);

  auto centroids = random_centroids(n_clusters, dim);
  auto embedding = generate_embedding(dim, 7);
  size_t row = 0;

  for (auto _ : state) {
    update_centroid(centroids, row, embedding, 0.1f);
    row = (row + 1) % static_cast<size_t>(n_clusters);
    benchmark::ClobberMemory();
  }

  state.SetLabel(std::to_string(n_clusters) + "c/" + std::to_string(dim) + "d");
}

static void CPUSingleArgs(benchmark::internal::Benchmark* b) {
  for (int clusters : {10, 50, 100, 500, 1000, 5000}) {
    for (int dim : {128, 384, 768}) {
      b->Args({clusters, dim});
    }
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_ClusterAssign_CPU)->Apply(CPUSingleArgs);
BENCHMARK(BM_CentroidUpdate)->Args({100, 384})->Args({1000, 384})->Unit(benchmark::kNanosecond);
