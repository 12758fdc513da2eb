#include <benchmark/benchmark.h>

#include <railog/dbscan.hpp>
#include <railog/embedder.hpp>
#include <random>
#include <string>
#include <vector>

using namespace railog;

namespace {

// `n_points` unit vectors scattered around `n_groups` random unit directions
EmbeddingMatrix grouped_corpus(int n_points, int n_groups, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::normal_distribution<float> axis(0.0f, 1.0f);
  std::normal_distribution<float> jitter(0.0f, 0.01f);

  EmbeddingMatrix centers(n_groups, dim);
  for (Eigen::Index k = 0; k < centers.size(); ++k) centers.data()[k] = axis(rng);
  centers.rowwise().normalize();

  EmbeddingMatrix points(n_points, dim);
  for (int i = 0; i < n_points; ++i) {
    points.row(i) = centers.row(i % n_groups);
    for (int j = 0; j < dim; ++j) points(i, j) += jitter(rng);
  }
  points.rowwise().normalize();
  return points;
}

}  // namespace

static void BM_Dbscan(benchmark::State& state) {
  const int n_points = state.range(0);
  const int dim = state.range(1);
  auto points = grouped_corpus(n_points, 16, dim);
  DbscanParams params{0.5f, 3};

  for (auto _ : state) {
    auto result = reduce_clusters(points, dbscan(points, params));
    benchmark::DoNotOptimize(result.centroids.data());
  }

  state.SetItemsProcessed(state.iterations() * n_points);
  state.SetLabel(std::to_string(n_points) + "n/" + std::to_string(dim) + "d");
}

static void BM_HashingEmbedBatch(benchmark::State& state) {
  const auto batch_size = static_cast<size_t>(state.range(0));
  HashingEmbedder embedder;

  std::vector<std::string> batch;
  batch.reserve(batch_size);
  for (size_t i = 0; i < batch_size; ++i) {
    batch.push_back("sshd[<PID>]: Accepted publickey for user" + std::to_string(i % 37)
                    + " from <IP> port <NUM> ssh2");
  }

  for (auto _ : state) {
    auto out = embedder.embed(batch);
    benchmark::DoNotOptimize(out.data());
  }

  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(batch_size));
}

BENCHMARK(BM_Dbscan)
    ->Args({256, 384})
    ->Args({1024, 384})
    ->Args({4096, 384})
    ->Unit(benchmark::kMillisecond);
BENCHMARK(BM_HashingEmbedBatch)->Arg(64)->Arg(1024)->Unit(benchmark::kMicrosecond);
