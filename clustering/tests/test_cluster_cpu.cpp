#include <gtest/gtest.h>

#include <cmath>
#include <initializer_list>
#include <limits>
#include <railog/cluster.hpp>
#include <railog/errors.hpp>
#include <random>
#include <variant>
#include <vector>

using namespace railog;

// =============================================================================
// SECTION 1: Nearest-Centroid Assignment
// =============================================================================

class ClusterEngineCpuTest : public ::testing::Test {
protected:
  ClusterEngine engine{4};

  static void fill_matrix(EmbeddingMatrix& m, std::initializer_list<float> values) {
    auto it = values.begin();
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
      for (Eigen::Index j = 0; j < m.cols(); ++j) {
        m(i, j) = (it != values.end()) ? *it++ : 0.0f;
      }
    }
  }

  static void random_matrix(EmbeddingMatrix& m, std::mt19937& gen) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
      for (Eigen::Index j = 0; j < m.cols(); ++j) {
        m(i, j) = dist(gen);
      }
    }
  }

  static EmbeddingMatrix unit_axes() {
    EmbeddingMatrix centers(3, 4);
    fill_matrix(centers,
                {1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f});
    return centers;
  }
};

TEST_F(ClusterEngineCpuTest, AssignToNearestCluster) {
  auto centers = unit_axes();
  std::vector<float> vec = {0.9f, 0.1f, 0.0f, 0.0f};
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 0);
  EXPECT_GT(distance, 0.0f);
}

TEST_F(ClusterEngineCpuTest, AssignToSecondCluster) {
  auto centers = unit_axes();
  std::vector<float> vec = {0.0f, 0.95f, 0.05f, 0.0f};
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 1);
  EXPECT_LT(distance, 0.1f);
}

TEST_F(ClusterEngineCpuTest, ExactMatchHasZeroDistance) {
  auto centers = unit_axes();
  std::vector<float> vec = {0.0f, 0.0f, 1.0f, 0.0f};
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 2);
  EXPECT_NEAR(distance, 0.0f, 1e-6f);
}

TEST_F(ClusterEngineCpuTest, DistanceIsEuclidean) {
  auto centers = unit_axes();
  std::vector<float> vec = {1.0f, 0.0f, 0.0f, 1.0f};
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 0);
  EXPECT_NEAR(distance, 1.0f, 1e-6f);

  std::vector<float> a = {3.0f, 0.0f, 0.0f, 0.0f};
  std::vector<float> b = {0.0f, 4.0f, 0.0f, 0.0f};
  EXPECT_NEAR(engine.distance(a.data(), b.data()), 5.0f, 1e-5f);
}

TEST_F(ClusterEngineCpuTest, EmptyCentroidSetReturnsNoCluster) {
  EmbeddingMatrix empty;
  std::vector<float> query(4, 1.0f);
  auto [cluster_id, distance] = engine.assign(empty, query);
  EXPECT_EQ(cluster_id, -1);
  EXPECT_TRUE(std::isinf(distance));
}

TEST_F(ClusterEngineCpuTest, TiesPickLowestIndex) {
  EmbeddingMatrix centers(3, 4);
  fill_matrix(centers,
              {0.0f, 1.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f});
  std::vector<float> vec = {1.0f, 0.0f, 0.0f, 0.0f};
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 1);
  EXPECT_NEAR(distance, 0.0f, 1e-6f);
}

TEST_F(ClusterEngineCpuTest, DimensionMismatchThrows) {
  auto centers = unit_axes();
  std::vector<float> short_vec = {1.0f, 0.0f};
  EXPECT_THROW((void)engine.assign(centers, short_vec), ShapeError);

  EmbeddingMatrix wide(2, 5);
  wide.setZero();
  std::vector<float> vec(4, 0.0f);
  EXPECT_THROW((void)engine.assign(wide, vec), ShapeError);
}

TEST_F(ClusterEngineCpuTest, ZeroDimensionRejected) {
  EXPECT_THROW(ClusterEngine{0}, std::invalid_argument);
}

TEST_F(ClusterEngineCpuTest, SeesInPlaceUpdates) {
  auto centers = unit_axes();
  std::vector<float> vec = {0.0f, 0.0f, 0.0f, 1.0f};
  EXPECT_EQ(engine.assign(centers, vec).first, 0);

  centers.row(2) << 0.0f, 0.0f, 0.0f, 1.0f;
  auto [cluster_id, distance] = engine.assign(centers, vec);
  EXPECT_EQ(cluster_id, 2);
  EXPECT_NEAR(distance, 0.0f, 1e-6f);
}

// =============================================================================
// SECTION 2: Large Sets (parallel scan above the threshold)
// =============================================================================

class ClusterEngineLargeTest : public ::testing::Test {
protected:
  static constexpr Eigen::Index N_CLUSTERS = 1000;
  static constexpr Eigen::Index DIM = 64;

  void SetUp() override {
    std::mt19937 gen(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    centers_.resize(N_CLUSTERS, DIM);
    for (Eigen::Index i = 0; i < N_CLUSTERS; ++i) {
      for (Eigen::Index j = 0; j < DIM; ++j) {
        centers_(i, j) = dist(gen);
      }
    }
  }

  // Reference scan: first index wins on ties
  std::pair<int, float> brute_force(const EmbeddingVector& q) const {
    int best = -1;
    float best_sq = std::numeric_limits<float>::infinity();
    for (Eigen::Index i = 0; i < centers_.rows(); ++i) {
      float d = (centers_.row(i).transpose() - q).squaredNorm();
      if (d < best_sq) {
        best_sq = d;
        best = static_cast<int>(i);
      }
    }
    return {best, std::sqrt(best_sq)};
  }

  EmbeddingMatrix centers_;
  ClusterEngine engine_{static_cast<size_t>(DIM)};
};

TEST_F(ClusterEngineLargeTest, MatchesBruteForce) {
  std::mt19937 gen(123);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

  for (int q = 0; q < 50; ++q) {
    EmbeddingVector query(DIM);
    for (Eigen::Index d = 0; d < DIM; ++d) {
      query(d) = dist(gen);
    }
    auto [cluster_id, distance] = engine_.assign(centers_, query);
    auto [expected_id, expected_distance] = brute_force(query);
    EXPECT_EQ(cluster_id, expected_id);
    EXPECT_NEAR(distance, expected_distance, 1e-4f);
  }
}

TEST_F(ClusterEngineLargeTest, DuplicateRowsResolveToFirst) {
  centers_.row(700) = centers_.row(300);
  centers_.row(900) = centers_.row(300);
  EmbeddingVector query = centers_.row(300).transpose();

  auto [cluster_id, distance] = engine_.assign(centers_, query);
  EXPECT_EQ(cluster_id, 300);
  EXPECT_NEAR(distance, 0.0f, 1e-5f);
}

TEST_F(ClusterEngineLargeTest, Deterministic) {
  EmbeddingVector query = EmbeddingVector::Constant(DIM, 0.1f);
  auto first = engine_.assign(centers_, query);
  auto second = engine_.assign(centers_, query);
  EXPECT_EQ(first.first, second.first);
  EXPECT_EQ(first.second, second.second);
}

// =============================================================================
// SECTION 3: Match Decision
// =============================================================================

TEST(DecideTest, BelowThresholdMatches) {
  auto decision = decide({2, 0.05f}, 0.5f);
  ASSERT_TRUE(std::holds_alternative<Matched>(decision));
  EXPECT_EQ(std::get<Matched>(decision).centroid, 2u);
  EXPECT_FLOAT_EQ(std::get<Matched>(decision).distance, 0.05f);
}

TEST(DecideTest, AtThresholdDoesNotMatch) {
  auto decision = decide({0, 0.5f}, 0.5f);
  ASSERT_TRUE(std::holds_alternative<Unmatched>(decision));
  EXPECT_FLOAT_EQ(std::get<Unmatched>(decision).distance, 0.5f);
}

TEST(DecideTest, NoClusterNeverMatches) {
  auto decision = decide({-1, std::numeric_limits<float>::infinity()}, 0.5f);
  EXPECT_TRUE(std::holds_alternative<Unmatched>(decision));
}
