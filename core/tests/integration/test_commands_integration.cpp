#include <gtest/gtest.h>

#include <filesystem>
#include <railog/centroid_store.hpp>
#include <railog/commands.hpp>
#include <railog/errors.hpp>
#include <sstream>

#include "../test_utils.hpp"

using namespace railog;

namespace fs = std::filesystem;

class CommandsIntegrationTest : public ::testing::Test {
protected:
  static fs::path get_test_data_dir() {
    return fs::path(__FILE__).parent_path().parent_path() / "fixtures";
  }

  void SetUp() override {
    embedder.set("worker <NUM> started", {1.0f, 0.05f});
    embedder.set("kernel panic", {-1.0f, 0.0f});
    embedder.set("disk <NUM> failed", {0.6f, 0.8f});
    embedder.set("fan <NUM> stopped", {0.0f, -1.0f});
  }

  void write_centroids(const fs::path& path) const {
    EmbeddingMatrix centroids(2, 2);
    centroids << 1.0f, 0.0f,
                 0.0f, 1.0f;
    CentroidStore(path).save(centroids);
  }

  test::TempDir dir;
  Preprocessor preprocessor = Preprocessor::from_rules({{R"(\d+)", "<NUM>"}});
  test::StubEmbedder embedder{2};
  std::ostringstream out;
};

// =============================================================================
// train
// =============================================================================

TEST_F(CommandsIntegrationTest, TrainWritesCentroids) {
  test::write_text(dir / "example.txt",
                   "worker 1 started\nworker 2 started\nworker 3 started\n"
                   "worker 4 started\nworker 5 started\nkernel panic\n");

  TrainOptions options;
  options.input_file = (dir / "example.txt").string();
  options.output_file = (dir / "centroids.json").string();
  options.params = {0.5f, 2};

  auto summary = train(options, preprocessor, embedder, out);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->messages, 6u);
  EXPECT_EQ(summary->clusters, 1u);
  EXPECT_EQ(summary->noise_points, 1u);

  auto centroids = CentroidStore(options.output_file).load();
  ASSERT_EQ(centroids.rows(), 1);
  EXPECT_NEAR(centroids(0, 0), 1.0f, 1e-6f);
  EXPECT_NEAR(centroids(0, 1), 0.05f, 1e-6f);

  EXPECT_NE(out.str().find("DBSCAN found 1 clusters and 1 noise points."), std::string::npos)
      << out.str();
  EXPECT_NE(out.str().find("Successfully saved 1 centroids to"), std::string::npos);
}

TEST_F(CommandsIntegrationTest, TrainVerbosePrintsAssignments) {
  test::write_text(dir / "example.txt", "worker 1 started\nworker 2 started\nkernel panic\n");

  TrainOptions options;
  options.input_file = (dir / "example.txt").string();
  options.output_file = (dir / "centroids.json").string();
  options.params = {0.5f, 2};
  options.verbose = true;

  ASSERT_TRUE(train(options, preprocessor, embedder, out).has_value());
  EXPECT_NE(out.str().find("'worker 1 started' -> Cluster 0"), std::string::npos) << out.str();
  EXPECT_NE(out.str().find("'kernel panic' -> Noise"), std::string::npos) << out.str();
}

TEST_F(CommandsIntegrationTest, TrainOnEmptyInputWritesNothing) {
  test::write_text(dir / "example.txt", "");

  TrainOptions options;
  options.input_file = (dir / "example.txt").string();
  options.output_file = (dir / "centroids.json").string();

  EXPECT_FALSE(train(options, preprocessor, embedder, out).has_value());
  EXPECT_FALSE(fs::exists(options.output_file));
  EXPECT_NE(out.str().find("No log messages found in input file."), std::string::npos);
}

TEST_F(CommandsIntegrationTest, TrainWithoutClustersFailsWithoutWriting) {
  test::write_text(dir / "example.txt", "worker 1 started\nkernel panic\ndisk 2 failed\n");

  TrainOptions options;
  options.input_file = (dir / "example.txt").string();
  options.output_file = (dir / "centroids.json").string();
  options.params = {0.1f, 2};

  EXPECT_THROW((void)train(options, preprocessor, embedder, out), NoClustersFoundError);
  EXPECT_FALSE(fs::exists(options.output_file));
}

TEST_F(CommandsIntegrationTest, TrainMissingInputThrowsIoError) {
  TrainOptions options;
  options.input_file = (dir / "absent.txt").string();
  options.output_file = (dir / "centroids.json").string();
  EXPECT_THROW((void)train(options, preprocessor, embedder, out), IoError);
}

// =============================================================================
// ingest
// =============================================================================

TEST_F(CommandsIntegrationTest, IngestMatchesUpdatesAndAppends) {
  auto centroids_path = dir / "centroids.json";
  auto unmatched_path = dir / "unmatched.log";
  write_centroids(centroids_path);
  test::write_text(unmatched_path, "earlier backlog\n");
  test::write_text(dir / "new_logs.txt",
                   "worker 7 started\n"
                   "disk 3 failed\n"
                   "disk 4 failed\n"
                   "Jan  1 00:00:01 host worker 9 started\n");

  IngestOptions options;
  options.input_file = (dir / "new_logs.txt").string();
  options.centroids_file = centroids_path.string();
  options.unmatched_file = unmatched_path.string();
  options.params = {0.5f, 0.1f};

  auto summary = ingest(options, preprocessor, embedder, out);
  EXPECT_EQ(summary.total, 2u);
  EXPECT_EQ(summary.matched, 1u);
  EXPECT_EQ(summary.unmatched(), 1u);

  auto centroids = CentroidStore(centroids_path).load();
  ASSERT_EQ(centroids.rows(), 2);
  EXPECT_NEAR(centroids(0, 0), 1.0f, 1e-6f);
  EXPECT_NEAR(centroids(0, 1), 0.005f, 1e-6f);
  EXPECT_NEAR(centroids(1, 1), 1.0f, 1e-6f);

  EXPECT_EQ(test::read_lines(unmatched_path),
            (std::vector<std::string>{"earlier backlog", "disk <NUM> failed"}));
  EXPECT_NE(out.str().find("Ingestion complete."), std::string::npos);
  EXPECT_NE(out.str().find("1 messages matched and updated centroids."), std::string::npos);
  EXPECT_NE(out.str().find("Centroids file updated."), std::string::npos);
}

TEST_F(CommandsIntegrationTest, IngestFailureLeavesCentroidFileUntouched) {
  auto centroids_path = dir / "centroids.json";
  write_centroids(centroids_path);
  auto before = test::read_text(centroids_path);

  embedder.fail_on("fan <NUM> stopped");
  test::write_text(dir / "new_logs.txt", "worker 7 started\nworker 8 started x\nfan 1 stopped\n");
  embedder.set("worker <NUM> started x", {1.0f, 0.1f});

  IngestOptions options;
  options.input_file = (dir / "new_logs.txt").string();
  options.centroids_file = centroids_path.string();
  options.unmatched_file = (dir / "unmatched.log").string();

  EXPECT_THROW((void)ingest(options, preprocessor, embedder, out), EmbedderError);
  EXPECT_EQ(test::read_text(centroids_path), before);
  EXPECT_FALSE(fs::exists(dir / "centroids.json.tmp"));
}

TEST_F(CommandsIntegrationTest, IngestMissingCentroidsThrowsIoError) {
  test::write_text(dir / "new_logs.txt", "worker 7 started\n");

  IngestOptions options;
  options.input_file = (dir / "new_logs.txt").string();
  options.centroids_file = (dir / "absent.json").string();
  options.unmatched_file = (dir / "unmatched.log").string();

  EXPECT_THROW((void)ingest(options, preprocessor, embedder, out), IoError);
  EXPECT_FALSE(fs::exists(options.unmatched_file));
}

TEST_F(CommandsIntegrationTest, IngestMsgpackCentroids) {
  auto centroids_path = dir / "centroids.msgpack";
  write_centroids(centroids_path);
  test::write_text(dir / "new_logs.txt", "worker 7 started\n");

  IngestOptions options;
  options.input_file = (dir / "new_logs.txt").string();
  options.centroids_file = centroids_path.string();
  options.unmatched_file = (dir / "unmatched.log").string();

  auto summary = ingest(options, preprocessor, embedder, out);
  EXPECT_EQ(summary.matched, 1u);
  EXPECT_NEAR(CentroidStore(centroids_path).load()(0, 1), 0.005f, 1e-6f);
}

// =============================================================================
// retrain
// =============================================================================

TEST_F(CommandsIntegrationTest, RetrainAppendsBacklog) {
  auto centroids_path = dir / "centroids.json";
  write_centroids(centroids_path);
  test::write_text(dir / "unmatched.log", "disk 3 failed\nfan 2 stopped\n");

  RetrainOptions options;
  options.input_file = (dir / "unmatched.log").string();
  options.centroids_file = centroids_path.string();

  auto summary = retrain(options, preprocessor, embedder, out);
  EXPECT_EQ(summary.added, 2u);
  EXPECT_EQ(summary.total, 4u);

  auto centroids = CentroidStore(centroids_path).load();
  ASSERT_EQ(centroids.rows(), 4);
  EXPECT_NEAR(centroids(2, 0), 0.6f, 1e-6f);
  EXPECT_NEAR(centroids(3, 1), -1.0f, 1e-6f);
  EXPECT_NE(out.str().find("Successfully added 2 new centroids. Total centroids: 4"),
            std::string::npos)
      << out.str();
}

TEST_F(CommandsIntegrationTest, RetrainEmptyBacklogLeavesFileIdentical) {
  auto centroids_path = dir / "centroids.json";
  write_centroids(centroids_path);
  auto before = test::read_text(centroids_path);
  auto mtime = fs::last_write_time(centroids_path);
  test::write_text(dir / "unmatched.log", "");

  RetrainOptions options;
  options.input_file = (dir / "unmatched.log").string();
  options.centroids_file = centroids_path.string();

  auto summary = retrain(options, preprocessor, embedder, out);
  EXPECT_EQ(summary.added, 0u);
  EXPECT_EQ(summary.total, 2u);
  EXPECT_EQ(test::read_text(centroids_path), before);
  EXPECT_EQ(fs::last_write_time(centroids_path), mtime);
  EXPECT_NE(out.str().find("Input file is empty. No new centroids to add."), std::string::npos);
}

// =============================================================================
// Full cycle
// =============================================================================

TEST_F(CommandsIntegrationTest, TrainIngestRetrainCycle) {
  auto centroids_path = dir / "centroids.json";
  auto unmatched_path = dir / "unmatched.log";
  test::write_text(dir / "example.txt", "worker 1 started\nworker 2 started\nworker 3 started\n");
  test::write_text(dir / "new_logs.txt", "worker 4 started\nfan 9 stopped\n");

  TrainOptions train_options;
  train_options.input_file = (dir / "example.txt").string();
  train_options.output_file = centroids_path.string();
  ASSERT_TRUE(train(train_options, preprocessor, embedder, out).has_value());

  IngestOptions ingest_options;
  ingest_options.input_file = (dir / "new_logs.txt").string();
  ingest_options.centroids_file = centroids_path.string();
  ingest_options.unmatched_file = unmatched_path.string();
  auto ingested = ingest(ingest_options, preprocessor, embedder, out);
  EXPECT_EQ(ingested.matched, 1u);
  EXPECT_EQ(ingested.unmatched(), 1u);

  RetrainOptions retrain_options;
  retrain_options.input_file = unmatched_path.string();
  retrain_options.centroids_file = centroids_path.string();
  auto retrained = retrain(retrain_options, preprocessor, embedder, out);
  EXPECT_EQ(retrained.total, 2u);

  // The formerly unknown message now matches its own centroid
  std::ostringstream second_out;
  test::write_text(dir / "later_logs.txt", "fan 10 stopped\n");
  ingest_options.input_file = (dir / "later_logs.txt").string();
  auto again = ingest(ingest_options, preprocessor, embedder, second_out);
  EXPECT_EQ(again.matched, 1u);
  EXPECT_EQ(again.unmatched(), 0u);
}

// =============================================================================
// test-patterns
// =============================================================================

TEST_F(CommandsIntegrationTest, TestPatternsShowsBothForms) {
  auto rules = Preprocessor::from_file((get_test_data_dir() / "patterns.txt").string());
  test::write_text(dir / "new_logs.txt", "sshd[12345]: msg\nplain line\n");

  auto count = test_patterns((dir / "new_logs.txt").string(), rules, out);
  EXPECT_EQ(count, 2u);
  EXPECT_NE(out.str().find("Original:  'sshd[12345]: msg'\nProcessed: 'sshd[<PID>]: msg'\n\n"),
            std::string::npos)
      << out.str();
  EXPECT_NE(out.str().find("Processed: 'plain line'"), std::string::npos);
}
