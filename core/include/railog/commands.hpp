#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <railog/batching.hpp>
#include <railog/dbscan.hpp>
#include <railog/embedder.hpp>
#include <railog/ingest.hpp>
#include <railog/preprocessor.hpp>
#include <string>

namespace railog {

  // ============================================================================
  // train
  // ============================================================================

  struct TrainOptions {
    std::string input_file = "example.txt";
    std::string output_file = "centroids.json";
    DbscanParams params;
    size_t batch_size = DEFAULT_BATCH_SIZE;
    bool verbose = false;
  };

  struct TrainSummary {
    size_t messages = 0;
    size_t clusters = 0;
    size_t noise_points = 0;
  };

  // Embeds the corpus, clusters it and writes the centroid file. Empty when the
  // input has no lines, in which case nothing is written.
  std::optional<TrainSummary> train(const TrainOptions& options, const Preprocessor& preprocessor,
                                    IEmbedder& embedder, std::ostream& out);

  // ============================================================================
  // ingest
  // ============================================================================

  struct IngestOptions {
    std::string input_file = "new_logs.txt";
    std::string centroids_file = "centroids.json";
    std::string unmatched_file = "unmatched.log";
    IngestParams params;
  };

  // Streams the input through an Ingestor. The centroid file's modification
  // time is the cutoff; the file is rewritten once, after the last line.
  IngestSummary ingest(const IngestOptions& options, const Preprocessor& preprocessor,
                       IEmbedder& embedder, std::ostream& out);

  // ============================================================================
  // retrain
  // ============================================================================

  struct RetrainOptions {
    std::string input_file = "unmatched.log";
    std::string centroids_file = "centroids.json";
    size_t batch_size = DEFAULT_BATCH_SIZE;
    bool verbose = false;
  };

  struct RetrainSummary {
    size_t added = 0;
    size_t total = 0;
  };

  // Appends every backlog line as a new centroid. An empty backlog leaves the
  // centroid file untouched.
  RetrainSummary retrain(const RetrainOptions& options, const Preprocessor& preprocessor,
                         IEmbedder& embedder, std::ostream& out);

  // ============================================================================
  // test-patterns
  // ============================================================================

  // Prints each line of `input_file` before and after normalization; returns
  // the number of lines
  size_t test_patterns(const std::string& input_file, const Preprocessor& preprocessor,
                       std::ostream& out);

}  // namespace railog
