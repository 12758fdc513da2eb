#pragma once
#include <cstddef>
#include <railog/batching.hpp>
#include <railog/dbscan.hpp>
#include <railog/embedder.hpp>
#include <railog/ingest.hpp>
#include <string>

namespace railog {

  inline constexpr const char* DEFAULT_PATTERNS_FILE = "patterns.txt";

  struct EmbeddingConfig {
    std::string model = "hashing";
    size_t dim = HashingEmbedder::DEFAULT_DIM;
  };

  struct BatchingConfig {
    size_t batch_size = DEFAULT_BATCH_SIZE;
  };

  // Tool-wide settings. Every key of the JSON file is optional; command-line
  // flags are applied on top by the CLI.
  struct RailogConfig {
    std::string patterns_file = DEFAULT_PATTERNS_FILE;
    EmbeddingConfig embedding;
    BatchingConfig batching;
    DbscanParams training;
    IngestParams ingest;

    [[nodiscard]] static RailogConfig from_json(const std::string& path);
    [[nodiscard]] static RailogConfig from_json_string(const std::string& json_str);
    [[nodiscard]] std::string to_json_string() const;

    // Throws std::invalid_argument on the first bad value
    void validate() const;
  };

}  // namespace railog
