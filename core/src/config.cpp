#include <cstdint>
#include <format>
#include <nlohmann/json.hpp>
#include <railog/config.hpp>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace railog {

  namespace {

    size_t positive_count(const json& j, const char* key, size_t fallback) {
      if (!j.contains(key)) return fallback;
      auto value = j.at(key).get<int64_t>();
      if (value <= 0) {
        throw std::invalid_argument(std::format("{} must be positive, got {}", key, value));
      }
      return static_cast<size_t>(value);
    }

  }  // namespace

  // ============================================================================
  // JSON Serialization
  // ============================================================================

  void to_json(json& j, const EmbeddingConfig& c) { j = {{"model", c.model}, {"dim", c.dim}}; }

  void from_json(const json& j, EmbeddingConfig& c) {
    c.model = j.value("model", "hashing");
    c.dim = positive_count(j, "dim", HashingEmbedder::DEFAULT_DIM);
  }

  void to_json(json& j, const BatchingConfig& c) { j = {{"batch_size", c.batch_size}}; }

  void from_json(const json& j, BatchingConfig& c) {
    c.batch_size = positive_count(j, "batch_size", DEFAULT_BATCH_SIZE);
  }

  void to_json(json& j, const DbscanParams& p) {
    j = {{"epsilon", p.epsilon}, {"min_points", p.min_points}};
  }

  void from_json(const json& j, DbscanParams& p) {
    p.epsilon = j.value("epsilon", 0.5f);
    p.min_points = positive_count(j, "min_points", 3);
  }

  void to_json(json& j, const IngestParams& p) {
    j = {{"threshold", p.threshold}, {"learning_rate", p.learning_rate}};
  }

  void from_json(const json& j, IngestParams& p) {
    p.threshold = j.value("threshold", 0.5f);
    p.learning_rate = j.value("learning_rate", 0.1f);
  }

  // ============================================================================
  // File I/O
  // ============================================================================

  RailogConfig RailogConfig::from_json(const std::string& path) {
    return from_json_string(read_file(path));
  }

  RailogConfig RailogConfig::from_json_string(const std::string& json_str) {
    json j = json::parse(json_str);

    RailogConfig config;
    config.patterns_file = j.value("patterns_file", DEFAULT_PATTERNS_FILE);
    if (j.contains("embedding")) j.at("embedding").get_to(config.embedding);
    if (j.contains("batching")) j.at("batching").get_to(config.batching);
    if (j.contains("training")) j.at("training").get_to(config.training);
    if (j.contains("ingest")) j.at("ingest").get_to(config.ingest);
    return config;
  }

  std::string RailogConfig::to_json_string() const {
    json j;
    j["patterns_file"] = patterns_file;
    j["embedding"] = embedding;
    j["batching"] = batching;
    j["training"] = training;
    j["ingest"] = ingest;
    return j.dump(2);
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void RailogConfig::validate() const {
    if (embedding.model != "hashing") {
      throw std::invalid_argument(
          std::format("embedding model must be 'hashing', got '{}'", embedding.model));
    }
    if (embedding.dim == 0) {
      throw std::invalid_argument("embedding dim must be positive");
    }
    if (batching.batch_size == 0) {
      throw std::invalid_argument("batch_size must be positive");
    }
    training.validate();
    ingest.validate();
  }

}  // namespace railog
