#include <cstdint>
#include <cstring>
#include <format>
#include <limits>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <railog/centroid_store.hpp>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <railog/logging.hpp>
#include <railog/tracy.hpp>
#include <system_error>

using json = nlohmann::json;

namespace railog {

  namespace {

    void check_shape(int64_t rows, int64_t cols) {
      if (rows < 0 || cols < 0) {
        throw FormatError(std::format("centroid shape must be non-negative, got [{}, {}]", rows, cols));
      }
      if (rows > 0 && cols == 0) {
        throw FormatError(std::format("centroid dimension must be positive, got [{}, {}]", rows, cols));
      }
      auto total = static_cast<uint64_t>(rows) * static_cast<uint64_t>(cols);
      if (cols > 0 && total / static_cast<uint64_t>(cols) != static_cast<uint64_t>(rows)) {
        throw FormatError(std::format("centroid shape overflows: [{}, {}]", rows, cols));
      }
      if (total > static_cast<uint64_t>(std::numeric_limits<Eigen::Index>::max())
          || total > std::numeric_limits<size_t>::max() / sizeof(float)) {
        throw FormatError(std::format("centroid shape overflows: [{}, {}]", rows, cols));
      }
    }

    float element(const json& value, size_t row, size_t col) {
      if (!value.is_number()) {
        throw FormatError(std::format("centroid element [{}, {}] is not a number", row, col));
      }
      return value.get<float>();
    }

    // {"v": 1, "dim": [rows, cols], "data": [...]}
    EmbeddingMatrix parse_shaped(const json& j) {
      int version = j.value("v", CENTROID_FORMAT_VERSION);
      if (version != CENTROID_FORMAT_VERSION) {
        throw FormatError(std::format("unsupported centroid file version {}", version));
      }

      const auto& dim = j.at("dim");
      if (!dim.is_array() || dim.size() != 2) {
        throw FormatError("centroid 'dim' must be a [rows, cols] pair");
      }
      auto rows = dim[0].get<int64_t>();
      auto cols = dim[1].get<int64_t>();
      check_shape(rows, cols);

      const auto& data = j.at("data");
      auto expected = static_cast<size_t>(rows) * static_cast<size_t>(cols);
      if (!data.is_array() || data.size() != expected) {
        throw FormatError(std::format("centroid data has {} elements, shape [{}, {}] needs {}",
                                      data.is_array() ? data.size() : 0, rows, cols, expected));
      }

      EmbeddingMatrix centroids(rows, cols);
      auto n_cols = static_cast<size_t>(cols);
      for (size_t k = 0; k < expected; ++k) {
        centroids.data()[k] = element(data[k], k / n_cols, k % n_cols);
      }
      return centroids;
    }

    // [[...], [...]]
    EmbeddingMatrix parse_nested(const json& j) {
      if (j.empty()) return EmbeddingMatrix(0, 0);

      const auto n_rows = j.size();
      if (!j[0].is_array()) {
        throw FormatError("centroid row 0 is not an array");
      }
      const auto n_cols = j[0].size();
      check_shape(static_cast<int64_t>(n_rows), static_cast<int64_t>(n_cols));

      EmbeddingMatrix centroids(static_cast<Eigen::Index>(n_rows), static_cast<Eigen::Index>(n_cols));
      for (size_t i = 0; i < n_rows; ++i) {
        const auto& row = j[i];
        if (!row.is_array() || row.size() != n_cols) {
          throw FormatError(std::format("ragged centroid row {}: expected {} values, got {}", i,
                                        n_cols, row.is_array() ? row.size() : 0));
        }
        for (size_t col = 0; col < n_cols; ++col) {
          centroids(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(col))
              = element(row[col], i, col);
        }
      }
      return centroids;
    }

  }  // namespace

  CentroidFormat format_for_path(const std::filesystem::path& path) {
    return path.extension() == ".msgpack" ? CentroidFormat::Msgpack : CentroidFormat::Json;
  }

  CentroidStore::CentroidStore(std::filesystem::path path)
      : path_(std::move(path)), format_(format_for_path(path_)) {}

  // ============================================================================
  // File I/O
  // ============================================================================

  EmbeddingMatrix CentroidStore::load() const {
    RAILOG_ZONE;
    auto contents = read_file(path_);
    try {
      auto centroids = format_ == CentroidFormat::Msgpack ? from_msgpack_string(contents)
                                                          : from_json_string(contents);
      log_debug("Loaded {} centroids of dimension {} from {}", centroids.rows(), centroids.cols(),
                path_.string());
      return centroids;
    } catch (const FormatError& e) {
      throw FormatError(std::format("Malformed centroids file {}: {}", path_.string(), e.what()));
    }
  }

  void CentroidStore::save(const EmbeddingMatrix& centroids) const {
    RAILOG_ZONE;
    auto contents = format_ == CentroidFormat::Msgpack ? to_msgpack_string(centroids)
                                                       : to_json_string(centroids);
    write_file_atomic(path_, contents);
    log_debug("Saved {} centroids to {}", centroids.rows(), path_.string());
  }

  TimePoint CentroidStore::last_modified() const {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path_, ec);
    if (ec) {
      throw IoError(
          std::format("Failed to stat centroids file {}: {}", path_.string(), ec.message()));
    }
    return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(ftime));
  }

  // ============================================================================
  // JSON
  // ============================================================================

  EmbeddingMatrix CentroidStore::from_json_string(const std::string& json_str) {
    try {
      json j = json::parse(json_str);
      if (j.is_array()) return parse_nested(j);
      if (j.is_object()) return parse_shaped(j);
      throw FormatError("centroid file must hold an object or an array");
    } catch (const json::exception& e) {
      throw FormatError(e.what());
    }
  }

  std::string CentroidStore::to_json_string(const EmbeddingMatrix& centroids) {
    json data = json::array();
    for (Eigen::Index k = 0; k < centroids.size(); ++k) {
      data.push_back(centroids.data()[k]);
    }

    json j;
    j["v"] = CENTROID_FORMAT_VERSION;
    j["dim"] = {centroids.rows(), centroids.cols()};
    j["data"] = std::move(data);
    return j.dump();
  }

  // ============================================================================
  // MessagePack
  // ============================================================================

  EmbeddingMatrix CentroidStore::from_msgpack_string(const std::string& data) {
    try {
      msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
      auto map = handle.get().as<std::map<std::string, msgpack::object>>();

      int version = map.contains("v") ? map.at("v").as<int>() : CENTROID_FORMAT_VERSION;
      if (version != CENTROID_FORMAT_VERSION) {
        throw FormatError(std::format("unsupported centroid file version {}", version));
      }

      auto rows = map.at("rows").as<int64_t>();
      auto cols = map.at("cols").as<int64_t>();
      check_shape(rows, cols);
      std::string bytes = map.at("data").as<std::string>();

      size_t expected_size = static_cast<size_t>(rows) * static_cast<size_t>(cols) * sizeof(float);
      if (bytes.size() != expected_size) {
        throw FormatError(std::format("centroid data size mismatch: expected {} bytes, got {}",
                                      expected_size, bytes.size()));
      }

      EmbeddingMatrix centroids(rows, cols);
      if (expected_size > 0) std::memcpy(centroids.data(), bytes.data(), expected_size);
      return centroids;
    } catch (const msgpack::type_error& e) {
      throw FormatError(std::format("unexpected msgpack type: {}", e.what()));
    } catch (const msgpack::unpack_error& e) {
      throw FormatError(std::format("invalid msgpack data: {}", e.what()));
    } catch (const std::out_of_range& e) {
      throw FormatError(std::format("missing msgpack field: {}", e.what()));
    }
  }

  std::string CentroidStore::to_msgpack_string(const EmbeddingMatrix& centroids) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(4);
    pk.pack("v");
    pk.pack(CENTROID_FORMAT_VERSION);
    pk.pack("rows");
    pk.pack(static_cast<int64_t>(centroids.rows()));
    pk.pack("cols");
    pk.pack(static_cast<int64_t>(centroids.cols()));
    pk.pack("data");
    auto data_size = static_cast<size_t>(centroids.size()) * sizeof(float);
    pk.pack_bin(static_cast<uint32_t>(data_size));
    pk.pack_bin_body(reinterpret_cast<const char*>(centroids.data()),
                     static_cast<uint32_t>(data_size));

    return std::string(buffer.data(), buffer.size());
  }

}  // namespace railog
