#pragma once
#include <filesystem>
#include <railog/timestamp.hpp>
#include <railog/types.hpp>
#include <string>

namespace railog {

  // Version written into the "v" field of centroid files
  inline constexpr int CENTROID_FORMAT_VERSION = 1;

  enum class CentroidFormat { Json, Msgpack };

  // `.msgpack` selects MessagePack, anything else JSON
  [[nodiscard]] CentroidFormat format_for_path(const std::filesystem::path& path);

  /**
   * Persistent CentroidSet backed by a single file.
   *
   * JSON layout: {"v": 1, "dim": [rows, cols], "data": [row-major floats]}.
   * A plain nested array [[...], ...] is accepted on load. MessagePack layout:
   * {"v", "rows", "cols", "data": bin(row-major float32)}.
   *
   * Loading throws IoError (unreadable) or FormatError (malformed, shape
   * inconsistent). Saving is atomic: a temporary file is renamed over the
   * target, so readers never observe a partial write.
   */
  class CentroidStore {
  public:
    explicit CentroidStore(std::filesystem::path path);

    [[nodiscard]] EmbeddingMatrix load() const;
    void save(const EmbeddingMatrix& centroids) const;

    // Modification time of the backing file; ingestion uses it as the cutoff
    [[nodiscard]] TimePoint last_modified() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] CentroidFormat format() const noexcept { return format_; }

    [[nodiscard]] static EmbeddingMatrix from_json_string(const std::string& json_str);
    [[nodiscard]] static std::string to_json_string(const EmbeddingMatrix& centroids);
    [[nodiscard]] static EmbeddingMatrix from_msgpack_string(const std::string& data);
    [[nodiscard]] static std::string to_msgpack_string(const EmbeddingMatrix& centroids);

  private:
    std::filesystem::path path_;
    CentroidFormat format_;
  };

}  // namespace railog
