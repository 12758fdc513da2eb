#include <format>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <sstream>
#include <system_error>

namespace railog {

  bool read_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
  }

  std::ifstream open_input(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw IoError(std::format("Failed to open file: {}", path.string()));
    }
    return file;
  }

  std::ofstream open_append(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file.is_open()) {
      throw IoError(std::format("Failed to open file for appending: {}", path.string()));
    }
    return file;
  }

  std::string read_file(const std::filesystem::path& path) {
    auto file = open_input(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
      throw IoError(std::format("Failed to read file: {}", path.string()));
    }
    return buffer.str();
  }

  void write_file_atomic(const std::filesystem::path& path, std::string_view contents) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    {
      std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
      if (!file.is_open()) {
        throw IoError(std::format("Failed to open file for writing: {}", tmp_path.string()));
      }
      file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
      file.flush();
      if (!file) {
        throw IoError(std::format("Failed to write file: {}", tmp_path.string()));
      }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
      auto reason = ec.message();
      std::filesystem::remove(tmp_path, ec);
      throw IoError(std::format("Failed to replace {}: {}", path.string(), reason));
    }
  }

}  // namespace railog
