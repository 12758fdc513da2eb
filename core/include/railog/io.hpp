#pragma once
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>

namespace railog {

  // std::getline that also drops a trailing '\r' (CRLF input)
  bool read_line(std::istream& in, std::string& line);

  // Throws IoError when the file cannot be opened
  [[nodiscard]] std::ifstream open_input(const std::filesystem::path& path);

  // Opens for appending, creating the file if needed; never truncates
  [[nodiscard]] std::ofstream open_append(const std::filesystem::path& path);

  [[nodiscard]] std::string read_file(const std::filesystem::path& path);

  // Writes `<path>.tmp` then renames it over `path`
  void write_file_atomic(const std::filesystem::path& path, std::string_view contents);

}  // namespace railog
