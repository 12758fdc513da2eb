#pragma once
#include <stdexcept>
#include <string>

namespace railog {

  // Base for every fatal condition raised by railog. Parameter validation
  // failures use std::invalid_argument instead.
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Missing/unreadable file, failed write or rename
  class IoError : public Error {
  public:
    using Error::Error;
  };

  // Malformed centroid file or uncompilable rule pattern
  class FormatError : public Error {
  public:
    using Error::Error;
  };

  // Vector dimension does not match the matrix it is combined with
  class ShapeError : public Error {
  public:
    using Error::Error;
  };

  class NoClustersFoundError : public Error {
  public:
    NoClustersFoundError()
        : Error("DBSCAN did not find any clusters. Try adjusting epsilon or min_points.") {}
  };

  class EmbedderError : public Error {
  public:
    using Error::Error;
  };

}  // namespace railog
