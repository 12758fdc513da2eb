#pragma once
#include <railog/types.hpp>

namespace railog {

  // Appends `new_rows` verbatim below `centroids`; no merging or dedup.
  // An empty set adopts the new rows' dimension, otherwise a column mismatch
  // raises ShapeError.
  void append_centroids(EmbeddingMatrix& centroids, const EmbeddingMatrix& new_rows);

}  // namespace railog
