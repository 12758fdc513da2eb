#include <format>
#include <railog/errors.hpp>
#include <railog/retrain.hpp>

namespace railog {

  void append_centroids(EmbeddingMatrix& centroids, const EmbeddingMatrix& new_rows) {
    if (new_rows.rows() == 0) return;

    if (centroids.rows() == 0) {
      centroids = new_rows;
      return;
    }
    if (new_rows.cols() != centroids.cols()) {
      throw ShapeError(std::format("cannot append {}-dimensional vectors to {}-dimensional centroids",
                                   new_rows.cols(), centroids.cols()));
    }

    const auto old_rows = centroids.rows();
    centroids.conservativeResize(old_rows + new_rows.rows(), Eigen::NoChange);
    centroids.bottomRows(new_rows.rows()) = new_rows;
  }

}  // namespace railog
