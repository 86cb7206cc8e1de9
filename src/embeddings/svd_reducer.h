/**
 * @file svd_reducer.h
 * @brief Deterministic randomized truncated SVD (TF-IDF space -> fixed dimension)
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "embeddings/tfidf_vectorizer.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::embeddings {

/**
 * @brief Linear projection onto the top right singular vectors of the corpus matrix
 *
 * Uses the Halko-Martinsson-Tropp range finder with a seeded Gaussian test
 * matrix and a few power iterations, so the same corpus and seed always give
 * the same components. The effective rank is clipped to
 * min(n_docs, n_terms, dimension); Transform() zero-pads the output to
 * `dimension` entries.
 */
class SvdReducer {
 public:
  using SparseMatrix = Eigen::SparseMatrix<double, Eigen::RowMajor>;

  SvdReducer(uint32_t dimension, uint32_t oversampling, uint32_t power_iterations, uint32_t seed);

  /**
   * @brief Fit on an n_docs x n_terms matrix
   */
  utils::Expected<void, utils::Error> Fit(const SparseMatrix& matrix);

  /**
   * @brief Project one TF-IDF row; result has exactly Dimension() entries
   */
  std::vector<float> Transform(const SparseRow& row) const;

  bool IsFitted() const { return components_.size() > 0; }
  uint32_t Dimension() const { return dimension_; }
  uint32_t Rank() const { return static_cast<uint32_t>(components_.cols()); }
  const std::vector<double>& SingularValues() const { return singular_values_; }

  bool Serialize(std::ostream& output_stream) const;
  utils::Expected<void, utils::Error> Deserialize(std::istream& input_stream);

  /**
   * @brief Build the row-major sparse matrix the reducer is fitted on
   */
  static SparseMatrix BuildMatrix(const std::vector<SparseRow>& rows, size_t n_terms);

 private:
  uint32_t dimension_;
  uint32_t oversampling_;
  uint32_t power_iterations_;
  uint32_t seed_;

  Eigen::MatrixXf components_;  // n_terms x rank
  std::vector<double> singular_values_;
};

}  // namespace finrag::embeddings
