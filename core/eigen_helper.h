// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Various helper functions for the Eigen library. Some conventions:
//    - A "mask" is a vector<bool> marking which rows (or columns) of a matrix
//      are permitted to carry probability mass.
//    - Normalization is always along rows: row(i) becomes a distribution over
//      the permitted columns.

#ifndef CORE_EIGEN_HELPER_H_
#define CORE_EIGEN_HELPER_H_

#include <Eigen/Dense>
#include <random>

#include "util.h"

namespace eigen_helper {
    // Writes an Eigen dense matrix to a binary stream.
    template<typename EigenDenseMatrix>
    void binary_write_matrix(const EigenDenseMatrix& matrix, ostream& file) {
	typename EigenDenseMatrix::Index num_rows = matrix.rows();
	typename EigenDenseMatrix::Index num_columns = matrix.cols();
	util_file::binary_write_primitive(num_rows, file);
	util_file::binary_write_primitive(num_columns, file);
	file.write(reinterpret_cast<const char *>(matrix.data()), num_rows *
		   num_columns * sizeof(typename EigenDenseMatrix::Scalar));
    }

    // Reads an Eigen dense matrix from a binary stream.
    template<typename EigenDenseMatrix>
    void binary_read_matrix(istream& file, EigenDenseMatrix *matrix) {
	typename EigenDenseMatrix::Index num_rows;
	typename EigenDenseMatrix::Index num_columns;
	util_file::binary_read_primitive(file, &num_rows);
	util_file::binary_read_primitive(file, &num_columns);
	ASSERT(file.good() && num_rows >= 0 && num_columns >= 0,
	       "Bad matrix header: " << num_rows << " x " << num_columns);
	matrix->resize(num_rows, num_columns);
	file.read(reinterpret_cast<char*>(matrix->data()), num_rows *
		  num_columns * sizeof(typename EigenDenseMatrix::Scalar));
	ASSERT(!file.fail(), "Truncated matrix body");
    }

    // Writes an Eigen dense matrix to a binary file.
    template<typename EigenDenseMatrix>
    void binary_write_matrix(const EigenDenseMatrix& matrix,
			     const string &file_path) {
	ofstream file(file_path, ios::out | ios::binary);
	ASSERT(file.is_open(), "Cannot open file: " << file_path);
	binary_write_matrix(matrix, file);
    }

    // Reads an Eigen dense matrix from a binary file.
    template<typename EigenDenseMatrix>
    void binary_read_matrix(const string &file_path, EigenDenseMatrix *matrix) {
	ifstream file(file_path, ios::in | ios::binary);
	ASSERT(file.is_open(), "Cannot open file: " << file_path);
	binary_read_matrix(file, matrix);
    }

    // Returns true if two Eigen dense matrices are close in value.
    template<typename EigenDenseMatrix>
    bool check_near(const EigenDenseMatrix& matrix1,
		    const EigenDenseMatrix& matrix2, double error_threshold) {
	if (matrix1.rows() != matrix2.rows() ||
	    matrix1.cols() != matrix2.cols()) { return false; }
	for (size_t row = 0; row < matrix1.rows(); ++row) {
	    for (size_t col = 0; col < matrix1.cols(); ++col) {
		if (fabs(matrix1(row, col) - matrix2(row, col))
		    > error_threshold) { return false; }
	    }
	}
	return true;
    }

    // Fills a matrix with absolute values of standard Gaussian draws.
    void generate_random_matrix(size_t num_rows, size_t num_columns,
				default_random_engine *engine,
				Eigen::MatrixXd *matrix);

    // Returns the sum of row(row) over the columns permitted by the mask.
    double masked_row_sum(const Eigen::MatrixXd &matrix, size_t row,
			  const vector<bool> &column_mask);

    // Returns true if every entry outside the masks is exactly zero.
    bool check_zero_outside_mask(const Eigen::MatrixXd &matrix,
				 const vector<bool> &row_mask,
				 const vector<bool> &column_mask);

    // Normalizes every permitted row over the permitted columns. Entries
    // outside the masks are set to 0. A permitted row with no mass becomes
    // uniform over the permitted columns.
    void normalize_rows(const vector<bool> &row_mask,
			const vector<bool> &column_mask,
			Eigen::MatrixXd *matrix);
}  // namespace eigen_helper

#endif  // CORE_EIGEN_HELPER_H_
