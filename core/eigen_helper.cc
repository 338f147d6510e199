// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "eigen_helper.h"

namespace eigen_helper {
    void generate_random_matrix(size_t num_rows, size_t num_columns,
				default_random_engine *engine,
				Eigen::MatrixXd *matrix) {
	matrix->resize(num_rows, num_columns);
	normal_distribution<double> normal(0.0, 1.0);  // Standard Gaussian.
	for (size_t row = 0; row < num_rows; ++row) {
	    for (size_t col = 0; col < num_columns; ++col) {
		(*matrix)(row, col) = fabs(normal(*engine));
	    }
	}
    }

    double masked_row_sum(const Eigen::MatrixXd &matrix, size_t row,
			  const vector<bool> &column_mask) {
	ASSERT(column_mask.size() == matrix.cols(), "Column mask size "
	       << column_mask.size() << " != " << matrix.cols());
	double row_sum = 0.0;
	for (size_t col = 0; col < matrix.cols(); ++col) {
	    if (column_mask[col]) { row_sum += matrix(row, col); }
	}
	return row_sum;
    }

    bool check_zero_outside_mask(const Eigen::MatrixXd &matrix,
				 const vector<bool> &row_mask,
				 const vector<bool> &column_mask) {
	ASSERT(row_mask.size() == matrix.rows() &&
	       column_mask.size() == matrix.cols(), "Mask sizes ("
	       << row_mask.size() << ", " << column_mask.size()
	       << ") do not match the matrix");
	for (size_t row = 0; row < matrix.rows(); ++row) {
	    for (size_t col = 0; col < matrix.cols(); ++col) {
		if ((!row_mask[row] || !column_mask[col]) &&
		    matrix(row, col) != 0.0) { return false; }
	    }
	}
	return true;
    }

    void normalize_rows(const vector<bool> &row_mask,
			const vector<bool> &column_mask,
			Eigen::MatrixXd *matrix) {
	ASSERT(row_mask.size() == matrix->rows() &&
	       column_mask.size() == matrix->cols(), "Mask sizes ("
	       << row_mask.size() << ", " << column_mask.size()
	       << ") do not match the matrix");
	size_t num_permitted_columns = count(column_mask.begin(),
					     column_mask.end(), true);
	for (size_t row = 0; row < matrix->rows(); ++row) {
	    if (!row_mask[row]) {
		matrix->row(row).setZero();
		continue;
	    }
	    double row_sum = masked_row_sum(*matrix, row, column_mask);
	    for (size_t col = 0; col < matrix->cols(); ++col) {
		if (!column_mask[col]) {
		    (*matrix)(row, col) = 0.0;
		} else if (row_sum > 0.0) {
		    (*matrix)(row, col) /= row_sum;
		} else {
		    (*matrix)(row, col) = 1.0 / num_permitted_columns;
		}
	    }
	}
    }
}  // namespace eigen_helper
