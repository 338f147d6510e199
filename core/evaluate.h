// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Code for evaluation.

#ifndef CORE_EVALUATE_H_
#define CORE_EVALUATE_H_

#include <string>
#include <vector>

using namespace std;

// Functions for evaluating sequences.
namespace eval_sequential {
    // Computes accuracy (in percent) for sequence predictions. Positions whose
    // true label is the empty string are unlabeled and not counted; a sequence
    // is correct if all of its labeled positions are. Returns the number of
    // labeled positions.
    size_t compute_accuracy(const vector<vector<string> > &true_sequences,
			    const vector<vector<string> > &predicted_sequences,
			    double *position_accuracy,
			    double *sequence_accuracy);
}  // namespace eval_sequential

#endif  // CORE_EVALUATE_H_
