// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "evaluate.h"

#include "util.h"

namespace eval_sequential {
    size_t compute_accuracy(const vector<vector<string> > &true_sequences,
			    const vector<vector<string> > &predicted_sequences,
			    double *position_accuracy,
			    double *sequence_accuracy) {
	ASSERT(true_sequences.size() == predicted_sequences.size(),
	       "Number of sequences not matching: " << true_sequences.size()
	       << " vs " << predicted_sequences.size());
	size_t num_items = 0;
	size_t num_items_correct = 0;
	size_t num_sequences_correct = 0;
	for (size_t i = 0; i < true_sequences.size(); ++i) {
	    ASSERT(true_sequences[i].size() == predicted_sequences[i].size(),
		   "Lengths not matching at sequence " << i);
	    bool entire_sequence_is_correct = true;
	    for (size_t j = 0; j < true_sequences[i].size(); ++j) {
		const string &true_string = true_sequences[i][j];
		if (true_string.empty()) { continue; }  // Unlabeled.
		++num_items;
		if (predicted_sequences[i][j] == true_string) {
		    num_items_correct += 1;
		} else {
		    entire_sequence_is_correct = false;
		}
	    }
	    if (entire_sequence_is_correct) { num_sequences_correct += 1; }
	}
	(*position_accuracy) = (num_items > 0) ?
	    ((double) num_items_correct) / num_items * 100 : 0.0;
	(*sequence_accuracy) = (true_sequences.size() > 0) ?
	    ((double) num_sequences_correct) / true_sequences.size() * 100 :
	    0.0;
	return num_items;
    }
}  // namespace eval_sequential
