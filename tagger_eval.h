// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Evaluation of an HMM tagger on a corpus. Both measures can serve as the
// loss function for training.

#ifndef HMM_TAGGER_TAGGER_EVAL_H_
#define HMM_TAGGER_TAGGER_EVAL_H_

#include <string>
#include <vector>

#include "core/corpus.h"
#include "hmm.h"

using namespace std;

namespace eval_tagger {
    // Returns the cross-entropy of the model on the corpus in bits per token,
    // where each sentence contributes its words plus one end token. Returns
    // inf if some sentence is impossible under the model.
    double cross_entropy(const HMM &hmm, const TaggedCorpus &corpus);

    // Viterbi-tags every sentence of the corpus (gold tags are ignored).
    void tag_corpus(const HMM &hmm, const TaggedCorpus &corpus,
		    vector<Sentence> *predictions);

    // Returns the fraction of tagged words whose Viterbi tag is wrong. Also
    // computes the error rates on words in the vocabulary (known) and out of
    // the vocabulary (novel) if the pointers are not null. A rate with no
    // tagged word to count is 0.
    double error_rate(const HMM &hmm, const TaggedCorpus &corpus,
		      double *known_error_rate, double *novel_error_rate);

    // Writes sentences in the corpus format (word/tag), one per line.
    void write_sentences(const vector<Sentence> &sentences,
			 const string &output_path);
}  // namespace eval_tagger

#endif  // HMM_TAGGER_TAGGER_EVAL_H_
