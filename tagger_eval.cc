// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "tagger_eval.h"

#include "core/evaluate.h"
#include "core/util.h"

namespace eval_tagger {
    double cross_entropy(const HMM &hmm, const TaggedCorpus &corpus) {
	double log_probability = 0.0;
	for (const Sentence &sentence : corpus) {
	    log_probability += hmm.LogProbability(sentence, corpus);
	}
	size_t num_tokens = corpus.NumWords() + corpus.NumSentences();
	if (num_tokens == 0) { return 0.0; }
	return -log_probability / (num_tokens * log(2.0));
    }

    void tag_corpus(const HMM &hmm, const TaggedCorpus &corpus,
		    vector<Sentence> *predictions) {
	predictions->clear();
	for (const Sentence &sentence : corpus) {
	    predictions->push_back(hmm.ViterbiTag(sentence.Untagged(),
						  corpus));
	}
    }

    double error_rate(const HMM &hmm, const TaggedCorpus &corpus,
		      double *known_error_rate, double *novel_error_rate) {
	vector<Sentence> predictions;
	tag_corpus(hmm, corpus, &predictions);

	// Gold tags, also split by whether the word is in the vocabulary.
	// Positions left as "" are not counted.
	vector<vector<string> > true_sequences;
	vector<vector<string> > known_sequences;
	vector<vector<string> > novel_sequences;
	vector<vector<string> > predicted_sequences;
	for (size_t i = 0; i < corpus.NumSentences(); ++i) {
	    const Sentence &sentence = corpus.sentences()[i];
	    vector<string> known_tags;
	    vector<string> novel_tags;
	    for (size_t j = 0; j < sentence.Length(); ++j) {
		bool known = corpus.vocab().Contains(sentence.words[j]);
		known_tags.push_back((known) ? sentence.tags[j] : "");
		novel_tags.push_back((known) ? "" : sentence.tags[j]);
	    }
	    true_sequences.push_back(sentence.tags);
	    known_sequences.push_back(known_tags);
	    novel_sequences.push_back(novel_tags);
	    predicted_sequences.push_back(predictions[i].tags);
	}

	double position_accuracy;
	double sequence_accuracy;
	if (known_error_rate != nullptr) {
	    size_t num_known = eval_sequential::compute_accuracy(
		known_sequences, predicted_sequences, &position_accuracy,
		&sequence_accuracy);
	    *known_error_rate = (num_known > 0) ?
		1.0 - position_accuracy / 100.0 : 0.0;
	}
	if (novel_error_rate != nullptr) {
	    size_t num_novel = eval_sequential::compute_accuracy(
		novel_sequences, predicted_sequences, &position_accuracy,
		&sequence_accuracy);
	    *novel_error_rate = (num_novel > 0) ?
		1.0 - position_accuracy / 100.0 : 0.0;
	}
	size_t num_tagged = eval_sequential::compute_accuracy(
	    true_sequences, predicted_sequences, &position_accuracy,
	    &sequence_accuracy);
	return (num_tagged > 0) ? 1.0 - position_accuracy / 100.0 : 0.0;
    }

    void write_sentences(const vector<Sentence> &sentences,
			 const string &output_path) {
	ofstream output_file(output_path, ios::out);
	ASSERT(output_file.is_open(), "Cannot open " << output_path);
	for (const Sentence &sentence : sentences) {
	    output_file << sentence.ToString() << endl;
	}
    }
}  // namespace eval_tagger
