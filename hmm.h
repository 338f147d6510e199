// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// An implementation of bigram hidden Markov models (HMMs) for tagging, trained
// by the Baum-Welch algorithm on tagged, partially tagged, or untagged
// sentences and decoded by the Viterbi algorithm.
//
// States are tags and observations are words. The tag set and the vocabulary
// end with the sentinels (end, then start) and the parameters are probability
// matrices
//    A (K x K):  A(i, j) = p(tag j | previous tag i)
//    B (K x V):  B(i, w) = p(word w | tag i)
// with structural zeros: nothing transitions into the start tag or out of the
// end tag, and the start/end tags emit only the start/end words (which no
// other tag emits). All dynamic programs work with log probabilities.

#ifndef HMM_TAGGER_HMM_H_
#define HMM_TAGGER_HMM_H_

#include <Eigen/Dense>
#include <functional>
#include <string>
#include <vector>

#include "core/corpus.h"
#include "core/integerizer.h"

using namespace std;

// Stages of EM training.
enum class TrainingState {
    kInitializing,
    kAccumulating,
    kReestimating,
    kEvaluating,
    kConverged,
    kFailed
};

// Returns the name of a training state.
string TrainingStateString(TrainingState state);

class HMM {
public:
    // Initializes empty (e.g., to load a model).
    HMM() { }

    // Initializes randomly over the given tag set and vocabulary, which must
    // end with the sentinel tags/words.
    HMM(const Integerizer &tagset, const Integerizer &vocab, bool unigram,
	size_t seed);

    // Sets the output directory (for the log file and the default model file).
    void SetOutputDirectory(const string &output_directory);

    // Clears the model.
    void Clear();

    // Draws random parameters that respect the structural zeros. In the
    // unigram mode every non-end row of A is the same distribution.
    void InitializeParametersRandomly(size_t seed);

    // Sets the parameters to given probability matrices (checked).
    void SetParameters(const Eigen::MatrixXd &transition,
		       const Eigen::MatrixXd &emission);

    // Trains the parameters by EM starting from the current parameters. Stops
    // when the relative improvement of the loss falls below the tolerance
    // (including when the loss gets worse) or after max_steps epochs. Saves
    // the model to save_path (if not empty) once converged.
    TrainingState Train(const TaggedCorpus &corpus,
			const function<double(const HMM &)> &loss,
			double lambda, double tolerance, size_t max_steps,
			const string &save_path);

    // Computes the log probability of a sentence from the given corpus,
    // marginalizing over unknown tags. Returns -inf if impossible.
    double LogProbability(const Sentence &sentence,
			  const TaggedCorpus &corpus) const;

    // Returns the sentence tagged by the Viterbi algorithm (tags in the input
    // are ignored).
    Sentence ViterbiTag(const Sentence &sentence,
			const TaggedCorpus &corpus) const;

    // Computes the log marginal probabilities for each word position:
    //    marginal[i][t] = log(probability of tag t at the (i+1)-th word,
    //                         given the sentence)
    void ComputeLogMarginal(const Sentence &sentence,
			    const TaggedCorpus &corpus,
			    vector<vector<double> > *marginal) const;

    // Saves the model to the default model file.
    void Save() const { Save(ModelPath()); }

    // Saves the model: unigram flag, tag set, vocabulary, A, B.
    void Save(const string &model_path) const;

    // Loads the model from the default model file.
    void Load() { Load(ModelPath()); }

    // Loads a model saved by Save().
    void Load(const string &model_path);

    // Writes the parameter matrices in a human-readable form.
    void WriteModelInfo() const { WriteModelInfo(ModelInfoPath()); }

    // Writes the parameter matrices in a human-readable form to a file.
    void WriteModelInfo(const string &info_path) const;

    // Runs the forward algorithm: al[i][t] = log(probability of the words at
    // positions 1 ... i, the i-th tag being t). Position 0 is the start
    // sentinel. Returns log Z = al[n+1][end tag].
    double Forward(const IntegerizedSentence &sentence,
		   vector<vector<double> > *al) const;

    // Runs the backward algorithm: be[i][t] = log(probability of the words at
    // positions i+1 ... n+1, conditioned on the i-th tag being t). Returns
    // log Z = be[0][start tag].
    double Backward(const IntegerizedSentence &sentence,
		    vector<vector<double> > *be) const;

    // Adds expected transition/emission counts given the forward and backward
    // tables of the sentence, each scaled by mult.
    void AccumulateExpectedCounts(const IntegerizedSentence &sentence,
				  const vector<vector<double> > &al,
				  const vector<vector<double> > &be,
				  double log_z, double mult);

    // Runs forward-backward on the sentence and adds its expected counts.
    // Returns the log probability of the sentence.
    double EStep(const IntegerizedSentence &sentence, double mult = 1.0);

    // Re-estimates A and B from the expected counts with add-lambda
    // smoothing, then zeroes the counts.
    void MStep(double lambda);

    // Zeroes the expected counts.
    void ZeroExpectedCounts();

    // Sets the expected counts (e.g., collected elsewhere).
    void SetExpectedCounts(const Eigen::MatrixXd &transition_count,
			   const Eigen::MatrixXd &emission_count);

    // Performs Viterbi decoding over the sentence's words, returns the log
    // probability of the best tag sequence (sentinels excluded).
    double Viterbi(const IntegerizedSentence &sentence,
		   vector<Tag> *tag_sequence) const;

    // Computes the log probability of the sentence (marginalizing over
    // unknown tags) by the forward algorithm.
    double ComputeLogProbability(const IntegerizedSentence &sentence) const;

    // Computes the log probability of the sentence together with a full tag
    // sequence (sentinels excluded).
    double ComputeLogProbability(const IntegerizedSentence &sentence,
				 const vector<Tag> &tag_sequence) const;

    // Checks if the parameters form proper distributions with the structural
    // zeros in place.
    void CheckProperDistribution() const;

    // Returns true if the transition i -> j is structurally impossible.
    bool IsForbiddenTransition(Tag tag1, Tag tag2) const {
	return tag1 == EosTag() || tag2 == BosTag();
    }

    // Returns true if the emission t -> w is structurally impossible.
    bool IsForbiddenEmission(Tag tag, Word word) const;

    // Returns the emission probability.
    double EmissionProbability(const string &tag_string,
			       const string &word_string) const;

    // Returns the transition probability.
    double TransitionProbability(const string &tag1_string,
				 const string &tag2_string) const;

    // Returns the number of tags (sentinels included).
    size_t NumTags() const { return tagset_.Size(); }

    // Returns the number of word types (sentinels included).
    size_t NumWords() const { return vocab_.Size(); }

    // Returns the sentinel indices.
    Tag EosTag() const { return NumTags() - 2; }
    Tag BosTag() const { return NumTags() - 1; }
    Word EosWord() const { return NumWords() - 2; }
    Word BosWord() const { return NumWords() - 1; }

    // Returns the path to the model file.
    string ModelPath() const { return output_directory_ + "/model.bin"; }

    // Returns the tag set.
    const Integerizer &tagset() const { return tagset_; }

    // Returns the vocabulary.
    const Integerizer &vocab() const { return vocab_; }

    // Returns true if transitions do not depend on the previous tag.
    bool unigram() const { return unigram_; }

    // Returns the transition matrix A.
    const Eigen::MatrixXd &transition() const { return transition_; }

    // Returns the emission matrix B.
    const Eigen::MatrixXd &emission() const { return emission_; }

    // Returns the expected transition counts.
    const Eigen::MatrixXd &transition_count() const {
	return transition_count_;
    }

    // Returns the expected emission counts.
    const Eigen::MatrixXd &emission_count() const { return emission_count_; }

    // Returns the stage the last call to Train() ended in.
    TrainingState training_state() const { return training_state_; }

    // Sets the flag for printing messages to stderr.
    void set_verbose(bool verbose) { verbose_ = verbose; }

    // Sets whether to turn on the debug mode (exhaustive checks).
    void set_debug(bool debug) { debug_ = debug; }

private:
    // Checks that the tag set and vocabulary have the sentinels and at least
    // one real tag/word.
    void CheckDictionaries() const;

    // Checks that the corpus uses the model's tag set and vocabulary.
    void CheckMatchingCorpus(const TaggedCorpus &corpus) const;

    // Checks that the integerized sentence is well formed for this model.
    void CheckSentence(const IntegerizedSentence &sentence) const;

    // Returns true if the tag is compatible with the supervision at position i.
    bool Allowed(const IntegerizedSentence &sentence, size_t i,
		 Tag tag) const {
	return sentence.tags[i] == corpus::kNoTag || sentence.tags[i] == tag;
    }

    // Masks of rows/columns that may carry probability mass.
    vector<bool> TransitionRowMask() const;
    vector<bool> TransitionColumnMask() const;
    vector<bool> RealTagMask() const;
    vector<bool> RealWordMask() const;

    // Sets the sentinel rows of B to their deterministic emissions.
    void SetSentinelEmissions(Eigen::MatrixXd *emission) const;

    // Recomputes the log parameter tables from A and B.
    void UpdateLogParameters();

    // Recovers the best tag sequence from the backpointer.
    void RecoverFromBackpointer(const vector<vector<Tag> > &backpointer,
				vector<Tag> *tag_sequence) const;

    // Performs exhaustive Viterbi decoding, returns the computed probability.
    double ViterbiExhaustive(const IntegerizedSentence &sentence,
			     vector<Tag> *tag_sequence) const;

    // Computes the log probability of the sentence exhaustively.
    double ComputeLogProbabilityExhaustive(
	const IntegerizedSentence &sentence) const;

    // Populates a vector of all real-tag sequences of the given length.
    void PopulateAllTagSequences(const vector<Tag> &tags, size_t length,
				 vector<vector<Tag> > *all_tag_sequences)
	const;

    // Reports status in a log file and optionally the standard error.
    void Report(const string &report_string) const;

    // Returns the path to the log file.
    string LogPath() const { return output_directory_ + "/log.txt"; }

    // Returns the path to the model info file.
    string ModelInfoPath() const { return output_directory_ + "/info.txt"; }

    // Tolerance for a probability distribution to sum to 1.
    static constexpr double kDistributionTolerance_ = 1e-6;

    // Relative tolerance for the forward and backward log Z to agree.
    static constexpr double kLogZTolerance_ = 1e-6;

    // Tag set (last two: end tag, start tag).
    Integerizer tagset_;

    // Vocabulary (last two: end word, start word).
    Integerizer vocab_;

    // Use position-independent transitions?
    bool unigram_ = false;

    // Transition probabilities A.
    Eigen::MatrixXd transition_;

    // Emission probabilities B.
    Eigen::MatrixXd emission_;

    // Transition log probabilities (-inf for zeros).
    Eigen::MatrixXd log_transition_;

    // Emission log probabilities (-inf for zeros).
    Eigen::MatrixXd log_emission_;

    // Expected transition counts of the current epoch.
    Eigen::MatrixXd transition_count_;

    // Expected emission counts of the current epoch.
    Eigen::MatrixXd emission_count_;

    // Stage of training.
    TrainingState training_state_ = TrainingState::kInitializing;

    // Path to the output directory.
    string output_directory_;

    // Print messages to stderr?
    bool verbose_ = true;

    // Turn on the debug mode?
    bool debug_ = false;
};

#endif  // HMM_TAGGER_HMM_H_
