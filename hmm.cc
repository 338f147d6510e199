// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "hmm.h"

#include <iomanip>
#include <random>

#include "core/eigen_helper.h"
#include "core/util.h"

string TrainingStateString(TrainingState state) {
    switch (state) {
    case TrainingState::kInitializing: return "initializing";
    case TrainingState::kAccumulating: return "accumulating";
    case TrainingState::kReestimating: return "reestimating";
    case TrainingState::kEvaluating: return "evaluating";
    case TrainingState::kConverged: return "converged";
    case TrainingState::kFailed: return "failed";
    }
    return "unknown";
}

HMM::HMM(const Integerizer &tagset, const Integerizer &vocab, bool unigram,
	 size_t seed) : tagset_(tagset), vocab_(vocab), unigram_(unigram) {
    CheckDictionaries();
    InitializeParametersRandomly(seed);
}

void HMM::SetOutputDirectory(const string &output_directory) {
    ASSERT(!output_directory.empty(), "Empty output directory.");
    output_directory_ = output_directory;

    // Remove a file at the path (if it exists).
    if (util_file::exists(output_directory_) &&
	util_file::get_file_type(output_directory_) == "file") {
	ASSERT(system(("rm -f " + output_directory_).c_str()) == 0,
	       "Cannot remove file: " << output_directory_);
    }

    // Create the output directory (if necessary).
    ASSERT(system(("mkdir -p " + output_directory_).c_str()) == 0,
	   "Cannot create directory: " << output_directory_);
}

void HMM::Clear() {
    tagset_ = Integerizer();
    vocab_ = Integerizer();
    unigram_ = false;
    transition_.resize(0, 0);
    emission_.resize(0, 0);
    log_transition_.resize(0, 0);
    log_emission_.resize(0, 0);
    transition_count_.resize(0, 0);
    emission_count_.resize(0, 0);
    training_state_ = TrainingState::kInitializing;
}

void HMM::InitializeParametersRandomly(size_t seed) {
    CheckDictionaries();
    default_random_engine engine(seed);

    // Forbidden cells get zeroed by normalization, so no mass leaks into them.
    Eigen::MatrixXd transition;
    if (unigram_) {
	Eigen::MatrixXd shared_row;
	eigen_helper::generate_random_matrix(1, NumTags(), &engine,
					     &shared_row);
	transition = shared_row.replicate(NumTags(), 1);
    } else {
	eigen_helper::generate_random_matrix(NumTags(), NumTags(), &engine,
					     &transition);
    }
    eigen_helper::normalize_rows(TransitionRowMask(), TransitionColumnMask(),
				 &transition);

    Eigen::MatrixXd emission;
    eigen_helper::generate_random_matrix(NumTags(), NumWords(), &engine,
					 &emission);
    eigen_helper::normalize_rows(RealTagMask(), RealWordMask(), &emission);
    SetSentinelEmissions(&emission);

    transition_ = transition;
    emission_ = emission;
    UpdateLogParameters();
    CheckProperDistribution();
    ZeroExpectedCounts();
}

void HMM::SetParameters(const Eigen::MatrixXd &transition,
			const Eigen::MatrixXd &emission) {
    CheckDictionaries();
    ASSERT(transition.rows() == NumTags() && transition.cols() == NumTags(),
	   "Transition matrix must be " << NumTags() << " x " << NumTags());
    ASSERT(emission.rows() == NumTags() && emission.cols() == NumWords(),
	   "Emission matrix must be " << NumTags() << " x " << NumWords());
    transition_ = transition;
    emission_ = emission;
    UpdateLogParameters();
    CheckProperDistribution();
    ZeroExpectedCounts();
}

TrainingState HMM::Train(const TaggedCorpus &corpus,
			 const function<double(const HMM &)> &loss,
			 double lambda, double tolerance, size_t max_steps,
			 const string &save_path) {
    training_state_ = TrainingState::kInitializing;
    if (lambda < 0.0) {
	Report(util_string::printf_format(
		   "Smoothing parameter must be non-negative: %g", lambda));
	training_state_ = TrainingState::kFailed;
	return training_state_;
    }
    CheckMatchingCorpus(corpus);

    double old_loss = loss(*this);
    Report(util_string::printf_format(
	       "Training on %ld sentences (%ld words), %ld tags, %ld word "
	       "types, lambda %g, tolerance %g, at most %ld steps%s",
	       corpus.NumSentences(), corpus.NumWords(), NumTags(),
	       NumWords(), lambda, tolerance, max_steps,
	       (unigram_) ? ", unigram transitions" : ""));
    Report(util_string::printf_format("Initial loss: %.6f", old_loss));

    size_t step = 0;
    IntegerizedSentence integerized_sentence;
    while (step < max_steps) {
	training_state_ = TrainingState::kAccumulating;
	ZeroExpectedCounts();
	double log_likelihood = 0.0;
	for (const Sentence &sentence : corpus) {
	    corpus.Integerize(sentence, &integerized_sentence);
	    log_likelihood += EStep(integerized_sentence);
	}

	training_state_ = TrainingState::kReestimating;
	MStep(lambda);

	training_state_ = TrainingState::kEvaluating;
	double new_loss = loss(*this);
	++step;

	// A loss of exactly 0 cannot improve.
	double relative_improvement = (old_loss != 0.0) ?
	    (old_loss - new_loss) / fabs(old_loss) : 0.0;
	Report(util_string::printf_format(
		   "Step %ld:   log-likelihood %.4f   loss %.6f   "
		   "improvement %.6f", step, log_likelihood, new_loss,
		   relative_improvement));
	if (!(relative_improvement >= tolerance)) { break; }
	old_loss = new_loss;
    }
    if (step >= max_steps) {
	Report(util_string::printf_format("Stopped at %ld steps", step));
    }

    training_state_ = TrainingState::kConverged;
    if (!save_path.empty()) {
	Save(save_path);
	Report("Saved model to " + save_path);
    }
    return training_state_;
}

double HMM::LogProbability(const Sentence &sentence,
			   const TaggedCorpus &corpus) const {
    CheckMatchingCorpus(corpus);
    IntegerizedSentence integerized_sentence;
    corpus.Integerize(sentence, &integerized_sentence);
    return ComputeLogProbability(integerized_sentence);
}

Sentence HMM::ViterbiTag(const Sentence &sentence,
			 const TaggedCorpus &corpus) const {
    CheckMatchingCorpus(corpus);
    IntegerizedSentence integerized_sentence;
    corpus.Integerize(sentence, &integerized_sentence);
    vector<Tag> tag_sequence;
    Viterbi(integerized_sentence, &tag_sequence);

    Sentence tagged_sentence;
    for (size_t i = 0; i < sentence.Length(); ++i) {
	tagged_sentence.Add(sentence.words[i],
			    tagset_.Symbol(tag_sequence[i]));
    }
    return tagged_sentence;
}

void HMM::ComputeLogMarginal(const Sentence &sentence,
			     const TaggedCorpus &corpus,
			     vector<vector<double> > *marginal) const {
    CheckMatchingCorpus(corpus);
    IntegerizedSentence integerized_sentence;
    corpus.Integerize(sentence, &integerized_sentence);

    vector<vector<double> > al;
    vector<vector<double> > be;
    double log_z = Forward(integerized_sentence, &al);
    Backward(integerized_sentence, &be);
    ASSERT(util_math::is_finite(log_z), "Sentence has zero probability: "
	   << sentence.ToString());

    marginal->clear();
    for (size_t i = 1; i <= integerized_sentence.Length(); ++i) {
	vector<double> position_marginal(NumTags());
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    position_marginal[tag] = al[i][tag] + be[i][tag] - log_z;
	}
	marginal->push_back(position_marginal);
    }
}

void HMM::Save(const string &model_path) const {
    ofstream model_file(model_path, ios::out | ios::binary);
    ASSERT(model_file.is_open(), "Cannot open " << model_path);
    util_file::binary_write_primitive(unigram_, model_file);
    tagset_.Write(model_file);
    vocab_.Write(model_file);
    eigen_helper::binary_write_matrix(transition_, model_file);
    eigen_helper::binary_write_matrix(emission_, model_file);
}

void HMM::Load(const string &model_path) {
    Clear();
    ifstream model_file(model_path, ios::in | ios::binary);
    ASSERT(model_file.is_open(), "Cannot open " << model_path);
    util_file::binary_read_primitive(model_file, &unigram_);
    tagset_.Read(model_file);
    vocab_.Read(model_file);
    Eigen::MatrixXd transition;
    Eigen::MatrixXd emission;
    eigen_helper::binary_read_matrix(model_file, &transition);
    eigen_helper::binary_read_matrix(model_file, &emission);
    SetParameters(transition, emission);
}

void HMM::WriteModelInfo(const string &info_path) const {
    ofstream info_file(info_path, ios::out);
    ASSERT(info_file.is_open(), "Cannot open " << info_path);
    info_file << "Transition matrix A" << (unigram_ ? " (unigram)" : "")
	      << ":" << endl;
    const size_t label_width = 10;
    info_file << util_string::buffer_string("", label_width, ' ', "left");
    for (const string &tag_string : tagset_.symbols()) {
	info_file << "\t" << tag_string;
    }
    info_file << endl;
    for (Tag tag1 = 0; tag1 < NumTags(); ++tag1) {
	info_file << util_string::buffer_string(
	    tagset_.Symbol(tag1), max(tagset_.Symbol(tag1).size(), label_width),
	    ' ', "left");
	for (Tag tag2 = 0; tag2 < NumTags(); ++tag2) {
	    info_file << "\t" << fixed << setprecision(3)
		      << transition_(tag1, tag2);
	}
	info_file << endl;
    }
    info_file << endl << "Emission matrix B:" << endl;
    for (Tag tag = 0; tag < NumTags(); ++tag) {
	info_file << util_string::buffer_string(
	    tagset_.Symbol(tag), max(tagset_.Symbol(tag).size(), label_width),
	    ' ', "left");
	for (Word word = 0; word < NumWords(); ++word) {
	    if (emission_(tag, word) > 0.0) {
		info_file << "\t" << vocab_.Symbol(word) << ":" << fixed
			  << setprecision(3) << emission_(tag, word);
	    }
	}
	info_file << endl;
    }
}

double HMM::Forward(const IntegerizedSentence &sentence,
		    vector<vector<double> > *al) const {
    CheckSentence(sentence);
    size_t length = sentence.words.size();
    al->assign(length, vector<double>(NumTags(),
				      -numeric_limits<double>::infinity()));
    (*al)[0][BosTag()] = 0.0;
    for (size_t i = 1; i < length; ++i) {
	Word word = sentence.words[i];
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    if (!Allowed(sentence, i, tag)) { continue; }
	    double emission_value = log_emission_(tag, word);
	    if (!util_math::is_finite(emission_value)) { continue; }
	    double log_summed_probabilities =
		-numeric_limits<double>::infinity();
	    for (Tag previous_tag = 0; previous_tag < NumTags();
		 ++previous_tag) {
		double previous_value = (*al)[i - 1][previous_tag];
		if (!util_math::is_finite(previous_value)) { continue; }
		log_summed_probabilities = util_math::sum_logs(
		    log_summed_probabilities,
		    previous_value + log_transition_(previous_tag, tag));
	    }
	    (*al)[i][tag] = log_summed_probabilities + emission_value;
	}
    }
    return (*al)[length - 1][EosTag()];
}

double HMM::Backward(const IntegerizedSentence &sentence,
		     vector<vector<double> > *be) const {
    CheckSentence(sentence);
    size_t length = sentence.words.size();
    be->assign(length, vector<double>(NumTags(),
				      -numeric_limits<double>::infinity()));
    (*be)[length - 1][EosTag()] = 0.0;
    for (int i = length - 2; i >= 0; --i) {
	Word next_word = sentence.words[i + 1];
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    if (!Allowed(sentence, i, tag)) { continue; }
	    double log_summed_probabilities =
		-numeric_limits<double>::infinity();
	    for (Tag next_tag = 0; next_tag < NumTags(); ++next_tag) {
		double next_value = (*be)[i + 1][next_tag];
		if (!util_math::is_finite(next_value)) { continue; }
		log_summed_probabilities = util_math::sum_logs(
		    log_summed_probabilities,
		    log_transition_(tag, next_tag) +
		    log_emission_(next_tag, next_word) + next_value);
	    }
	    (*be)[i][tag] = log_summed_probabilities;
	}
    }
    return (*be)[0][BosTag()];
}

void HMM::AccumulateExpectedCounts(const IntegerizedSentence &sentence,
				   const vector<vector<double> > &al,
				   const vector<vector<double> > &be,
				   double log_z, double mult) {
    size_t length = sentence.words.size();
    ASSERT(al.size() == length && be.size() == length, "Tables of length "
	   << al.size() << " and " << be.size() << " for a sentence of "
	   << length << " positions");
    ASSERT(util_math::is_finite(log_z), "Cannot condition on log Z = "
	   << log_z);

    // Transitions at positions (i, i + 1), including both sentinels.
    for (size_t i = 0; i + 1 < length; ++i) {
	Word next_word = sentence.words[i + 1];
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    if (!util_math::is_finite(al[i][tag])) { continue; }
	    for (Tag next_tag = 0; next_tag < NumTags(); ++next_tag) {
		if (!util_math::is_finite(be[i + 1][next_tag])) { continue; }
		double log_probability = al[i][tag] +
		    log_transition_(tag, next_tag) +
		    log_emission_(next_tag, next_word) + be[i + 1][next_tag] -
		    log_z;
		transition_count_(tag, next_tag) +=
		    mult * exp(log_probability);
	    }
	}
    }

    // Emissions at the real positions only.
    for (size_t i = 1; i + 1 < length; ++i) {
	Word word = sentence.words[i];
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    if (!util_math::is_finite(al[i][tag]) ||
		!util_math::is_finite(be[i][tag])) { continue; }
	    emission_count_(tag, word) +=
		mult * exp(al[i][tag] + be[i][tag] - log_z);
	}
    }
}

double HMM::EStep(const IntegerizedSentence &sentence, double mult) {
    vector<vector<double> > al;
    vector<vector<double> > be;
    double forward_log_z = Forward(sentence, &al);
    double backward_log_z = Backward(sentence, &be);
    ASSERT(util_math::is_finite(forward_log_z), "Training sentence has zero "
	   "probability under the model (log Z = " << forward_log_z << ")");
    ASSERT(fabs(forward_log_z - backward_log_z) <=
	   kLogZTolerance_ * max(1.0, fabs(forward_log_z)),
	   "Forward and backward disagree: " << forward_log_z << " vs "
	   << backward_log_z);
    if (debug_) {
	double exhaustive_log_z = ComputeLogProbabilityExhaustive(sentence);
	ASSERT(fabs(forward_log_z - exhaustive_log_z) <=
	       kLogZTolerance_ * max(1.0, fabs(forward_log_z)),
	       "Forward: " << forward_log_z << ", exhaustive: "
	       << exhaustive_log_z);
    }
    AccumulateExpectedCounts(sentence, al, be, forward_log_z, mult);
    return forward_log_z;
}

void HMM::MStep(double lambda) {
    ASSERT(lambda >= 0.0, "Negative smoothing parameter: " << lambda);
    ASSERT(eigen_helper::check_zero_outside_mask(transition_count_,
						 TransitionRowMask(),
						 TransitionColumnMask()),
	   "Nonzero expected count of a forbidden transition");
    ASSERT(eigen_helper::check_zero_outside_mask(emission_count_,
						 RealTagMask(),
						 RealWordMask()),
	   "Nonzero expected count of a sentinel emission");

    // All contexts share one distribution in the unigram mode.
    Eigen::MatrixXd transition;
    if (unigram_) {
	Eigen::MatrixXd pooled_counts = transition_count_.colwise().sum();
	transition = pooled_counts.replicate(NumTags(), 1);
    } else {
	transition = transition_count_;
    }
    vector<bool> transition_row_mask = TransitionRowMask();
    vector<bool> transition_column_mask = TransitionColumnMask();
    for (Tag tag1 = 0; tag1 < NumTags(); ++tag1) {
	if (!transition_row_mask[tag1]) { continue; }
	for (Tag tag2 = 0; tag2 < NumTags(); ++tag2) {
	    if (transition_column_mask[tag2]) {
		transition(tag1, tag2) += lambda;
	    }
	}
    }
    eigen_helper::normalize_rows(transition_row_mask, transition_column_mask,
				 &transition);

    Eigen::MatrixXd emission = emission_count_;
    vector<bool> real_tag_mask = RealTagMask();
    vector<bool> real_word_mask = RealWordMask();
    for (Tag tag = 0; tag < NumTags(); ++tag) {
	if (!real_tag_mask[tag]) { continue; }
	for (Word word = 0; word < NumWords(); ++word) {
	    if (real_word_mask[word]) { emission(tag, word) += lambda; }
	}
    }
    eigen_helper::normalize_rows(real_tag_mask, real_word_mask, &emission);
    SetSentinelEmissions(&emission);

    transition_ = transition;
    emission_ = emission;
    UpdateLogParameters();
    CheckProperDistribution();
    ZeroExpectedCounts();
}

void HMM::ZeroExpectedCounts() {
    transition_count_ = Eigen::MatrixXd::Zero(NumTags(), NumTags());
    emission_count_ = Eigen::MatrixXd::Zero(NumTags(), NumWords());
}

void HMM::SetExpectedCounts(const Eigen::MatrixXd &transition_count,
			    const Eigen::MatrixXd &emission_count) {
    ASSERT(transition_count.rows() == NumTags() &&
	   transition_count.cols() == NumTags(), "Transition counts must be "
	   << NumTags() << " x " << NumTags());
    ASSERT(emission_count.rows() == NumTags() &&
	   emission_count.cols() == NumWords(), "Emission counts must be "
	   << NumTags() << " x " << NumWords());
    transition_count_ = transition_count;
    emission_count_ = emission_count;
}

double HMM::Viterbi(const IntegerizedSentence &sentence,
		    vector<Tag> *tag_sequence) const {
    CheckSentence(sentence);
    size_t length = sentence.words.size();
    vector<vector<double> > chart(
	length, vector<double>(NumTags(),
			       -numeric_limits<double>::infinity()));
    vector<vector<Tag> > backpointer(length, vector<Tag>(NumTags(),
							 BosTag()));
    chart[0][BosTag()] = 0.0;
    for (size_t i = 1; i < length; ++i) {
	Word word = sentence.words[i];
	for (Tag tag = 0; tag < NumTags(); ++tag) {
	    // The first maximizer wins ties.
	    double max_log_probability = chart[i - 1][0] +
		log_transition_(0, tag);
	    Tag best_previous_tag = 0;
	    for (Tag previous_tag = 1; previous_tag < NumTags();
		 ++previous_tag) {
		double log_probability = chart[i - 1][previous_tag] +
		    log_transition_(previous_tag, tag);
		if (log_probability > max_log_probability) {
		    max_log_probability = log_probability;
		    best_previous_tag = previous_tag;
		}
	    }
	    chart[i][tag] = max_log_probability + log_emission_(tag, word);
	    backpointer[i][tag] = best_previous_tag;
	}
    }
    RecoverFromBackpointer(backpointer, tag_sequence);
    double best_log_probability = chart[length - 1][EosTag()];

    if (debug_) {
	vector<Tag> tag_sequence_exhaustive;
	double best_log_probability_exhaustive =
	    ViterbiExhaustive(sentence, &tag_sequence_exhaustive);
	if (util_math::is_finite(best_log_probability_exhaustive)) {
	    ASSERT(fabs(best_log_probability -
			best_log_probability_exhaustive) < 1e-8,
		   "Viterbi: " << best_log_probability << ", exhaustive: "
		   << best_log_probability_exhaustive);
	} else {
	    ASSERT(!util_math::is_finite(best_log_probability),
		   "Viterbi found a path the exhaustive search did not");
	}
    }
    return best_log_probability;
}

double HMM::ComputeLogProbability(const IntegerizedSentence &sentence)
    const {
    vector<vector<double> > al;
    double forward_log_z = Forward(sentence, &al);

    if (debug_) {
	vector<vector<double> > be;
	double backward_log_z = Backward(sentence, &be);
	double exhaustive_log_z = ComputeLogProbabilityExhaustive(sentence);
	if (util_math::is_finite(forward_log_z)) {
	    double tolerance =
		kLogZTolerance_ * max(1.0, fabs(forward_log_z));
	    ASSERT(fabs(forward_log_z - backward_log_z) <= tolerance &&
		   fabs(forward_log_z - exhaustive_log_z) <= tolerance,
		   "Forward: " << forward_log_z << ", backward: "
		   << backward_log_z << ", exhaustive: "
		   << exhaustive_log_z);
	} else {
	    ASSERT(!util_math::is_finite(backward_log_z) &&
		   !util_math::is_finite(exhaustive_log_z),
		   "Only forward finds the sentence impossible");
	}
    }
    return forward_log_z;
}

double HMM::ComputeLogProbability(const IntegerizedSentence &sentence,
				  const vector<Tag> &tag_sequence) const {
    CheckSentence(sentence);
    ASSERT(tag_sequence.size() == sentence.Length(), "Lengths not matching: "
	   << tag_sequence.size() << " vs " << sentence.Length());
    double sequence_log_probability = 0.0;
    Tag previous_tag = BosTag();
    for (size_t i = 0; i < tag_sequence.size(); ++i) {
	Tag tag = tag_sequence[i];
	sequence_log_probability += log_transition_(previous_tag, tag) +
	    log_emission_(tag, sentence.words[i + 1]);
	previous_tag = tag;
    }
    sequence_log_probability += log_transition_(previous_tag, EosTag()) +
	log_emission_(EosTag(), EosWord());
    return sequence_log_probability;
}

void HMM::CheckProperDistribution() const {
    ASSERT(NumTags() > 2 && NumWords() > 2, "Empty dictionary?");
    ASSERT(transition_.minCoeff() >= 0.0 && emission_.minCoeff() >= 0.0,
	   "Negative probability");

    vector<bool> transition_row_mask = TransitionRowMask();
    vector<bool> transition_column_mask = TransitionColumnMask();
    ASSERT(eigen_helper::check_zero_outside_mask(transition_,
						 transition_row_mask,
						 transition_column_mask),
	   "Transition into the start tag or out of the end tag");
    for (Tag tag = 0; tag < NumTags(); ++tag) {
	if (!transition_row_mask[tag]) { continue; }
	double tag_sum = eigen_helper::masked_row_sum(transition_, tag,
						      transition_column_mask);
	ASSERT(fabs(tag_sum - 1.0) < kDistributionTolerance_,
	       "Transition from " << tagset_.Symbol(tag) << ": " << tag_sum);
	if (unigram_) {
	    ASSERT(eigen_helper::check_near(
		       Eigen::MatrixXd(transition_.row(tag)),
		       Eigen::MatrixXd(transition_.row(BosTag())), 1e-12),
		   "Unigram transition from " << tagset_.Symbol(tag)
		   << " differs from the shared distribution");
	}
    }

    vector<bool> real_tag_mask = RealTagMask();
    vector<bool> real_word_mask = RealWordMask();
    for (Tag tag = 0; tag < NumTags(); ++tag) {
	if (!real_tag_mask[tag]) { continue; }
	double tag_sum = eigen_helper::masked_row_sum(emission_, tag,
						      real_word_mask);
	ASSERT(fabs(tag_sum - 1.0) < kDistributionTolerance_,
	       "Emission from " << tagset_.Symbol(tag) << ": " << tag_sum);
	ASSERT(emission_(tag, BosWord()) == 0.0 &&
	       emission_(tag, EosWord()) == 0.0,
	       tagset_.Symbol(tag) << " emits a sentinel word");
    }
    for (Tag tag = 0; tag < NumTags(); ++tag) {
	if (real_tag_mask[tag]) { continue; }
	for (Word word = 0; word < NumWords(); ++word) {
	    double expected = IsForbiddenEmission(tag, word) ? 0.0 : 1.0;
	    ASSERT(emission_(tag, word) == expected, "Sentinel "
		   << tagset_.Symbol(tag) << " emits " << vocab_.Symbol(word)
		   << " with probability " << emission_(tag, word));
	}
    }
}

bool HMM::IsForbiddenEmission(Tag tag, Word word) const {
    if (tag == BosTag()) { return word != BosWord(); }
    if (tag == EosTag()) { return word != EosWord(); }
    return word == BosWord() || word == EosWord();
}

double HMM::EmissionProbability(const string &tag_string,
				const string &word_string) const {
    ASSERT(tagset_.Contains(tag_string), "No tag string: " << tag_string);
    ASSERT(vocab_.Contains(word_string), "No word string: " << word_string);
    return emission_(tagset_.Index(tag_string), vocab_.Index(word_string));
}

double HMM::TransitionProbability(const string &tag1_string,
				  const string &tag2_string) const {
    ASSERT(tagset_.Contains(tag1_string), "No tag string: " << tag1_string);
    ASSERT(tagset_.Contains(tag2_string), "No tag string: " << tag2_string);
    return transition_(tagset_.Index(tag1_string),
		       tagset_.Index(tag2_string));
}

void HMM::CheckDictionaries() const {
    ASSERT(corpus::ends_with_sentinels(tagset_, corpus::kEosTag,
				       corpus::kBosTag),
	   "Tag set must end with " << corpus::kEosTag << ", "
	   << corpus::kBosTag);
    ASSERT(corpus::ends_with_sentinels(vocab_, corpus::kEosWord,
				       corpus::kBosWord),
	   "Vocabulary must end with " << corpus::kEosWord << ", "
	   << corpus::kBosWord);
    ASSERT(NumTags() > 2, "No tag other than the sentinels");
    ASSERT(NumWords() > 2, "No word other than the sentinels");
}

void HMM::CheckMatchingCorpus(const TaggedCorpus &corpus) const {
    ASSERT(corpus.tagset() == tagset_, "The corpus uses a different tag set");
    ASSERT(corpus.vocab() == vocab_, "The corpus uses a different vocabulary");
}

void HMM::CheckSentence(const IntegerizedSentence &sentence) const {
    ASSERT(sentence.words.size() >= 2 &&
	   sentence.words.size() == sentence.tags.size(),
	   "Malformed sentence: " << sentence.words.size() << " words, "
	   << sentence.tags.size() << " tags");
    ASSERT(sentence.words.front() == BosWord() &&
	   sentence.tags.front() == BosTag(),
	   "Sentence does not begin with the start sentinels");
    ASSERT(sentence.words.back() == EosWord() &&
	   sentence.tags.back() == EosTag(),
	   "Sentence does not end with the end sentinels");
    for (size_t i = 0; i < sentence.words.size(); ++i) {
	ASSERT(sentence.words[i] < NumWords(), "Word index out of range: "
	       << sentence.words[i]);
	ASSERT(sentence.tags[i] < NumTags() ||
	       sentence.tags[i] == corpus::kNoTag, "Tag index out of range: "
	       << sentence.tags[i]);
    }
}

vector<bool> HMM::TransitionRowMask() const {
    vector<bool> mask(NumTags(), true);
    mask[EosTag()] = false;
    return mask;
}

vector<bool> HMM::TransitionColumnMask() const {
    vector<bool> mask(NumTags(), true);
    mask[BosTag()] = false;
    return mask;
}

vector<bool> HMM::RealTagMask() const {
    vector<bool> mask(NumTags(), true);
    mask[EosTag()] = false;
    mask[BosTag()] = false;
    return mask;
}

vector<bool> HMM::RealWordMask() const {
    vector<bool> mask(NumWords(), true);
    mask[EosWord()] = false;
    mask[BosWord()] = false;
    return mask;
}

void HMM::SetSentinelEmissions(Eigen::MatrixXd *emission) const {
    emission->row(EosTag()).setZero();
    emission->row(BosTag()).setZero();
    (*emission)(EosTag(), EosWord()) = 1.0;
    (*emission)(BosTag(), BosWord()) = 1.0;
}

void HMM::UpdateLogParameters() {
    log_transition_.resize(transition_.rows(), transition_.cols());
    for (size_t row = 0; row < transition_.rows(); ++row) {
	for (size_t col = 0; col < transition_.cols(); ++col) {
	    log_transition_(row, col) = util_math::log0(transition_(row, col));
	}
    }
    log_emission_.resize(emission_.rows(), emission_.cols());
    for (size_t row = 0; row < emission_.rows(); ++row) {
	for (size_t col = 0; col < emission_.cols(); ++col) {
	    log_emission_(row, col) = util_math::log0(emission_(row, col));
	}
    }
}

void HMM::RecoverFromBackpointer(const vector<vector<Tag> > &backpointer,
				 vector<Tag> *tag_sequence) const {
    size_t length = backpointer.size();
    tag_sequence->resize(length - 2);
    Tag current_best_tag = EosTag();
    for (size_t i = length - 1; i > 1; --i) {
	current_best_tag = backpointer[i][current_best_tag];
	(*tag_sequence)[i - 2] = current_best_tag;
    }
}

double HMM::ViterbiExhaustive(const IntegerizedSentence &sentence,
			      vector<Tag> *tag_sequence) const {
    // Generate all possible tag sequences.
    vector<vector<Tag> > all_tag_sequences;
    vector<Tag> seed_tags;
    PopulateAllTagSequences(seed_tags, sentence.Length(), &all_tag_sequences);

    // Enumerate each tag sequence to find the best one.
    double max_sequence_log_probability = -numeric_limits<double>::infinity();
    size_t best_sequence_index = 0;
    for (size_t i = 0; i < all_tag_sequences.size(); ++i) {
	double sequence_log_probability =
	    ComputeLogProbability(sentence, all_tag_sequences[i]);
	if (sequence_log_probability > max_sequence_log_probability) {
	    max_sequence_log_probability = sequence_log_probability;
	    best_sequence_index = i;
	}
    }
    *tag_sequence = all_tag_sequences[best_sequence_index];
    return max_sequence_log_probability;
}

double HMM::ComputeLogProbabilityExhaustive(
    const IntegerizedSentence &sentence) const {
    vector<vector<Tag> > all_tag_sequences;
    vector<Tag> seed_tags;
    PopulateAllTagSequences(seed_tags, sentence.Length(), &all_tag_sequences);

    double sum_sequence_probabilities = -numeric_limits<double>::infinity();
    for (const vector<Tag> &tag_sequence : all_tag_sequences) {
	bool consistent = true;
	for (size_t i = 0; i < tag_sequence.size(); ++i) {
	    if (!Allowed(sentence, i + 1, tag_sequence[i])) {
		consistent = false;
		break;
	    }
	}
	if (!consistent) { continue; }
	sum_sequence_probabilities = util_math::sum_logs(
	    sum_sequence_probabilities,
	    ComputeLogProbability(sentence, tag_sequence));
    }
    return sum_sequence_probabilities;
}

void HMM::PopulateAllTagSequences(const vector<Tag> &tags, size_t length,
				  vector<vector<Tag> > *all_tag_sequences)
    const {
    if (tags.size() == length) {
	all_tag_sequences->push_back(tags);
    } else {
	for (Tag tag = 0; tag < EosTag(); ++tag) {  // Real tags only.
	    vector<Tag> tags_appended = tags;
	    tags_appended.push_back(tag);
	    PopulateAllTagSequences(tags_appended, length, all_tag_sequences);
	}
    }
}

void HMM::Report(const string &report_string) const {
    if (!output_directory_.empty()) {
	ofstream log_file(LogPath(), ios::out | ios::app);
	log_file << report_string << endl;
    }
    if (verbose_) { cerr << report_string << endl; }
}
