// Author: Karl Stratos (stratos@cs.columbia.edu)

#include <iostream>
#include <memory>
#include <string>

#include "core/util.h"
#include "hmm.h"
#include "tagger_eval.h"

int main (int argc, char* argv[]) {
    string output_directory;
    string train_path;
    string development_path;
    string data_path;
    string prediction_path;
    double lambda = 0.0;
    double tolerance = 0.001;
    size_t max_steps = 50000;
    bool unigram = false;
    size_t seed = 1337;
    size_t min_count = 1;
    string loss_name = "cross_entropy";
    bool verbose = true;

    // If appropriate, display default options and then close the program.
    bool display_options_and_quit = false;
    for (int i = 1; i < argc; ++i) {
	string arg = (string) argv[i];
	if (arg == "--help" || arg == "-h"){ display_options_and_quit = true; }
    }
    if (argc == 1 || display_options_and_quit) {
	cout << "--output [-]:        \t"
	     << "path to an output directory (model, log)" << endl;
	cout << "--train [-]:        \t"
	     << "path to a training corpus (tags optional)" << endl;
	cout << "--dev [-]:          \t"
	     << "path to a development corpus for the training loss" << endl;
	cout << "--data [-]:         \t"
	     << "path to a corpus to evaluate and tag" << endl;
	cout << "--pred [-]:         \t"
	     << "path to write Viterbi predictions on --data" << endl;
	cout << "--lambda [" << lambda << "]:       \t"
	     << "add-lambda smoothing in re-estimation" << endl;
	cout << "--tol [" << tolerance << "]:       \t"
	     << "stop when the relative loss improvement is below this"
	     << endl;
	cout << "--maxsteps [" << max_steps << "]:  \t"
	     << "maximum number of EM epochs" << endl;
	cout << "--unigram:          \t"
	     << "use transitions that ignore the previous tag?" << endl;
	cout << "--seed [" << seed << "]:       \t"
	     << "random seed for initialization" << endl;
	cout << "--mincount [" << min_count << "]:     \t"
	     << "words occurring less than this become " << corpus::kOovWord
	     << endl;
	cout << "--loss [" << loss_name << "]: \t"
	     << "training loss: cross_entropy, error_rate" << endl;
	cout << "--quiet, -q:          \t"
	     << "do not print messages to stderr?" << endl;
	cout << "--help, -h:           \t"
	     << "show options and quit?" << endl;
	exit(0);
    }

    // Parse command line arguments.
    for (int i = 1; i < argc; ++i) {
	string arg = (string) argv[i];
	if (i + 1 >= argc && arg != "--unigram" && arg != "--quiet" &&
	    arg != "-q") {
	    cerr << "Missing value for \"" << arg << "\"" << endl;
	    exit(-1);
	}
	if (arg == "--output") {
	    output_directory = argv[++i];
	} else if (arg == "--train") {
	    train_path = argv[++i];
	} else if (arg == "--dev") {
	    development_path = argv[++i];
	} else if (arg == "--data") {
	    data_path = argv[++i];
	} else if (arg == "--pred") {
	    prediction_path = argv[++i];
	} else if (arg == "--lambda") {
	    lambda = stod(argv[++i]);
	} else if (arg == "--tol") {
	    tolerance = stod(argv[++i]);
	} else if (arg == "--maxsteps") {
	    max_steps = util_string::to_count(argv[++i]);
	} else if (arg == "--unigram") {
	    unigram = true;
	} else if (arg == "--seed") {
	    seed = util_string::to_count(argv[++i]);
	} else if (arg == "--mincount") {
	    min_count = util_string::to_count(argv[++i]);
	} else if (arg == "--loss") {
	    loss_name = argv[++i];
	} else if (arg == "--quiet" || arg == "-q") {
	    verbose = false;
	} else {
	    cerr << "Invalid argument \"" << arg << "\": run the command with "
		 << "-h or --help to see possible arguments." << endl;
	    exit(-1);
	}
    }
    ASSERT(!output_directory.empty(), "Need --output");
    ASSERT(prediction_path.empty() || !data_path.empty(),
	   "--pred needs --data");
    ASSERT(loss_name == "cross_entropy" || loss_name == "error_rate",
	   "Unknown loss: " << loss_name);

    HMM hmm;
    if (!train_path.empty()) {
	TaggedCorpus train_corpus(train_path, min_count);
	hmm = HMM(train_corpus.tagset(), train_corpus.vocab(), unigram, seed);
	hmm.set_verbose(verbose);
	hmm.SetOutputDirectory(output_directory);

	// Without a development corpus, the loss is measured on training data.
	unique_ptr<TaggedCorpus> development_corpus;
	if (!development_path.empty()) {
	    development_corpus.reset(new TaggedCorpus(
		development_path, train_corpus.tagset(),
		train_corpus.vocab()));
	}
	const TaggedCorpus &loss_corpus = (development_corpus) ?
	    *development_corpus : train_corpus;
	function<double(const HMM &)> loss;
	if (loss_name == "cross_entropy") {
	    loss = [&loss_corpus](const HMM &model) {
		return eval_tagger::cross_entropy(model, loss_corpus);
	    };
	} else {
	    loss = [&loss_corpus](const HMM &model) {
		return eval_tagger::error_rate(model, loss_corpus, nullptr,
					       nullptr);
	    };
	}

	TrainingState state = hmm.Train(train_corpus, loss, lambda, tolerance,
					 max_steps, hmm.ModelPath());
	if (state != TrainingState::kConverged) {
	    cerr << "Training " << TrainingStateString(state) << endl;
	    exit(EXIT_FAILURE);
	}
	hmm.WriteModelInfo();
    } else {
	hmm.set_verbose(verbose);
	hmm.SetOutputDirectory(output_directory);
	hmm.Load();
    }

    if (!data_path.empty()) {
	TaggedCorpus data_corpus(data_path, hmm.tagset(), hmm.vocab());
	double cross_entropy = eval_tagger::cross_entropy(hmm, data_corpus);
	double known_error_rate;
	double novel_error_rate;
	double error_rate = eval_tagger::error_rate(hmm, data_corpus,
						    &known_error_rate,
						    &novel_error_rate);
	cout << util_string::printf_format(
	    "%s:   cross-entropy %.4f bits/token   error rate %.4f "
	    "(known %.4f, novel %.4f)",
	    util_file::get_file_name(data_path).c_str(), cross_entropy,
	    error_rate, known_error_rate, novel_error_rate) << endl;
	if (!prediction_path.empty()) {
	    vector<Sentence> predictions;
	    eval_tagger::tag_corpus(hmm, data_corpus, &predictions);
	    eval_tagger::write_sentences(predictions, prediction_path);
	}
    }
}
