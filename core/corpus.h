// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Code for processing tagged text corpora. A corpus file has one sentence per
// line with whitespace-separated tokens of the form "word/tag" (tag known) or
// "word" (tag unknown):
//
//    the/D dog/N barked .
//
// The tag set and vocabulary of a corpus end with the sentinel symbols
// (end-of-sequence, then start-of-sequence), which integerized sentences
// carry at their first and last positions.

#ifndef CORE_CORPUS_H_
#define CORE_CORPUS_H_

#include <fstream>
#include <string>
#include <vector>

#include "integerizer.h"
#include "util.h"

typedef size_t Word;
typedef size_t Tag;

namespace corpus {
    // Special strings for the sentinel words and tags.
    const string kBosWord = "_BOS_WORD_";
    const string kEosWord = "_EOS_WORD_";
    const string kBosTag = "_BOS_TAG_";
    const string kEosTag = "_EOS_TAG_";

    // Special string for representing words outside the vocabulary.
    const string kOovWord = "_OOV_";

    // Separates a word from its tag in a corpus token.
    const char kWordTagSeparator = '/';

    // Index of an unknown tag in an integerized sentence.
    const Tag kNoTag = numeric_limits<size_t>::max();

    // Returns true if the last two symbols are exactly (eos, bos).
    bool ends_with_sentinels(const Integerizer &integerizer,
			     const string &eos_symbol,
			     const string &bos_symbol);
}  // namespace corpus

// A sentence of words with optional tags. An empty tag string means the tag
// is unknown.
struct Sentence {
    vector<string> words;
    vector<string> tags;

    // Returns the number of words.
    size_t Length() const { return words.size(); }

    // Appends a word with a (possibly empty) tag.
    void Add(const string &word, const string &tag) {
	words.push_back(word);
	tags.push_back(tag);
    }

    // Returns true if every tag is known.
    bool IsFullyTagged() const;

    // Returns a copy with all tags removed.
    Sentence Untagged() const;

    // Returns the corpus-file form: "w1/t1 w2 w3/t3".
    string ToString() const;
};

// A sentence over word/tag indices. Position 0 holds the start sentinels,
// position Length() + 1 the end sentinels.
struct IntegerizedSentence {
    vector<Word> words;
    vector<Tag> tags;  // corpus::kNoTag where the tag is unknown.

    // Returns the number of words excluding the sentinels.
    size_t Length() const { return words.size() - 2; }
};

// A TaggedCorpus holds sentences together with the tag set and vocabulary
// they are integerized against.
class TaggedCorpus {
public:
    // Reads sentences from a file and builds the tag set and vocabulary from
    // them. Words occurring fewer than min_count times map to corpus::kOovWord.
    TaggedCorpus(const string &corpus_path, size_t min_count);

    // Reads sentences from a file, reusing an existing tag set and vocabulary.
    TaggedCorpus(const string &corpus_path, const Integerizer &tagset,
		 const Integerizer &vocab);

    // Builds from sentences in memory (tag set and vocabulary as above).
    TaggedCorpus(const vector<Sentence> &sentences, size_t min_count);

    // Uses sentences in memory with an existing tag set and vocabulary.
    TaggedCorpus(const vector<Sentence> &sentences, const Integerizer &tagset,
		 const Integerizer &vocab);

    // Converts a sentence to indices with sentinels added. Words outside the
    // vocabulary map to corpus::kOovWord; a tag outside the tag set is fatal.
    void Integerize(const Sentence &sentence,
		    IntegerizedSentence *integerized_sentence) const;

    // Returns the number of sentences.
    size_t NumSentences() const { return sentences_.size(); }

    // Returns the total number of words (sentinels excluded).
    size_t NumWords() const;

    // Returns the sentences.
    const vector<Sentence> &sentences() const { return sentences_; }

    // Returns the tag set.
    const Integerizer &tagset() const { return tagset_; }

    // Returns the vocabulary.
    const Integerizer &vocab() const { return vocab_; }

    // Iteration over sentences (restartable).
    vector<Sentence>::const_iterator begin() const {
	return sentences_.begin();
    }
    vector<Sentence>::const_iterator end() const { return sentences_.end(); }

    // Parses a line of whitespace-separated tokens "word/tag" or "word".
    static Sentence ParseSentence(const string &line);

    // Reads a line from a corpus file. Returns true if success, false if there
    // is no more non-empty line: while (ReadSentence(...)) { /* process */ }
    static bool ReadSentence(ifstream *file, Sentence *sentence);

    // Reads all sentences in a corpus file.
    static void ReadSentences(const string &corpus_path,
			      vector<Sentence> *sentences);

private:
    // Builds the tag set: tags in first-seen order, then the sentinels.
    void BuildTagset();

    // Builds the vocabulary: words with count >= min_count in first-seen
    // order, then corpus::kOovWord, then the sentinels.
    void BuildVocabulary(size_t min_count);

    // Checks that the tag set and vocabulary end with the sentinels.
    void CheckSentinels();

    // Sentences in file order.
    vector<Sentence> sentences_;

    // Tag set.
    Integerizer tagset_;

    // Vocabulary.
    Integerizer vocab_;
};

#endif  // CORE_CORPUS_H_
