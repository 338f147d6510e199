// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "corpus.h"

namespace corpus {
    bool ends_with_sentinels(const Integerizer &integerizer,
			     const string &eos_symbol,
			     const string &bos_symbol) {
	size_t size = integerizer.Size();
	return size >= 2 && integerizer.Symbol(size - 2) == eos_symbol &&
	    integerizer.Symbol(size - 1) == bos_symbol;
    }
}  // namespace corpus

bool Sentence::IsFullyTagged() const {
    for (const string &tag : tags) {
	if (tag.empty()) { return false; }
    }
    return true;
}

Sentence Sentence::Untagged() const {
    Sentence untagged;
    for (const string &word : words) { untagged.Add(word, ""); }
    return untagged;
}

string Sentence::ToString() const {
    vector<string> tokens;
    for (size_t i = 0; i < words.size(); ++i) {
	tokens.push_back(tags[i].empty() ? words[i] :
			 words[i] + corpus::kWordTagSeparator + tags[i]);
    }
    return util_string::convert_to_string(tokens);
}

TaggedCorpus::TaggedCorpus(const string &corpus_path, size_t min_count) {
    ReadSentences(corpus_path, &sentences_);
    BuildTagset();
    BuildVocabulary(min_count);
}

TaggedCorpus::TaggedCorpus(const string &corpus_path,
			   const Integerizer &tagset,
			   const Integerizer &vocab) :
    tagset_(tagset), vocab_(vocab) {
    ReadSentences(corpus_path, &sentences_);
    CheckSentinels();
}

TaggedCorpus::TaggedCorpus(const vector<Sentence> &sentences,
			   size_t min_count) : sentences_(sentences) {
    BuildTagset();
    BuildVocabulary(min_count);
}

TaggedCorpus::TaggedCorpus(const vector<Sentence> &sentences,
			   const Integerizer &tagset,
			   const Integerizer &vocab) :
    sentences_(sentences), tagset_(tagset), vocab_(vocab) {
    CheckSentinels();
}

void TaggedCorpus::Integerize(const Sentence &sentence,
			      IntegerizedSentence *integerized_sentence)
    const {
    ASSERT(sentence.words.size() == sentence.tags.size(), "Sentence has "
	   << sentence.words.size() << " words but "
	   << sentence.tags.size() << " tags");
    integerized_sentence->words.clear();
    integerized_sentence->tags.clear();
    integerized_sentence->words.push_back(vocab_.Index(corpus::kBosWord));
    integerized_sentence->tags.push_back(tagset_.Index(corpus::kBosTag));

    size_t oov = vocab_.Index(corpus::kOovWord);
    for (size_t i = 0; i < sentence.Length(); ++i) {
	Word word = vocab_.Index(sentence.words[i]);
	if (word == Integerizer::kNone) {
	    ASSERT(oov != Integerizer::kNone, "Unknown word \""
		   << sentence.words[i] << "\" and no " << corpus::kOovWord
		   << " in the vocabulary");
	    word = oov;
	}
	Tag tag = corpus::kNoTag;
	if (!sentence.tags[i].empty()) {
	    tag = tagset_.Index(sentence.tags[i]);
	    ASSERT(tag != Integerizer::kNone, "No tag string: "
		   << sentence.tags[i]);
	}
	integerized_sentence->words.push_back(word);
	integerized_sentence->tags.push_back(tag);
    }

    integerized_sentence->words.push_back(vocab_.Index(corpus::kEosWord));
    integerized_sentence->tags.push_back(tagset_.Index(corpus::kEosTag));
}

size_t TaggedCorpus::NumWords() const {
    size_t num_words = 0;
    for (const Sentence &sentence : sentences_) {
	num_words += sentence.Length();
    }
    return num_words;
}

Sentence TaggedCorpus::ParseSentence(const string &line) {
    vector<string> tokens;
    util_string::split_by_space_tab(line, &tokens);
    Sentence sentence;
    for (const string &token : tokens) {
	string word;
	string tag;
	util_string::split_at_last(token, corpus::kWordTagSeparator, &word,
				   &tag);
	sentence.Add(word, tag);
    }
    return sentence;
}

bool TaggedCorpus::ReadSentence(ifstream *file, Sentence *sentence) {
    string line;
    while (getline(*file, line)) {
	*sentence = ParseSentence(line);
	if (sentence->Length() > 0) { return true; }  // Skip empty lines.
    }
    sentence->words.clear();
    sentence->tags.clear();
    return false;
}

void TaggedCorpus::ReadSentences(const string &corpus_path,
				 vector<Sentence> *sentences) {
    sentences->clear();
    ifstream file(corpus_path, ios::in);
    ASSERT(file.is_open(), "Cannot open " << corpus_path);
    Sentence sentence;
    while (ReadSentence(&file, &sentence)) { sentences->push_back(sentence); }
}

void TaggedCorpus::BuildTagset() {
    for (const Sentence &sentence : sentences_) {
	for (const string &tag : sentence.tags) {
	    if (tag.empty()) { continue; }
	    ASSERT(tag != corpus::kBosTag && tag != corpus::kEosTag,
		   "Reserved tag in corpus: " << tag);
	    tagset_.Add(tag);
	}
    }
    tagset_.Add(corpus::kEosTag);
    tagset_.Add(corpus::kBosTag);
    CheckSentinels();
}

void TaggedCorpus::BuildVocabulary(size_t min_count) {
    unordered_map<string, size_t> word_count;
    vector<string> word_order;
    for (const Sentence &sentence : sentences_) {
	for (const string &word : sentence.words) {
	    ASSERT(word != corpus::kBosWord && word != corpus::kEosWord,
		   "Reserved word in corpus: " << word);
	    if (word_count[word]++ == 0) { word_order.push_back(word); }
	}
    }
    for (const string &word : word_order) {
	if (word_count[word] >= min_count) { vocab_.Add(word); }
    }
    vocab_.Add(corpus::kOovWord);
    vocab_.Add(corpus::kEosWord);
    vocab_.Add(corpus::kBosWord);
    CheckSentinels();
}

void TaggedCorpus::CheckSentinels() {
    ASSERT(corpus::ends_with_sentinels(tagset_, corpus::kEosTag,
				       corpus::kBosTag),
	   "Tag set must end with " << corpus::kEosTag << ", "
	   << corpus::kBosTag);
    ASSERT(corpus::ends_with_sentinels(vocab_, corpus::kEosWord,
				       corpus::kBosWord),
	   "Vocabulary must end with " << corpus::kEosWord << ", "
	   << corpus::kBosWord);
}
