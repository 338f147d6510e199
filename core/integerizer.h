// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// A bidirectional mapping between symbols (word or tag strings) and dense
// indices 0 ... Size() - 1. Indices are assigned in insertion order and never
// change afterwards.

#ifndef CORE_INTEGERIZER_H_
#define CORE_INTEGERIZER_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "util.h"

class Integerizer {
public:
    // Returned by Index() for a symbol not in the mapping.
    static const size_t kNone;

    // Initializes empty.
    Integerizer() { }

    // Initializes with symbols in order (duplicates are ignored).
    Integerizer(const vector<string> &symbols) {
	for (const string &symbol : symbols) { Add(symbol); }
    }

    // Adds the symbol if not already known, returns its index.
    size_t Add(const string &symbol);

    // Returns the index of the symbol, or kNone.
    size_t Index(const string &symbol) const;

    // Returns true if the symbol is in the mapping.
    bool Contains(const string &symbol) const {
	return Index(symbol) != kNone;
    }

    // Returns the symbol at the index.
    const string &Symbol(size_t index) const;

    // Returns the number of symbols.
    size_t Size() const { return symbols_.size(); }

    // Returns the symbols in index order.
    const vector<string> &symbols() const { return symbols_; }

    // Writes the symbols to a binary stream.
    void Write(ostream& file) const;

    // Reads symbols written by Write(), replacing the current content.
    void Read(istream& file);

    // Two integerizers are equal if they map the same symbols to the same
    // indices.
    bool operator==(const Integerizer &other) const {
	return symbols_ == other.symbols_;
    }
    bool operator!=(const Integerizer &other) const {
	return !(*this == other);
    }

private:
    // Maps a symbol to its index.
    unordered_map<string, size_t> index_;

    // Maps an index to its symbol.
    vector<string> symbols_;
};

#endif  // CORE_INTEGERIZER_H_
