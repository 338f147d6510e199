// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "integerizer.h"

const size_t Integerizer::kNone = numeric_limits<size_t>::max();

size_t Integerizer::Add(const string &symbol) {
    auto found = index_.find(symbol);
    if (found != index_.end()) { return found->second; }
    size_t index = symbols_.size();
    index_[symbol] = index;
    symbols_.push_back(symbol);
    return index;
}

size_t Integerizer::Index(const string &symbol) const {
    auto found = index_.find(symbol);
    return (found != index_.end()) ? found->second : kNone;
}

const string &Integerizer::Symbol(size_t index) const {
    ASSERT(index < symbols_.size(), "Index " << index << " out of range "
	   << symbols_.size());
    return symbols_[index];
}

void Integerizer::Write(ostream& file) const {
    util_file::binary_write_strings(symbols_, file);
}

void Integerizer::Read(istream& file) {
    vector<string> symbols;
    util_file::binary_read_strings(file, &symbols);
    index_.clear();
    symbols_.clear();
    for (const string &symbol : symbols) { Add(symbol); }
    ASSERT(symbols_.size() == symbols.size(), "Duplicate symbols in file");
}
