// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Various utility functions for the C++ standard library.

#ifndef CORE_UTIL_H_
#define CORE_UTIL_H_

#include <math.h>
#include <stdarg.h>
#include <stdlib.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

// Assert macro that allows adding a message to an assertion upon failure. It
// implictly performs string conversion: ASSERT(x > 0, "Negative x: " << x);
#ifndef NDEBUG
#   define ASSERT(condition, message) \
    do { \
	if (! (condition)) { \
	    cerr << "Assertion `" #condition "` failed in " << __FILE__ \
		      << " line " << __LINE__ << ": " << message << endl; \
	    exit(EXIT_FAILURE); \
	} \
    } while (false)
#else
#   define ASSERT(condition, message) do { } while (false)
#endif

namespace util_string {
    // Buffers a string to have a certain length.
    string buffer_string(const string &given_string, size_t length,
			 char buffer_char, const string &align);

    // Returns the string form of a printf format string.
    string printf_format(const char *format, ...);

    // Splits a line by char delimiters.
    void split_by_chars(const string &line, const string &char_delimiters,
			vector<string> *tokens);

    // Splits a line by space or tab.
    void split_by_space_tab(const string &line, vector<string> *tokens);

    // Splits a token at the last occurrence of the separator char:
    // "1/2/CD" -> ("1/2", "CD"). Returns false (and sets only the prefix) if
    // the separator does not occur or would leave an empty prefix or suffix.
    bool split_at_last(const string &token, char separator, string *prefix,
		       string *suffix);

    // Converts a string vector to string.
    string convert_to_string(const vector<string> &sequence);

    // Converts a string to a nonnegative integer, dying on a negative value.
    size_t to_count(const string &value);
}  // namespace util_string

namespace util_file {
    // Gets the file name from a file path.
    string get_file_name(string file_path);

    // Returns true if the file exists, false otherwise.
    bool exists(const string &file_path);

    // Returns the type of the given file path: "file", "dir", or "other".
    string get_file_type(const string &file_path);

    // Writes a primitive value to a binary file.
    // *WARNING* Do not pass a value stored in a temporary variable!
    //     // binary_write_primiative(0, file);  // Bad: undefined behavior
    //     size_t zero = 0;
    //     binary_write_primiative(zero, file);  // Good
    template<typename T>
    void binary_write_primitive(const T &value, ostream& file){
	file.write(reinterpret_cast<const char *>(&value), sizeof(T));
    }

    // Reads a primitive value from a binary file.
    template<typename T>
    void binary_read_primitive(istream& file, T *value){
	file.read(reinterpret_cast<char*>(value), sizeof(T));
    }

    // Writes a string to a binary file.
    void binary_write_string(const string &value, ostream& file);

    // Reads a string from a binary file.
    void binary_read_string(istream& file, string *value);

    // Writes a string vector (length first) to a binary file.
    void binary_write_strings(const vector<string> &values, ostream& file);

    // Reads a string vector written by binary_write_strings.
    void binary_read_strings(istream& file, vector<string> *values);
}  // namespace util_file

namespace util_math {
    // Returns -inf if a = 0, returns log(a) otherwise (error if a < 0).
    double log0(double a);

    // Given two log values log(a) and log(b), computes log(a + b) without
    // exponentiating log(a) and log(b).
    double sum_logs(double log_a, double log_b);

    // Returns true if the value is neither infinite nor NaN.
    inline bool is_finite(double value) {
	return value > -numeric_limits<double>::infinity() &&
	    value < numeric_limits<double>::infinity();
    }
}  // namespace util_math

#endif  // CORE_UTIL_H_
