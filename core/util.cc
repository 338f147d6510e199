// Author: Karl Stratos (stratos@cs.columbia.edu)

#include "util.h"

#include <libgen.h>
#include <string.h>
#include <sys/stat.h>

namespace util_string {
    string buffer_string(const string &given_string, size_t length,
			 char buffer_char, const string &align) {
	string buffered_string =
	    given_string.substr(0, min(given_string.size(), length));
	bool left_turn = true;  // For align = "center".
	string buffer(1, buffer_char);
	while (buffered_string.size() < length) {
	    if (align == "left" || (align == "center" && left_turn)) {
		buffered_string = buffered_string + buffer;
		left_turn = false;
	    } else if (align == "right" || (align == "center" && !left_turn)) {
		buffered_string = buffer + buffered_string;
		left_turn = true;
	    } else {
		ASSERT(false, "Unknown alignment method: " << align);
	    }
	}
	return buffered_string;
    }

    string printf_format(const char *format, ...) {
	char buffer[16384];
	va_list variable_argument_list;
	va_start(variable_argument_list, format);
	vsnprintf(buffer, sizeof(buffer), format, variable_argument_list);
	va_end(variable_argument_list);
	return buffer;
    }

    void split_by_chars(const string &line, const string &char_delimiters,
			vector<string> *tokens) {
	tokens->clear();
	size_t start = 0;  // Keep track of the current position.
	size_t end = 0;
	string token;
	while (end != string::npos) {
	    // Find the first index a delimiter char occurs.
	    end = line.find_first_of(char_delimiters, start);

	    // Collect a corresponding portion of the line into a token.
	    token = (end == string::npos) ? line.substr(start, string::npos) :
		line.substr(start, end - start);
	    if(token != "") { tokens->push_back(token); }

	    // Update the current position.
	    start = (end > string::npos - 1) ?  string::npos : end + 1;
	}
    }

    void split_by_space_tab(const string &line, vector<string> *tokens) {
	split_by_chars(line, " \t\r\n", tokens);
    }

    bool split_at_last(const string &token, char separator, string *prefix,
		       string *suffix) {
	size_t position = token.find_last_of(separator);
	if (position == string::npos || position == 0 ||
	    position + 1 == token.size()) {
	    *prefix = token;
	    suffix->clear();
	    return false;
	}
	*prefix = token.substr(0, position);
	*suffix = token.substr(position + 1);
	return true;
    }

    string convert_to_string(const vector<string> &sequence) {
	string sequence_string;
	for (size_t i = 0; i < sequence.size(); ++i) {
	    sequence_string += sequence[i];
	    if (i < sequence.size() - 1) { sequence_string += " "; }
	}
	return sequence_string;
    }

    size_t to_count(const string &value) {
	long count = stol(value);
	ASSERT(count >= 0, "Expected a nonnegative integer: " << value);
	return count;
    }
}  // namespace util_string

namespace util_file {
    string get_file_name(string file_path) {
	return string(basename(const_cast<char *>(file_path.c_str())));
    }

    bool exists(const string &file_path) {
	struct stat buffer;
	return (stat(file_path.c_str(), &buffer) == 0);
    }

    string get_file_type(const string &file_path) {
	string file_type;
	struct stat stat_buffer;
	if (stat(file_path.c_str(), &stat_buffer) == 0) {
	    if (S_ISREG(stat_buffer.st_mode)) {
		file_type = "file";
	    } else if (S_ISDIR(stat_buffer.st_mode)) {
		file_type = "dir";
	    } else {
		file_type = "other";
	    }
	} else {
	    ASSERT(false, "Problem with " << file_path);
	}
	return file_type;
    }

    void binary_write_string(const string &value, ostream& file) {
	size_t string_length = value.length();
	binary_write_primitive(string_length, file);
	file.write(value.c_str(), string_length);
    }

    void binary_read_string(istream& file, string *value){
	size_t string_length;
	binary_read_primitive(file, &string_length);
	ASSERT(file.good(), "Truncated string in binary file");
	value->assign(string_length, '\0');
	if (string_length > 0) { file.read(&(*value)[0], string_length); }
    }

    void binary_write_strings(const vector<string> &values, ostream& file) {
	size_t num_values = values.size();
	binary_write_primitive(num_values, file);
	for (const string &value : values) { binary_write_string(value, file); }
    }

    void binary_read_strings(istream& file, vector<string> *values) {
	values->clear();
	size_t num_values;
	binary_read_primitive(file, &num_values);
	ASSERT(file.good(), "Truncated string list in binary file");
	values->resize(num_values);
	for (size_t i = 0; i < num_values; ++i) {
	    binary_read_string(file, &(*values)[i]);
	}
    }
}  // namespace util_file

namespace util_math {
    double log0(double a) {
	if (a > 0.0) {
	    return log(a);
	} else if (a == 0.0) {
	    return -numeric_limits<double>::infinity();
	}
	ASSERT(false, "Cannot take log of negative value: " << a);
	return numeric_limits<double>::quiet_NaN();
    }

    double sum_logs(double log_a, double log_b) {
	if (log_a < log_b) {
	    double temp = log_a;
	    log_a = log_b;
	    log_b = temp;
	}
	if (log_a <= -numeric_limits<double>::infinity()) { return log_a; }

	double negative_difference = log_b - log_a;
	return (negative_difference < -20) ?
	    log_a : log_a + log1p(exp(negative_difference));
    }
}  // namespace util_math
