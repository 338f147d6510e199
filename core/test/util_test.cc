// Author: Karl Stratos (stratos@cs.columbia.edu)
//
// Check the correctness of the utility code.

#include "gtest/gtest.h"

#include <algorithm>

#include "../util.h"

// Checks the string form of a printf format string.
TEST(PrintfFormatString, CheckBehavior) {
    string test_string = "TEST_STRING";
    float test_float = 3.14159;
    size_t test_long = 999999999999999;
    EXPECT_EQ("String: TEST_STRING",
	      util_string::printf_format("String: %s", test_string.c_str()));
    EXPECT_EQ("Float: 3.14", util_string::printf_format("Float: %.2f",
							test_float));
    EXPECT_EQ("Science: 3.14e+00",
	      util_string::printf_format("Science: %.2e", test_float));
    EXPECT_EQ("Long: 999999999999999",
	      util_string::printf_format("Long: %ld", test_long));
    EXPECT_EQ("Percent: 100%", util_string::printf_format("Percent: 100%%"));
}

// Checks buffering a string to a fixed length.
TEST(UtilString, BufferString) {
    EXPECT_EQ("ab  ", util_string::buffer_string("ab", 4, ' ', "left"));
    EXPECT_EQ("__ab", util_string::buffer_string("ab", 4, '_', "right"));
    EXPECT_EQ("-ab-", util_string::buffer_string("ab", 4, '-', "center"));
    EXPECT_EQ("abc", util_string::buffer_string("abcdef", 3, ' ', "left"));
}

// Test class for string tokenization.
class StringTokenization : public testing::Test {
protected:
    virtual void SetUp() {
	example_ = "I have  some\n tabs       and spaces";
    }
    string example_;
};

// Checks spliting by char delimiters.
TEST_F(StringTokenization, SplitByChars) {
    vector<string> tokens_by_whitespace;
    util_string::split_by_chars(example_, " \t\n", &tokens_by_whitespace);
    EXPECT_EQ(vector<string>({"I", "have", "some", "tabs", "and", "spaces"}),
	      tokens_by_whitespace);

    vector<string> tokens_by_letters;
    util_string::split_by_chars("a/b//c/", "/", &tokens_by_letters);
    EXPECT_EQ(vector<string>({"a", "b", "c"}), tokens_by_letters);
}

// Checks spliting by space or tab (carriage returns included).
TEST_F(StringTokenization, SplitBySpaceTab) {
    vector<string> tokens;
    util_string::split_by_space_tab("the/D  dog/N\tbarks/V\r", &tokens);
    EXPECT_EQ(vector<string>({"the/D", "dog/N", "barks/V"}), tokens);
    util_string::split_by_space_tab("   ", &tokens);
    EXPECT_EQ(0, tokens.size());
}

// Checks splitting a token at the last separator.
TEST(UtilString, SplitAtLast) {
    string prefix;
    string suffix;
    EXPECT_TRUE(util_string::split_at_last("dog/N", '/', &prefix, &suffix));
    EXPECT_EQ("dog", prefix);
    EXPECT_EQ("N", suffix);

    EXPECT_TRUE(util_string::split_at_last("1/2/CD", '/', &prefix, &suffix));
    EXPECT_EQ("1/2", prefix);
    EXPECT_EQ("CD", suffix);

    EXPECT_FALSE(util_string::split_at_last("dog", '/', &prefix, &suffix));
    EXPECT_EQ("dog", prefix);
    EXPECT_EQ("", suffix);

    EXPECT_FALSE(util_string::split_at_last("and/or/", '/', &prefix,
					    &suffix));
    EXPECT_EQ("and/or/", prefix);
    EXPECT_EQ("", suffix);

    EXPECT_FALSE(util_string::split_at_last("/", '/', &prefix, &suffix));
    EXPECT_EQ("/", prefix);
    EXPECT_EQ("", suffix);
}

// Checks converting a vector to string.
TEST(UtilString, ConvertVectorToString) {
    EXPECT_EQ("a b c", util_string::convert_to_string(
		  vector<string>({"a", "b", "c"})));
    EXPECT_EQ("", util_string::convert_to_string(vector<string>()));
}

// Checks converting a string to a count.
TEST(UtilString, ToCount) {
    EXPECT_EQ(50000, util_string::to_count("50000"));
    EXPECT_EQ(0, util_string::to_count("0"));
    EXPECT_DEATH(util_string::to_count("-1"), "nonnegative");
}

// Checks checking the existence and the type of a file.
TEST(UtilFile, FileExistsAndType) {
    string file_path = tmpnam(nullptr);
    ofstream file_out(file_path, ios::out);
    file_out.close();
    EXPECT_TRUE(util_file::exists(file_path));
    EXPECT_EQ("file", util_file::get_file_type(file_path));
    remove(file_path.c_str());
    EXPECT_FALSE(util_file::exists(file_path));

    string directory_path = tmpnam(nullptr);
    ASSERT(system(("mkdir -p " + directory_path).c_str()) == 0,
	   "Cannot create: " << directory_path);
    EXPECT_EQ("dir", util_file::get_file_type(directory_path));
    EXPECT_EQ(util_file::get_file_name(directory_path + "/model.bin"),
	      "model.bin");
    ASSERT(system(("rm -rf " + directory_path).c_str()) == 0,
	   "Cannot remove: " << directory_path);
}

// Checks writing/reading primitives and strings in a binary file.
TEST(UtilFile, BinaryWritingReading) {
    string file_path = tmpnam(nullptr);
    vector<string> symbols = {"the", "", "_BOS_WORD_", "a b"};
    {
	ofstream file(file_path, ios::out | ios::binary);
	util_file::binary_write_primitive(true, file);
	util_file::binary_write_primitive(0.25, file);
	util_file::binary_write_string("dog", file);
	util_file::binary_write_strings(symbols, file);
    }
    ifstream file(file_path, ios::in | ios::binary);
    bool flag;
    double value;
    string word;
    vector<string> symbols_read;
    util_file::binary_read_primitive(file, &flag);
    util_file::binary_read_primitive(file, &value);
    util_file::binary_read_string(file, &word);
    util_file::binary_read_strings(file, &symbols_read);
    EXPECT_TRUE(flag);
    EXPECT_EQ(0.25, value);
    EXPECT_EQ("dog", word);
    EXPECT_EQ(symbols, symbols_read);
    remove(file_path.c_str());
}

// Checks the logarithm that allows zero.
TEST(UtilMath, Log0) {
    EXPECT_EQ(-numeric_limits<double>::infinity(), util_math::log0(0.0));
    EXPECT_NEAR(log(0.3), util_math::log0(0.3), 1e-15);
    EXPECT_DEATH(util_math::log0(-1.0), "negative");
}

// Checks summing values in log space.
TEST(UtilMath, SumLogs) {
    double tol = 1e-12;
    EXPECT_NEAR(log(0.3 + 0.5), util_math::sum_logs(log(0.3), log(0.5)),
		tol);
    EXPECT_NEAR(log(0.3 + 0.5), util_math::sum_logs(log(0.5), log(0.3)),
		tol);
    EXPECT_NEAR(log(2.0) - 1000.0, util_math::sum_logs(-1000.0, -1000.0),
		tol);

    // Negligible terms are dropped.
    EXPECT_EQ(0.0, util_math::sum_logs(0.0, -50.0));

    double negative_infinity = -numeric_limits<double>::infinity();
    EXPECT_EQ(-3.0, util_math::sum_logs(negative_infinity, -3.0));
    EXPECT_EQ(-3.0, util_math::sum_logs(-3.0, negative_infinity));
    EXPECT_EQ(negative_infinity,
	      util_math::sum_logs(negative_infinity, negative_infinity));
}

// Checks detecting infinite values.
TEST(UtilMath, IsFinite) {
    EXPECT_TRUE(util_math::is_finite(-1e300));
    EXPECT_FALSE(util_math::is_finite(numeric_limits<double>::infinity()));
    EXPECT_FALSE(util_math::is_finite(-numeric_limits<double>::infinity()));
    EXPECT_FALSE(util_math::is_finite(numeric_limits<double>::quiet_NaN()));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
