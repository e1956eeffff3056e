/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for DataLoader (table parsing and numeric conversion).

#include <gtest/gtest.h>
#include "topsis/data_loader.hpp"
#include "topsis/error.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace topsis;
using namespace topsis::core;

namespace {

/// Expect `fn` to throw a TopsisError of `kind`.
template <typename Fn>
void expect_error(Fn&& fn, ErrorKind kind) {
    try {
        fn();
        FAIL() << "expected " << to_string(kind);
    } catch (const TopsisError& ex) {
        EXPECT_EQ(ex.kind(), kind) << ex.what();
    }
}

}  // anonymous namespace

// ─── parse_number ─────────────────────────────────────────────────────────────

TEST(DataLoaderParseNumber, AcceptsPlainAndExponentForms) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("42"), 42.0);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("-0.5"), -0.5);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number(".25"), 0.25);
}

TEST(DataLoaderParseNumber, IgnoresSurroundingWhitespaceAndLeadingPlus) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("  7.5\t"), 7.5);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("+3"), 3.0);
}

TEST(DataLoaderParseNumber, RejectsNonNumericTokens) {
    EXPECT_FALSE(DataLoader::parse_number("").has_value());
    EXPECT_FALSE(DataLoader::parse_number("   ").has_value());
    EXPECT_FALSE(DataLoader::parse_number("abc").has_value());
    EXPECT_FALSE(DataLoader::parse_number("12abc").has_value());
    EXPECT_FALSE(DataLoader::parse_number("1 2").has_value());
    EXPECT_FALSE(DataLoader::parse_number("+").has_value());
    EXPECT_FALSE(DataLoader::parse_number("+-1").has_value());
}

TEST(DataLoaderParseNumber, RejectsNonFinite) {
    EXPECT_FALSE(DataLoader::parse_number("nan").has_value());
    EXPECT_FALSE(DataLoader::parse_number("inf").has_value());
    EXPECT_FALSE(DataLoader::parse_number("-inf").has_value());
    EXPECT_FALSE(DataLoader::parse_number("1e400").has_value());
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(DataLoaderParseCsv, HeaderAndRows) {
    const auto table = DataLoader::parse_csv_string(
        "Model,Price,Storage\n"
        "M1,250,16\n"
        "M2,200,32\n");
    ASSERT_EQ(table.column_count(), 3u);
    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_EQ(table.header[0], "Model");
    EXPECT_EQ(table.header[2], "Storage");
    EXPECT_EQ(table.rows[1][0], "M2");
    EXPECT_EQ(table.rows[1][2], "32");
}

TEST(DataLoaderParseCsv, CrlfAndBlankLinesAreSkipped) {
    const auto table = DataLoader::parse_csv_string(
        "\r\n"
        "Name,A,B\r\n"
        "\r\n"
        "x,1,2\r\n"
        "   \n"
        "y,3,4\r\n");
    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_EQ(table.header[2], "B");
    EXPECT_EQ(table.rows[0][2], "2");
    EXPECT_EQ(table.rows[1][0], "y");
}

TEST(DataLoaderParseCsv, NoTrailingNewline) {
    const auto table = DataLoader::parse_csv_string("Name,A,B\nx,1,2");
    ASSERT_EQ(table.row_count(), 1u);
    EXPECT_EQ(table.rows[0][2], "2");
}

TEST(DataLoaderParseCsv, QuotedFieldsKeepDelimitersAndQuotes) {
    const auto table = DataLoader::parse_csv_string(
        "Name,A,B\n"
        "\"Acme, Inc.\",1,2\n"
        "\"The \"\"Best\"\"\",3,4\n");
    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_EQ(table.rows[0][0], "Acme, Inc.");
    EXPECT_EQ(table.rows[1][0], "The \"Best\"");
    EXPECT_EQ(table.rows[1][1], "3");
}

TEST(DataLoaderParseCsv, QuoteInsideUnquotedFieldIsLiteral) {
    const auto table = DataLoader::parse_csv_string(
        "Model,Price,Size\n"
        "12\" Pizza,10,12\n"
        "16\" Pizza,15,16\n");
    ASSERT_EQ(table.row_count(), 2u);
    ASSERT_EQ(table.column_count(), 3u);
    EXPECT_EQ(table.rows[0][0], "12\" Pizza");
    EXPECT_EQ(table.rows[0][1], "10");
    EXPECT_EQ(table.rows[1][0], "16\" Pizza");
    EXPECT_EQ(table.rows[1][2], "16");
}

TEST(DataLoaderParseCsv, EmptyQuotedFieldThenLiteralQuote) {
    // `""` opens and closes an empty quoted field; a later quote is literal.
    const auto table = DataLoader::parse_csv_string("Name,A,B\n\"\"x\",1,2\n");
    ASSERT_EQ(table.row_count(), 1u);
    EXPECT_EQ(table.rows[0][0], "x\"");
    EXPECT_EQ(table.rows[0][1], "1");
}

TEST(DataLoaderParseCsv, CellsAreVerbatim) {
    const auto table = DataLoader::parse_csv_string("Name, A ,B\n x , 1,2.50\n");
    EXPECT_EQ(table.header[1], " A ");
    EXPECT_EQ(table.rows[0][0], " x ");
    EXPECT_EQ(table.rows[0][1], " 1");
    EXPECT_EQ(table.rows[0][2], "2.50");
}

TEST(DataLoaderParseCsv, AlternateDelimiter) {
    const auto table = DataLoader::parse_csv_string("Name;A;B\nx;1,5;2\n", ';');
    ASSERT_EQ(table.column_count(), 3u);
    EXPECT_EQ(table.rows[0][1], "1,5");
}

TEST(DataLoaderParseCsv, HeaderOnlyHasNoRows) {
    const auto table = DataLoader::parse_csv_string("Name,A,B\n");
    EXPECT_EQ(table.column_count(), 3u);
    EXPECT_EQ(table.row_count(), 0u);
}

TEST(DataLoaderParseCsv, EmptyContentIsMalformed) {
    expect_error([] { (void)DataLoader::parse_csv_string(""); },
                 ErrorKind::MalformedTable);
    expect_error([] { (void)DataLoader::parse_csv_string("\n\r\n  \n"); },
                 ErrorKind::MalformedTable);
}

TEST(DataLoaderParseCsv, RaggedRowIsMalformed) {
    try {
        (void)DataLoader::parse_csv_string("Name,A,B\nx,1,2\ny,3\n");
        FAIL() << "expected MalformedTable";
    } catch (const TopsisError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::MalformedTable);
        EXPECT_NE(std::string(ex.what()).find("line 3"), std::string::npos) << ex.what();
    }
}

TEST(DataLoaderParseCsv, UnterminatedQuoteIsMalformed) {
    expect_error([] { (void)DataLoader::parse_csv_string("Name,A,B\n\"x,1,2\n"); },
                 ErrorKind::MalformedTable);
}

// ─── to_decision_matrix ───────────────────────────────────────────────────────

TEST(DataLoaderDecisionMatrix, SplitsIdentifiersAndCriteria) {
    const auto table = DataLoader::parse_csv_string(
        "Model,Price,Storage\n"
        "M1,250,16\n"
        "M2, 200 ,32.5\n");
    const auto decision = DataLoader::to_decision_matrix(table);

    ASSERT_EQ(decision.identifiers.size(), 2u);
    EXPECT_EQ(decision.identifiers[0], "M1");
    EXPECT_EQ(decision.identifiers[1], "M2");
    ASSERT_EQ(decision.criteria.rows(), 2);
    ASSERT_EQ(decision.criteria.cols(), 2);
    EXPECT_DOUBLE_EQ(decision.criteria(0, 0), 250.0);
    EXPECT_DOUBLE_EQ(decision.criteria(1, 0), 200.0);
    EXPECT_DOUBLE_EQ(decision.criteria(1, 1), 32.5);
}

TEST(DataLoaderDecisionMatrix, NonNumericCellNamesColumn) {
    const auto table = DataLoader::parse_csv_string(
        "Model,Price,Storage,Camera\n"
        "M1,250,16,12\n"
        "M2,200,big,high\n");
    try {
        (void)DataLoader::to_decision_matrix(table);
        FAIL() << "expected NonNumericCriterion";
    } catch (const TopsisError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NonNumericCriterion);
        EXPECT_NE(std::string(ex.what()).find("'Storage'"), std::string::npos) << ex.what();
    }
}

TEST(DataLoaderDecisionMatrix, EmptyCellIsNonNumeric) {
    const auto table = DataLoader::parse_csv_string("Name,A,B\nx,1,\n");
    expect_error([&] { (void)DataLoader::to_decision_matrix(table); },
                 ErrorKind::NonNumericCriterion);
}

TEST(DataLoaderDecisionMatrix, IdentifierColumnMayBeNumeric) {
    const auto table = DataLoader::parse_csv_string("Id,A,B\n1,1,2\n2,3,4\n");
    const auto decision = DataLoader::to_decision_matrix(table);
    EXPECT_EQ(decision.identifiers[1], "2");
    EXPECT_EQ(decision.criteria.cols(), 2);
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(DataLoaderLoadCsv, MissingFileThrowsMissingFile) {
    const auto path = std::filesystem::temp_directory_path() / "topsis_no_such_file.csv";
    std::filesystem::remove(path);
    expect_error([&] { (void)DataLoader::load_csv(path.string()); },
                 ErrorKind::MissingFile);
}

TEST(DataLoaderLoadCsv, DirectoryIsMissingFile) {
    const auto dir = std::filesystem::temp_directory_path();
    expect_error([&] { (void)DataLoader::load_csv(dir.string()); },
                 ErrorKind::MissingFile);
}

TEST(DataLoaderLoadCsv, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "topsis_loader_read.csv";
    {
        std::ofstream out(path);
        out << "Name,A,B\nx,1,2\ny,3,4\n";
    }
    const auto table = DataLoader::load_csv(path.string());
    EXPECT_EQ(table.row_count(), 2u);
    EXPECT_EQ(table.rows[1][2], "4");
    std::filesystem::remove(path);
}
