#include <gtest/gtest.h>
#include "CSVUtils.h"
#include "DataSet.h"
#include "Preprocessor.h"
#include "SkewcycleExceptions.h"
#include "Statistics.h"

#include <fstream>
#include <sstream>
#include <string>

namespace {
std::string writeTemp(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}
}

TEST(DataSetTest, LoadsNumericCsvWithHeader) {
    const std::string path = writeTemp("skewcycle_ok.csv", "a,\"b,c\",d\n1,2,3\n\n4, 5 ,6.5e0\r\n");
    const DataSet data = DataSet::fromCSV(path);
    ASSERT_EQ(data.getColCount(), 3u);
    ASSERT_EQ(data.getRowCount(), 2u);
    EXPECT_EQ(data.getVariable(1).name, "b,c");
    EXPECT_EQ(data.column(data.getVariable("d")), (std::vector<double>{3.0, 6.5}));
    EXPECT_EQ(data.getVariable("b,c").column, 1u);
}

TEST(DataSetTest, SkipsByteOrderMarkAndHonoursDelimiter) {
    const std::string path = writeTemp("skewcycle_bom.csv", "\xEF\xBB\xBFx;y\n1;2\n3;4\n");
    const DataSet data = DataSet::fromCSV(path, ';');
    EXPECT_EQ(data.getVariable(0).name, "x");
    EXPECT_EQ(data.getRowCount(), 2u);
}

TEST(DataSetTest, DuplicateHeaderNamesAreSuffixed) {
    const std::string path = writeTemp("skewcycle_dup.csv", "x,x,\n1,2,3\n");
    const DataSet data = DataSet::fromCSV(path);
    EXPECT_EQ(data.getVariable(1).name, "x_2");
    EXPECT_EQ(data.getVariable(2).name, "column_3");
}

TEST(DataSetTest, RaggedRowIsRejected) {
    const std::string path = writeTemp("skewcycle_ragged.csv", "a,b\n1,2\n3\n");
    EXPECT_THROW(DataSet::fromCSV(path), Skewcycle::DatasetException);
}

TEST(DataSetTest, NonNumericCellIsRejected) {
    const std::string path = writeTemp("skewcycle_text.csv", "a,b\n1,2\n3,abc\n");
    try {
        DataSet::fromCSV(path);
        FAIL() << "expected DatasetException";
    } catch (const Skewcycle::DatasetException& e) {
        EXPECT_NE(std::string(e.what()).find("record 3"), std::string::npos);
    }
}

TEST(DataSetTest, EmptyInputAndMissingFile) {
    EXPECT_THROW(DataSet::fromCSV(writeTemp("skewcycle_empty.csv", "")), Skewcycle::DatasetException);
    EXPECT_THROW(DataSet::fromCSV(writeTemp("skewcycle_header_only.csv", "a,b\n")), Skewcycle::DatasetException);
    EXPECT_THROW(DataSet::fromCSV(::testing::TempDir() + "does_not_exist.csv"), Skewcycle::IOException);
}

TEST(DataSetTest, ConstructorValidatesShape) {
    EXPECT_THROW(DataSet({"a", "b"}, {{1, 2}}), Skewcycle::DatasetException);
    EXPECT_THROW(DataSet({"a", "b"}, {{1, 2}, {1}}), Skewcycle::DatasetException);
    EXPECT_THROW(DataSet({"a", "a"}, {{1}, {2}}), Skewcycle::DatasetException);
    const DataSet ok({"a"}, {{1, 2, 3}});
    EXPECT_THROW(ok.getVariable("zzz"), Skewcycle::DatasetException);
    EXPECT_EQ(ok.findVariable("zzz"), nullptr);
}

TEST(CSVUtilsTest, QuotedFieldsKeepDelimitersQuotesAndNewlines) {
    std::istringstream in("\"a \"\"b\"\"\",\"line1\r\nline2\",plain \r\nnext\n");
    bool malformed = true;
    const auto row = CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_FALSE(malformed);
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row[0], "a \"b\"");
    EXPECT_EQ(row[1], "line1\nline2");
    EXPECT_EQ(row[2], "plain");
    EXPECT_EQ(CSVUtils::parseCSVLine(in, ','), std::vector<std::string>{"next"});
    EXPECT_TRUE(CSVUtils::parseCSVLine(in, ',').empty());
}

TEST(CSVUtilsTest, ReportsUnterminatedQuoteAndLimits) {
    std::istringstream unclosed("\"never closed,1\n");
    bool malformed = false;
    CSVUtils::parseCSVLine(unclosed, ',', &malformed);
    EXPECT_TRUE(malformed);

    CSVUtils::ParseLimits limits;
    limits.maxColumns = 2;
    std::istringstream wide("1,2,3\n");
    bool limitExceeded = false;
    EXPECT_TRUE(CSVUtils::parseCSVLine(wide, ',', nullptr, &limitExceeded, limits).empty());
    EXPECT_TRUE(limitExceeded);
}

TEST(PreprocessorTest, CenterRemovesMeans) {
    DataSet data({"a", "b"}, {{1, 2, 3, 6}, {-1, -1, -1, 7}});
    const PreprocessReport report = Preprocessor::center(data);
    EXPECT_NEAR(Statistics::mean(data.column(data.getVariable("a"))), 0.0, 1e-12);
    EXPECT_NEAR(Statistics::mean(data.column(data.getVariable("b"))), 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(report.removedMeans.at("a"), 3.0);
}

TEST(PreprocessorTest, NormalScoresPreserveOrderAndTies) {
    DataSet data({"a"}, {{10, -3, 5, 5, 100}});
    const PreprocessReport report = Preprocessor::normalScores(data);
    const auto& col = data.column(data.getVariable("a"));
    EXPECT_LT(col[1], col[2]);
    EXPECT_DOUBLE_EQ(col[2], col[3]);
    EXPECT_LT(col[3], col[0]);
    EXPECT_LT(col[0], col[4]);
    EXPECT_EQ(report.tieCounts.at("a"), 2u);

    // Middle rank of five maps to the median of the normal.
    DataSet distinct({"b"}, {{3, 1, 4, 5, 2}});
    Preprocessor::normalScores(distinct);
    EXPECT_NEAR(distinct.column(distinct.getVariable("b"))[0], 0.0, 1e-9);
}

TEST(PreprocessorTest, NonparanormalIsCentered) {
    DataSet data({"a"}, {{1, 4, 9, 16, 25, 36}});
    Preprocessor::run(data, TransformMethod::NONPARANORMAL);
    EXPECT_NEAR(Statistics::mean(data.column(data.getVariable("a"))), 0.0, 1e-12);
}

TEST(PreprocessorTest, ParseMethod) {
    EXPECT_EQ(Preprocessor::parseMethod("Center"), TransformMethod::CENTER);
    EXPECT_EQ(Preprocessor::parseMethod("none"), TransformMethod::NONE);
    EXPECT_EQ(Preprocessor::parseMethod("nonparanormal"), TransformMethod::NONPARANORMAL);
    EXPECT_THROW(Preprocessor::parseMethod("log"), Skewcycle::ConfigurationException);
}
