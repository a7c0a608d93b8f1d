#include <gtest/gtest.h>
#include "ingest/record_normalizer.hpp"
#include <sstream>

using namespace kwc;

class RecordNormalizerTest : public ::testing::Test {
protected:
    RecordNormalizer normalizer;

    std::vector<Record> load(const std::string& csv) {
        std::istringstream in(csv);
        return normalizer.load_csv(in);
    }
};

// ==========================================
// Canonicalization Tests
// ==========================================

TEST_F(RecordNormalizerTest, StripsTrailingSlashesAndFoldsCase) {
    auto records = load(
        "Landing Page,Query,Url Clicks\n"
        "https://example.com/shoes/,Running SHOES,12\n"
        "https://example.com/boots//,boots,3\n");

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].page, "https://example.com/shoes");
    EXPECT_EQ(records[0].keyword, "running shoes");
    EXPECT_EQ(records[0].clicks, 12);
    EXPECT_EQ(records[1].page, "https://example.com/boots");
}

TEST_F(RecordNormalizerTest, CanonicalPageHelpers) {
    EXPECT_EQ(RecordNormalizer::canonical_page("https://a.com/x/"), "https://a.com/x");
    EXPECT_EQ(RecordNormalizer::canonical_page("https://a.com/x"), "https://a.com/x");
    EXPECT_EQ(RecordNormalizer::canonical_page("///"), "");
    EXPECT_EQ(RecordNormalizer::fold_case("MiXeD Case"), "mixed case");
}

TEST_F(RecordNormalizerTest, ColumnsInAnyOrder) {
    auto records = load(
        "Url Clicks,Impressions,Query,Landing Page\n"
        "7,100,hat,https://a.com/hats\n");

    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].page, "https://a.com/hats");
    EXPECT_EQ(records[0].keyword, "hat");
    EXPECT_EQ(records[0].clicks, 7);
}

TEST_F(RecordNormalizerTest, HandlesBomAndCrlf) {
    auto records = load(
        "\xEF\xBB\xBFLanding Page,Query,Url Clicks\r\n"
        "https://a.com/p,q,1\r\n");

    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].clicks, 1);
    EXPECT_EQ(records[0].keyword, "q");
}

TEST_F(RecordNormalizerTest, QuotedFields) {
    auto records = load(
        "Landing Page,Query,Url Clicks\n"
        "https://a.com/p,\"shoes, cheap\",4\n"
        "https://a.com/p,\"the \"\"best\"\" shoes\",2\n");

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].keyword, "shoes, cheap");
    EXPECT_EQ(records[1].keyword, "the \"best\" shoes");
}

TEST_F(RecordNormalizerTest, SplitCsvLine) {
    auto fields = RecordNormalizer::split_csv_line("a,\"b,c\",,d");
    ASSERT_EQ(fields.size(), 4);
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "");
}

// ==========================================
// Filtering Tests
// ==========================================

TEST_F(RecordNormalizerTest, DropsFragmentsMissingAndNegative) {
    auto records = load(
        "Landing Page,Query,Url Clicks\n"
        "https://a.com/p#section,q,5\n"
        ",q,5\n"
        "https://a.com/p,,5\n"
        "https://a.com/p,q,\n"
        "https://a.com/p,q,-1\n"
        "https://a.com/p,q,0\n");

    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].clicks, 0);

    const auto& stats = normalizer.get_statistics();
    EXPECT_EQ(stats.rows_read, 6);
    EXPECT_EQ(stats.rows_kept, 1);
    EXPECT_EQ(stats.dropped_fragment, 1);
    EXPECT_EQ(stats.dropped_missing, 3);
    EXPECT_EQ(stats.dropped_negative, 1);
}

TEST_F(RecordNormalizerTest, DropsExactDuplicates) {
    auto records = load(
        "Landing Page,Query,Url Clicks\n"
        "https://a.com/p,q,5\n"
        "https://a.com/p,q,5\n"
        "https://a.com/p,q,6\n");

    EXPECT_EQ(records.size(), 2);
    EXPECT_EQ(normalizer.get_statistics().dropped_duplicate, 1);
}

TEST_F(RecordNormalizerTest, ShortRowsCountAsMissing) {
    auto records = load(
        "Landing Page,Query,Url Clicks\n"
        "https://a.com/p,q\n"
        "\n"
        "https://a.com/p,q,1\n");

    EXPECT_EQ(records.size(), 1);
    EXPECT_EQ(normalizer.get_statistics().dropped_missing, 1);
}

TEST_F(RecordNormalizerTest, HeaderOnlyGivesNoRecords) {
    auto records = load("Landing Page,Query,Url Clicks\n");
    EXPECT_TRUE(records.empty());
}

// ==========================================
// Schema Errors
// ==========================================

TEST_F(RecordNormalizerTest, MissingColumnIsSchemaError) {
    EXPECT_THROW(load("Landing Page,Query\nhttps://a.com,q\n"), SchemaError);
}

TEST_F(RecordNormalizerTest, EmptyInputIsSchemaError) {
    EXPECT_THROW(load(""), SchemaError);
}

TEST_F(RecordNormalizerTest, NonNumericClicksIsSchemaError) {
    EXPECT_THROW(load("Landing Page,Query,Url Clicks\nhttps://a.com,q,many\n"), SchemaError);
    EXPECT_THROW(load("Landing Page,Query,Url Clicks\nhttps://a.com,q,1.5\n"), SchemaError);
}

TEST_F(RecordNormalizerTest, CustomColumnNames) {
    CsvColumns cols;
    cols.page = "page";
    cols.query = "query";
    cols.clicks = "clicks";
    RecordNormalizer custom(cols);

    std::istringstream in("page,query,clicks\nhttps://a.com/x/,Q,2\n");
    auto records = custom.load_csv(in);
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].page, "https://a.com/x");
}

TEST_F(RecordNormalizerTest, MissingFileThrows) {
    EXPECT_THROW(normalizer.load_csv("/nonexistent/kwc_input.csv"), std::runtime_error);
}
