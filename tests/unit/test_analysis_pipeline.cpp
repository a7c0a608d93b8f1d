#include <gtest/gtest.h>
#include "pipeline/analysis_pipeline.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace kwc;

namespace {

std::string temp_path(const std::string& suffix) {
    return "/tmp/kwc_test_" + std::to_string(getpid()) + "_" + suffix;
}

// Two pages sharing the same ten queries plus one unrelated page
std::string sample_csv() {
    std::ostringstream csv;
    csv << "Landing Page,Query,Url Clicks\n";
    for (int i = 0; i < 10; ++i) {
        csv << "https://shop.com/shoes/,Running Shoes " << i << "," << (i == 0 ? 50 : 0) << "\n";
        csv << "https://shop.com/sneakers,running shoes " << i << "," << (i == 0 ? 80 : 0) << "\n";
        csv << "https://shop.com/hats,hat " << i << ",3\n";
    }
    // Noise the normalizer drops
    csv << "https://shop.com/shoes#reviews,running shoes 1,9\n";
    csv << "https://shop.com/hats,hat 0,-4\n";
    return csv.str();
}

}  // namespace

class AnalysisPipelineTest : public ::testing::Test {
protected:
    AnalysisConfig config;

    void SetUp() override {
        config.verbose = false;
        config.num_threads = 2;
    }
};

// ==========================================
// End-to-end
// ==========================================

TEST_F(AnalysisPipelineTest, FindsCannibalizingPages) {
    AnalysisPipeline pipeline(config);
    std::istringstream in(sample_csv());
    auto result = pipeline.run_stream(in, "sample.csv");

    EXPECT_EQ(result.profiles.size(), 3);
    ASSERT_EQ(result.report.groups.size(), 1);

    const auto& g = result.report.groups[0];
    EXPECT_EQ(g.representative_url, "https://shop.com/sneakers");
    EXPECT_EQ(g.representative_clicks, 80);
    ASSERT_EQ(g.members.size(), 1);
    EXPECT_EQ(g.members[0].url, "https://shop.com/shoes");
    EXPECT_EQ(g.members[0].shared_count, 10);
    EXPECT_EQ(g.common_term_count(), 10);

    EXPECT_EQ(result.report.source_path, "sample.csv");
    EXPECT_DOUBLE_EQ(result.report.threshold, 0.8);
}

TEST_F(AnalysisPipelineTest, StatisticsCoverEveryStage) {
    AnalysisPipeline pipeline(config);
    std::istringstream in(sample_csv());
    pipeline.run_stream(in);

    auto stats = pipeline.get_statistics();
    EXPECT_EQ(stats.input.rows_read, 32);
    EXPECT_EQ(stats.input.rows_kept, 30);
    EXPECT_EQ(stats.input.dropped_fragment, 1);
    EXPECT_EQ(stats.input.dropped_negative, 1);
    EXPECT_EQ(stats.pages, 3);
    EXPECT_EQ(stats.eligible_pages, 3);
    EXPECT_EQ(stats.unique_keywords, 20);
    EXPECT_EQ(stats.groups, 1);
    EXPECT_EQ(stats.grouped_pages, 2);
    EXPECT_GE(stats.total_time_seconds, 0.0);

    auto j = stats.to_json();
    EXPECT_EQ(j["groups"], 1);
    EXPECT_EQ(j["input"]["rows_kept"], 30);
}

TEST_F(AnalysisPipelineTest, HigherMinimumDisablesSources) {
    config.min_keywords = 11;
    AnalysisPipeline pipeline(config);
    std::istringstream in(sample_csv());
    auto result = pipeline.run_stream(in);
    EXPECT_TRUE(result.report.groups.empty());
    EXPECT_EQ(pipeline.get_statistics().eligible_pages, 0);
}

TEST_F(AnalysisPipelineTest, EmptyInputGivesEmptyReport) {
    AnalysisPipeline pipeline(config);
    std::istringstream in("Landing Page,Query,Url Clicks\n");
    auto result = pipeline.run_stream(in);
    EXPECT_TRUE(result.profiles.empty());
    EXPECT_TRUE(result.groups.empty());
    EXPECT_TRUE(result.report.groups.empty());
}

TEST_F(AnalysisPipelineTest, SchemaErrorStopsTheRun) {
    AnalysisPipeline pipeline(config);
    std::istringstream in("Page,Query,Clicks\nhttps://a.com,q,1\n");
    EXPECT_THROW(pipeline.run_stream(in), SchemaError);
}

TEST_F(AnalysisPipelineTest, RunFromFile) {
    std::string path = temp_path("input.csv");
    {
        std::ofstream f(path);
        f << sample_csv();
    }

    AnalysisPipeline pipeline(config);
    auto result = pipeline.run_file(path);
    EXPECT_EQ(result.report.groups.size(), 1);
    EXPECT_EQ(result.report.source_path, path);
    std::remove(path.c_str());

    EXPECT_THROW(pipeline.run_file(path), std::runtime_error);
}

TEST_F(AnalysisPipelineTest, RunRecordsDirectly) {
    std::vector<Record> records;
    for (int i = 0; i < 10; ++i) {
        records.push_back({"https://a.com/x", "q" + std::to_string(i), 1, 0});
        records.push_back({"https://a.com/y", "q" + std::to_string(i), 2, 0});
    }

    AnalysisPipeline pipeline(config);
    auto result = pipeline.run_records(records);
    ASSERT_EQ(result.groups.size(), 1);
    EXPECT_EQ(result.report.groups[0].representative_url, "https://a.com/y");
    EXPECT_EQ(result.report.groups[0].representative_clicks, 20);
}

TEST_F(AnalysisPipelineTest, ReportsProgress) {
    AnalysisPipeline pipeline(config);
    std::vector<std::string> stages;
    pipeline.set_progress_callback([&](const std::string& stage, int, int, const std::string&) {
        if (stages.empty() || stages.back() != stage) stages.push_back(stage);
    });

    std::istringstream in(sample_csv());
    pipeline.run_stream(in);

    std::vector<std::string> expected = {
        "Loading", "Profiles", "Index", "Matching", "Grouping", "Done"
    };
    EXPECT_EQ(stages, expected);
}

// ==========================================
// Configuration
// ==========================================

TEST_F(AnalysisPipelineTest, InvalidConfigRejected) {
    config.threshold = 1.5;
    EXPECT_THROW(AnalysisPipeline pipeline(config), std::invalid_argument);

    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());

    config.threshold = 0.5;
    config.query_column = config.page_column;
    EXPECT_FALSE(config.validate(error));
}

TEST_F(AnalysisPipelineTest, ConfigFileRoundTrip) {
    std::string path = temp_path("config.json");
    config.threshold = 0.65;
    config.min_keywords = 4;
    config.page_column = "page";
    config.to_json_file(path);

    auto loaded = AnalysisConfig::from_json_file(path);
    EXPECT_DOUBLE_EQ(loaded.threshold, 0.65);
    EXPECT_EQ(loaded.min_keywords, 4);
    EXPECT_EQ(loaded.page_column, "page");
    EXPECT_FALSE(loaded.verbose);
    std::remove(path.c_str());
}

TEST_F(AnalysisPipelineTest, MalformedConfigFile) {
    std::string path = temp_path("bad.json");
    {
        std::ofstream f(path);
        f << "{ \"threshold\": ";
    }
    EXPECT_THROW(AnalysisConfig::from_json_file(path), std::runtime_error);
    std::remove(path.c_str());

    EXPECT_THROW(AnalysisConfig::from_json_file("/nonexistent/kwc.json"), std::runtime_error);
}

TEST_F(AnalysisPipelineTest, EnvironmentOverrides) {
    setenv("KWC_THRESHOLD", "0.3", 1);
    setenv("KWC_MIN_KEYWORDS", "7", 1);
    setenv("KWC_THREADS", "3", 1);

    AnalysisConfig env_config;
    env_config.apply_environment();
    EXPECT_DOUBLE_EQ(env_config.threshold, 0.3);
    EXPECT_EQ(env_config.min_keywords, 7);
    EXPECT_EQ(env_config.num_threads, 3);

    setenv("KWC_THRESHOLD", "high", 1);
    EXPECT_THROW(env_config.apply_environment(), std::invalid_argument);

    unsetenv("KWC_THRESHOLD");
    unsetenv("KWC_MIN_KEYWORDS");
    unsetenv("KWC_THREADS");
}

TEST_F(AnalysisPipelineTest, ThreadCountOutsideIntRejected) {
    EXPECT_EQ(to_thread_count(8, "--threads"), 8);
    EXPECT_THROW(to_thread_count(4294967297LL, "--threads"), std::invalid_argument);
    EXPECT_THROW(to_thread_count(-4294967297LL, "--threads"), std::invalid_argument);

    // 2^32 + 1 would wrap to 1 if narrowed
    setenv("KWC_THREADS", "4294967297", 1);
    AnalysisConfig env_config;
    EXPECT_THROW(env_config.apply_environment(), std::invalid_argument);
    unsetenv("KWC_THREADS");

    std::string path = temp_path("threads.json");
    {
        std::ofstream f(path);
        f << "{ \"num_threads\": 4294967297 }";
    }
    EXPECT_THROW(AnalysisConfig::from_json_file(path), std::invalid_argument);
    std::remove(path.c_str());
}
