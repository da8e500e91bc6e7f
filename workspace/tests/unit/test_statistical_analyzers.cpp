#include <gtest/gtest.h>
#include "anticheat/statistical_analyzers.h"
#include <limits>

using namespace proctor::anticheat;

namespace {

nlohmann::json patterns(const std::vector<double>& intervals, int backspaces, int characters) {
    return {
        {"keystroke_intervals", intervals},
        {"backspace_count", backspaces},
        {"total_characters", characters}
    };
}

} // namespace

// ============================================================================
// Typing Pattern Tests
// ============================================================================

TEST(TypingAnalysisTest, NaturalTyping) {
    TypingAnalysis analysis = analyzeTypingPatterns(
        patterns({100, 300, 200, 2500, 150, 250, 180, 3000, 120, 220}, 3, 30));

    EXPECT_FALSE(analysis.isSuspicious);
    EXPECT_FALSE(analysis.reason.has_value());
    ASSERT_TRUE(analysis.wpm.has_value());
    EXPECT_DOUBLE_EQ(*analysis.wpm, 51.3);
    EXPECT_DOUBLE_EQ(*analysis.meanIntervalMs, 702.0);
    EXPECT_DOUBLE_EQ(*analysis.backspaceRatio, 0.1);
    EXPECT_EQ(*analysis.pauseCount, 2);
}

TEST(TypingAnalysisTest, MetronomicTypingIsSuspicious) {
    TypingAnalysis analysis = analyzeTypingPatterns(patterns(std::vector<double>(10, 100), 0, 10));

    EXPECT_TRUE(analysis.isSuspicious);
    EXPECT_DOUBLE_EQ(*analysis.coefficientOfVariation, 0.0);
    EXPECT_EQ(*analysis.reason, UNNATURAL_TYPING_REASON);
}

TEST(TypingAnalysisTest, ImplausibleSpeedIsSuspicious) {
    TypingAnalysis analysis = analyzeTypingPatterns(
        patterns({100, 150, 120, 2100, 90, 130, 110, 160, 140, 2200}, 10, 100));

    EXPECT_TRUE(analysis.isSuspicious);
    EXPECT_GT(*analysis.wpm, 100.0);
}

TEST(TypingAnalysisTest, NoCorrectionsOnLongTextIsSuspicious) {
    TypingAnalysis analysis = analyzeTypingPatterns(
        patterns({800, 1500, 1200, 2500, 900, 1300, 1100, 3000, 1000, 1400}, 0, 120));

    EXPECT_LT(*analysis.wpm, 100.0);
    EXPECT_TRUE(analysis.isSuspicious);
    EXPECT_DOUBLE_EQ(*analysis.backspaceRatio, 0.0);
}

TEST(TypingAnalysisTest, TooFewIntervalsGivesNoVerdict) {
    TypingAnalysis analysis = analyzeTypingPatterns(patterns(std::vector<double>(9, 100), 0, 10));

    EXPECT_FALSE(analysis.isSuspicious);
    EXPECT_FALSE(analysis.wpm.has_value());
    EXPECT_FALSE(analysis.pauseCount.has_value());

    nlohmann::json j = analysis;
    EXPECT_EQ(j["is_suspicious"], false);
    EXPECT_TRUE(j["wpm"].is_null());
}

TEST(TypingAnalysisTest, MalformedInputGivesNoVerdict) {
    EXPECT_FALSE(analyzeTypingPatterns(nlohmann::json::array()).wpm.has_value());
    EXPECT_FALSE(analyzeTypingPatterns({{"keystroke_intervals", "fast"}}).wpm.has_value());

    std::vector<nlohmann::json> mixed(10, 100);
    mixed[4] = "oops";
    EXPECT_FALSE(analyzeTypingPatterns({{"keystroke_intervals", mixed}}).wpm.has_value());
}

// ============================================================================
// Code Change Tests
// ============================================================================

TEST(CodeChangeAnalysisTest, DetectsBursts) {
    CodeChangeAnalysis analysis = analyzeCodeChanges({
        {0, 60}, {2000, 5}, {10000, 80}, {11000, 3}
    });

    EXPECT_TRUE(analysis.isSuspicious);
    ASSERT_EQ(analysis.largeChanges.size(), 2u);
    EXPECT_EQ(analysis.largeChanges[0].lines, 60);
    EXPECT_EQ(analysis.largeChanges[0].timeMs, 2000);
    EXPECT_EQ(analysis.largeChanges[1].lines, 80);
    EXPECT_EQ(analysis.largeChanges[1].timeMs, 1000);
    EXPECT_EQ(*analysis.reason, FAST_CODE_CHANGE_REASON);
}

TEST(CodeChangeAnalysisTest, DeletionsCountByMagnitude) {
    CodeChangeAnalysis analysis = analyzeCodeChanges({{0, -70}, {1000, 0}});

    ASSERT_EQ(analysis.largeChanges.size(), 1u);
    EXPECT_EQ(analysis.largeChanges[0].lines, 70);
}

TEST(CodeChangeAnalysisTest, BoundariesAreExclusive) {
    EXPECT_FALSE(analyzeCodeChanges({{0, 50}, {1000, 0}}).isSuspicious);
    EXPECT_FALSE(analyzeCodeChanges({{0, 200}, {5000, 0}}).isSuspicious);
}

TEST(CodeChangeAnalysisTest, SingleRecordIsNeverSuspicious) {
    CodeChangeAnalysis analysis = analyzeCodeChanges({{0, 500}});
    EXPECT_FALSE(analysis.isSuspicious);
    EXPECT_TRUE(analysis.largeChanges.empty());
}

TEST(CodeChangeAnalysisTest, ParseHistoryAndJson) {
    auto history = parseCodeChangeHistory(nlohmann::json::parse(R"([
        {"timestamp": 1000, "lines": 75},
        "not an object",
        {"timestamp": 1500.0, "lines": 2}
    ])"));
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].timestampMs, 1500);

    nlohmann::json j = analyzeCodeChanges(history);
    EXPECT_EQ(j["is_suspicious"], true);
    EXPECT_EQ(j["large_changes_count"], 1);
    EXPECT_EQ(j["large_changes"][0]["lines"], 75);
    EXPECT_EQ(j["large_changes"][0]["time_ms"], 500);
}

TEST(CodeChangeAnalysisTest, ParseHistoryClampsExtremeValues) {
    auto history = parseCodeChangeHistory(nlohmann::json::parse(R"([
        {"timestamp": 1e300, "lines": -1e300},
        {"timestamp": 18446744073709551615, "lines": -9223372036854775808},
        {"timestamp": "soon", "lines": 3.9}
    ])"));
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].timestampMs, MAX_RECORD_MAGNITUDE);
    EXPECT_EQ(history[0].lines, -MAX_RECORD_MAGNITUDE);
    EXPECT_EQ(history[1].timestampMs, MAX_RECORD_MAGNITUDE);
    EXPECT_EQ(history[1].lines, -MAX_RECORD_MAGNITUDE);
    EXPECT_EQ(history[2].timestampMs, 0);
    EXPECT_EQ(history[2].lines, 3);
}

TEST(CodeChangeAnalysisTest, ExtremeRecordsDoNotOverflow) {
    const int64_t min = std::numeric_limits<int64_t>::min();
    const int64_t max = std::numeric_limits<int64_t>::max();

    CodeChangeAnalysis analysis = analyzeCodeChanges({{max, min}, {min, 10}, {0, 0}});

    ASSERT_EQ(analysis.largeChanges.size(), 1u);
    EXPECT_EQ(analysis.largeChanges[0].lines, MAX_RECORD_MAGNITUDE);
    EXPECT_EQ(analysis.largeChanges[0].timeMs, -2 * MAX_RECORD_MAGNITUDE);
}
