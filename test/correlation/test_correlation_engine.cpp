/**
 * @file test_correlation_engine.cpp
 * @brief CorrelationEngine tests
 *
 * Uses test_data/bag_patent.txt and its OCR detections (bag_patent.json):
 *   100 (0.97) + overlapping 1OO (0.71), 12O, b00, 250 (0.42), "FIG. 1", 35O
 */

#include <gtest/gtest.h>
#include "correlation/correlation_engine.h"
#include "correlation/detection_io.h"
#include "../test_support.h"

using namespace refnum;
using refnum_test::Quad;

namespace {

const char* const kBagSentence = "The bag has a flexible main body 100 and a front flap 120.";

const char* const kCompetingLabels =
    "The flexible main body 100 is soft. The main body of the invention 100 is large.";

} // namespace

class CorrelationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = refnum_test::Model();
        ASSERT_NE(model_, nullptr);
        engine_ = std::make_unique<CorrelationEngine>(config_, model_);
    }

    CorrelationConfig config_;
    std::shared_ptr<const LanguageModel> model_;
    std::unique_ptr<CorrelationEngine> engine_;
};

// ==================== chooseLabel ====================

TEST(ChooseLabel, ShortestWins) {
    EXPECT_EQ(CorrelationEngine::chooseLabel({"front flap", "flap", "lid"}, LabelPolicy::Shortest), "lid");
    EXPECT_EQ(CorrelationEngine::chooseLabel({"ab", "cd"}, LabelPolicy::Shortest), "ab");
}

TEST(ChooseLabel, MostFrequentWins) {
    EXPECT_EQ(CorrelationEngine::chooseLabel({"front flap", "flap", "front flap"}, LabelPolicy::MostFrequent),
              "front flap");
    // Equal counts fall back to the shortest
    EXPECT_EQ(CorrelationEngine::chooseLabel({"flap", "lid", "flap", "lid"}, LabelPolicy::MostFrequent), "lid");
}

TEST(ChooseLabel, NoCandidates) {
    EXPECT_EQ(CorrelationEngine::chooseLabel({}, LabelPolicy::Shortest), "");
    EXPECT_EQ(CorrelationEngine::chooseLabel({}, LabelPolicy::MostFrequent), "");
}

// ==================== extractAndNormalize ====================

TEST_F(CorrelationEngineTest, ExtractAndNormalizeBagSentence) {
    NumeralLabelMap labels = engine_->extractAndNormalize(kBagSentence);

    NumeralLabelMap expected = {{"100", "flexible main body"}, {"120", "front flap"}};
    EXPECT_EQ(labels, expected);
}

TEST_F(CorrelationEngineTest, ExtractAndNormalizeEmptyText) {
    EXPECT_TRUE(engine_->extractAndNormalize("").empty());
    EXPECT_TRUE(engine_->extractAndNormalize("No numbers here.").empty());
}

// ==================== correlate ====================

TEST_F(CorrelationEngineTest, NoDetectionsEqualsTextOnly) {
    std::string text = refnum_test::ReadText(refnum_test::DataPath("bag_patent.txt"));
    ASSERT_FALSE(text.empty());

    EXPECT_EQ(engine_->correlate(text, {}), engine_->extractAndNormalize(text));
}

TEST_F(CorrelationEngineTest, ShortestCandidateChosenForDetectedNumeral) {
    std::vector<Detection> detections = {Detection(Quad(0, 0, 40, 18), "100", 0.95f)};

    CorrelationStats stats;
    NumeralLabelMap labels = engine_->correlate(kCompetingLabels, detections, &stats);

    ASSERT_EQ(labels.count("100"), 1u);
    EXPECT_EQ(labels.at("100"), "flexible main body");
    EXPECT_EQ(stats.confirmedNumerals, 1);
    EXPECT_EQ(stats.textOnlyNumerals, 0);
}

TEST_F(CorrelationEngineTest, TextOnlyNumeralsKept) {
    std::vector<Detection> detections = {Detection(Quad(0, 0, 40, 18), "100", 0.95f)};

    CorrelationStats stats;
    NumeralLabelMap labels = engine_->correlate(kBagSentence, detections, &stats);

    EXPECT_EQ(labels.at("100"), "flexible main body");
    EXPECT_EQ(labels.at("120"), "front flap");
    EXPECT_EQ(stats.confirmedNumerals, 1);
    EXPECT_EQ(stats.textOnlyNumerals, 1);
}

TEST_F(CorrelationEngineTest, DetectedNumeralWithoutTextIsNotLabelled) {
    std::vector<Detection> detections = {Detection(Quad(0, 0, 40, 18), "777", 0.95f)};

    NumeralLabelMap labels = engine_->correlate(kBagSentence, detections);

    EXPECT_EQ(labels.count("777"), 0u);
    EXPECT_EQ(labels.size(), 2u);
}

TEST_F(CorrelationEngineTest, MostFrequentPolicy) {
    CorrelationConfig config;
    config.labelPolicy = LabelPolicy::MostFrequent;
    CorrelationEngine engine(config, model_);

    NumeralLabelMap labels = engine.extractAndNormalize(
        "A front flap 120 is shown. The flap 120 closes. A front flap 120 opens.");

    EXPECT_EQ(labels.at("120"), "front flap");
    EXPECT_EQ(engine_->extractAndNormalize(
        "A front flap 120 is shown. The flap 120 closes. A front flap 120 opens.").at("120"), "flap");
}

TEST_F(CorrelationEngineTest, Idempotent) {
    std::string text = refnum_test::ReadText(refnum_test::DataPath("bag_patent.txt"));
    std::vector<Detection> detections;
    std::string error_msg;
    ASSERT_TRUE(DetectionIO::LoadFromJSON(refnum_test::DataPath("bag_patent.json"), detections, error_msg))
        << error_msg;

    NumeralLabelMap first = engine_->correlate(text, detections);
    NumeralLabelMap second = engine_->correlate(text, detections);
    EXPECT_EQ(first, second);
}

TEST_F(CorrelationEngineTest, MalformedDetectionCounted) {
    std::vector<Detection> detections = {
        Detection({{0, 0}, {40, 0}}, "100", 0.95f),
        Detection(Quad(100, 0, 40, 18), "12O", 0.9f),
    };

    CorrelationStats stats;
    NumeralLabelMap labels = engine_->correlate(kBagSentence, detections, &stats);

    EXPECT_EQ(stats.malformedDetections, 1);
    EXPECT_EQ(stats.validatedNumbers, 1);
    EXPECT_EQ(labels.size(), 2u);
}

TEST_F(CorrelationEngineTest, WithoutModelLabelsAreRawPhrases) {
    CorrelationEngine engine(config_, nullptr);
    EXPECT_FALSE(engine.hasModel());
    EXPECT_TRUE(engine_->hasModel());

    NumeralLabelMap labels = engine.extractAndNormalize(kBagSentence);

    EXPECT_EQ(labels.at("100"), "the bag has a flexible main body");
    EXPECT_EQ(labels.at("120"), "and a front flap");
}

// ==================== Bag patent ====================

class BagPatentTest : public CorrelationEngineTest {
protected:
    void SetUp() override {
        CorrelationEngineTest::SetUp();
        text_ = refnum_test::ReadText(refnum_test::DataPath("bag_patent.txt"));
        ASSERT_FALSE(text_.empty());

        std::string error_msg;
        ASSERT_TRUE(DetectionIO::LoadFromJSON(refnum_test::DataPath("bag_patent.json"), detections_, error_msg))
            << error_msg;
        ASSERT_EQ(detections_.size(), 7u);
    }

    std::string text_;
    std::vector<Detection> detections_;
};

TEST_F(BagPatentTest, PresentNumerals) {
    CorrelationStats stats;
    std::set<std::string> present = engine_->presentNumerals(detections_, &stats);

    std::set<std::string> expected = {"100", "120", "19.1", "350", "600"};
    EXPECT_EQ(present, expected);
    EXPECT_EQ(stats.validatedNumbers, 6);
    EXPECT_EQ(stats.dedupedNumbers, 5);
    EXPECT_EQ(stats.malformedDetections, 0);
}

TEST_F(BagPatentTest, Labels) {
    CorrelationStats stats;
    NumeralLabelMap labels = engine_->correlate(text_, detections_, &stats);

    EXPECT_EQ(labels.at("100"), "flexible main body");
    EXPECT_EQ(labels.at("120"), "front flap");
    EXPECT_EQ(labels.at("250"), "insulated compartment flap");
    EXPECT_EQ(labels.at("350"), "non-insulated compartment flap");
    EXPECT_EQ(labels.at("600"), "fixed carry handle");
    EXPECT_EQ(labels.count("19.1"), 0u);

    EXPECT_EQ(stats.confirmedNumerals, 4);
    EXPECT_EQ(stats.confirmedNumerals + stats.textOnlyNumerals, static_cast<int>(labels.size()));
    EXPECT_GT(stats.textMatches, 0);
    EXPECT_GE(stats.candidateNumerals, static_cast<int>(labels.size()));
    EXPECT_GE(stats.totalTime, 0.0);
}

TEST_F(BagPatentTest, KeysAreReferenceNumerals) {
    for (const auto& entry : engine_->correlate(text_, detections_)) {
        EXPECT_TRUE(PatternExtractor::isReferenceNumeral(entry.first)) << entry.first;
        EXPECT_FALSE(entry.second.empty()) << entry.first;
    }
}

TEST_F(BagPatentTest, StricterThresholdsDropDetections) {
    CorrelationEngine strict = engine_->withDetectionThresholds(0.95f, 0.5f);
    EXPECT_FLOAT_EQ(strict.config().minConfidence, 0.95f);

    CorrelationStats stats;
    std::set<std::string> present = strict.presentNumerals(detections_, &stats);

    std::set<std::string> expected = {"100", "19.1"};
    EXPECT_EQ(present, expected);

    // Text side unchanged
    EXPECT_EQ(strict.extractAndNormalize(text_), engine_->extractAndNormalize(text_));
}

// ==================== correlateBatch ====================

TEST_F(BagPatentTest, BatchMatchesSequentialOrder) {
    std::vector<CorrelationInput> inputs = {
        {text_, detections_},
        {kBagSentence, {}},
        {"", {}},
        {kCompetingLabels, {Detection(Quad(0, 0, 40, 18), "100", 0.95f)}},
    };

    std::vector<NumeralLabelMap> batch = engine_->correlateBatch(inputs, 3);

    ASSERT_EQ(batch.size(), inputs.size());
    for (size_t i = 0; i < inputs.size(); i++) {
        EXPECT_EQ(batch[i], engine_->correlate(inputs[i].text, inputs[i].detections)) << "input #" << i;
    }
    EXPECT_TRUE(batch[2].empty());
}

TEST_F(CorrelationEngineTest, BatchOfNothing) {
    EXPECT_TRUE(engine_->correlateBatch({}).empty());
}
