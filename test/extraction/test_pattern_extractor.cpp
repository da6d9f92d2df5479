/**
 * @file test_pattern_extractor.cpp
 * @brief PatternExtractor tests
 */

#include <gtest/gtest.h>
#include "extraction/pattern_extractor.h"
#include "../test_support.h"
#include <chrono>

using namespace refnum;

namespace {

const char* const kBagSentence = "The bag has a flexible main body 100 and a front flap 120.";

std::vector<std::string> Labels(const CandidateTable& table, const std::string& numeral) {
    auto it = table.find(numeral);
    return it == table.end() ? std::vector<std::string>() : it->second.labelCandidates;
}

} // namespace

class PatternExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto model = refnum_test::Model();
        ASSERT_NE(model, nullptr);
        normalizer_ = std::make_shared<PhraseNormalizer>(model);
        extractor_ = std::make_unique<PatternExtractor>(normalizer_);
    }

    std::shared_ptr<PhraseNormalizer> normalizer_;
    std::unique_ptr<PatternExtractor> extractor_;
};

// ==================== isReferenceNumeral ====================

TEST(PatternExtractorStatic, ReferenceNumeralIsOneToFourDigits) {
    EXPECT_TRUE(PatternExtractor::isReferenceNumeral("1"));
    EXPECT_TRUE(PatternExtractor::isReferenceNumeral("001"));
    EXPECT_TRUE(PatternExtractor::isReferenceNumeral("9999"));

    EXPECT_FALSE(PatternExtractor::isReferenceNumeral(""));
    EXPECT_FALSE(PatternExtractor::isReferenceNumeral("12345"));
    EXPECT_FALSE(PatternExtractor::isReferenceNumeral("12a"));
    EXPECT_FALSE(PatternExtractor::isReferenceNumeral("1.5"));
    EXPECT_FALSE(PatternExtractor::isReferenceNumeral(" 12"));
}

// ==================== findMatches ====================

TEST_F(PatternExtractorTest, MatchSpansCoverPhraseAndNumber) {
    std::string text = kBagSentence;
    auto matches = extractor_->findMatches(text);

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(text.substr(matches[0].begin, matches[0].end - matches[0].begin),
              "The bag has a flexible main body 100");
    EXPECT_EQ(matches[0].rawPhrase, "The bag has a flexible main body");
    ASSERT_EQ(matches[0].numerals.size(), 1u);
    EXPECT_EQ(matches[0].numerals[0], "100");

    EXPECT_EQ(matches[1].rawPhrase, " and a front flap");
    EXPECT_EQ(matches[1].numerals[0], "120");
    EXPECT_LE(matches[0].end, matches[1].begin);
}

TEST_F(PatternExtractorTest, CommaSeparatedNumeralsShareThePhrase) {
    auto matches = extractor_->findMatches("The straps 10, 11 and 12.");

    ASSERT_EQ(matches.size(), 2u);
    ASSERT_EQ(matches[0].numerals.size(), 2u);
    EXPECT_EQ(matches[0].numerals[0], "10");
    EXPECT_EQ(matches[0].numerals[1], "11");
    EXPECT_EQ(matches[1].numerals[0], "12");
}

TEST_F(PatternExtractorTest, FigureReferencesSkipped) {
    auto matches = extractor_->findMatches("FIG. 1 shows a bag 10.");

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].numerals[0], "10");
}

TEST_F(PatternExtractorTest, NoNumeralNoMatch) {
    EXPECT_TRUE(extractor_->findMatches("A bag with a strap.").empty());
    EXPECT_TRUE(extractor_->findMatches("").empty());
}

// ==================== extract ====================

TEST_F(PatternExtractorTest, BagSentence) {
    size_t matchCount = 0;
    CandidateTable table = extractor_->extract(kBagSentence, &matchCount);

    EXPECT_EQ(matchCount, 2u);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(Labels(table, "100"), std::vector<std::string>({"flexible main body"}));
    EXPECT_EQ(Labels(table, "120"), std::vector<std::string>({"front flap"}));
    EXPECT_EQ(table.at("100").numeral, "100");
    EXPECT_EQ(table.at("100").source, CandidateSource::TEXT);
}

TEST_F(PatternExtractorTest, CommaListAndEmptyPhrase) {
    CandidateTable table = extractor_->extract("The straps 10, 11 and 12.");

    EXPECT_EQ(Labels(table, "10"), std::vector<std::string>({"strap"}));
    EXPECT_EQ(Labels(table, "11"), std::vector<std::string>({"strap"}));
    // " and" normalizes to nothing
    EXPECT_EQ(table.count("12"), 0u);
}

TEST_F(PatternExtractorTest, FigureNumberNeverBecomesNumeral) {
    CandidateTable table = extractor_->extract("FIG. 1 shows a bag 10.");

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(Labels(table, "10"), std::vector<std::string>({"bag"}));
}

TEST_F(PatternExtractorTest, FiveDigitNumbersIgnored) {
    CandidateTable table = extractor_->extract("serial number 12345 and a lid 7");

    EXPECT_EQ(Labels(table, "7"), std::vector<std::string>({"lid"}));
    for (const auto& entry : table) {
        EXPECT_TRUE(PatternExtractor::isReferenceNumeral(entry.first)) << entry.first;
        EXPECT_EQ(std::string("12345").find(entry.first), std::string::npos) << entry.first;
    }
}

TEST_F(PatternExtractorTest, LeadInPhraseDropped) {
    CandidateTable shown = extractor_->extract("a bag, shown as pouch 30");
    EXPECT_EQ(Labels(shown, "30"), std::vector<std::string>({"pouch"}));

    CandidateTable generally = extractor_->extract("The housing is indicated generally as 20.");
    EXPECT_EQ(Labels(generally, "20"), std::vector<std::string>({"housing"}));

    CandidateTable reference = extractor_->extract("the lid, reference numeral 40");
    EXPECT_EQ(Labels(reference, "40"), std::vector<std::string>({"lid"}));
}

TEST_F(PatternExtractorTest, CandidatesKeepTextOrder) {
    CandidateTable table = extractor_->extract(
        "The flexible main body 100 is soft. The main body of the invention 100 is large.");

    std::vector<std::string> labels = Labels(table, "100");
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "flexible main body");
    EXPECT_EQ(labels[1], "main body invention");
}

TEST_F(PatternExtractorTest, PhraseWrapsAcrossLineBreak) {
    CandidateTable table = extractor_->extract(
        "The bag comprises a flexible main\nbody 100 and a front flap 120.\n");

    EXPECT_EQ(Labels(table, "100"), std::vector<std::string>({"flexible main body"}));
    EXPECT_EQ(Labels(table, "120"), std::vector<std::string>({"front flap"}));
}

TEST_F(PatternExtractorTest, WrappedMatchSpanIncludesLineBreak) {
    std::string text = "a flexible main\r\nbody 100";
    auto matches = extractor_->findMatches(text);

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].rawPhrase, "a flexible main\r\nbody");
    EXPECT_EQ(matches[0].end, text.size());
}

TEST_F(PatternExtractorTest, BlankLineEndsThePhrase) {
    CandidateTable table = extractor_->extract("a strap\n\n12 and a lid 3");
    EXPECT_EQ(table.count("12"), 0u);
    EXPECT_EQ(Labels(table, "3"), std::vector<std::string>({"lid"}));

    CandidateTable crlf = extractor_->extract("a strap\r\n \r\n12 and a lid 3");
    EXPECT_EQ(crlf.count("12"), 0u);
    EXPECT_EQ(Labels(crlf, "3"), std::vector<std::string>({"lid"}));
}

TEST_F(PatternExtractorTest, LetterSuffixedNumerals) {
    CandidateTable table = extractor_->extract("a lower edge 352a and an upper edge 351b.");

    EXPECT_EQ(Labels(table, "352"), std::vector<std::string>({"lower edge"}));
    EXPECT_EQ(Labels(table, "351"), std::vector<std::string>({"upper edge"}));
}

TEST_F(PatternExtractorTest, SuffixedFigureNumberSkipped) {
    CandidateTable table = extractor_->extract("FIG. 4A shows a lid 5.");

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(Labels(table, "5"), std::vector<std::string>({"lid"}));
}

TEST_F(PatternExtractorTest, LongLineSplitAtSentenceEnds) {
    PatternExtractor extractor(normalizer_, 256);

    std::string text;
    for (int i = 0; i < 200; i++) {
        text += "The lid 5. ";
    }

    CandidateTable table = extractor.extract(text);

    ASSERT_EQ(table.size(), 1u);
    const auto& labels = table.at("5").labelCandidates;
    EXPECT_EQ(labels.size(), 200u);
    for (const auto& label : labels) {
        EXPECT_EQ(label, "lid");
    }
}

// ==================== Text without numerals ====================

namespace {

// About 900 characters per line, full of lead-in words and no digit
std::string ProseLine() {
    std::string line;
    while (line.size() < 900) {
        line += "The cover works as well as no other part and is shown as a flap in use; ";
    }
    return line;
}

double ExtractMs(const PatternExtractor& extractor, const std::string& text, CandidateTable& table) {
    auto start = std::chrono::high_resolution_clock::now();
    table = extractor.extract(text);
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace

TEST_F(PatternExtractorTest, LongTextWithoutDigits) {
    std::string text;
    for (int i = 0; i < 100; i++) {
        text += ProseLine() + "\n";
    }

    CandidateTable table;
    double ms = ExtractMs(*extractor_, text, table);

    EXPECT_TRUE(table.empty());
    EXPECT_LT(ms, 2000.0);
}

TEST_F(PatternExtractorTest, DigitsOnlyAtLineStart) {
    std::string text;
    for (int i = 0; i < 100; i++) {
        text += "12 " + ProseLine() + "\n\n";
    }

    CandidateTable table;
    double ms = ExtractMs(*extractor_, text, table);

    EXPECT_TRUE(table.empty());
    EXPECT_LT(ms, 2000.0);
}

TEST_F(PatternExtractorTest, LongTextEndingInNumeral) {
    std::string text;
    for (int i = 0; i < 10; i++) {
        text += ProseLine() + "\n";
    }
    text += "\nThe lid 5.";

    CandidateTable table;
    double ms = ExtractMs(*extractor_, text, table);

    EXPECT_EQ(Labels(table, "5"), std::vector<std::string>({"lid"}));
    EXPECT_LT(ms, 2000.0);
}

TEST_F(PatternExtractorTest, UnbrokenLongLineHasNoMatches) {
    PatternExtractor extractor(normalizer_, 64);
    EXPECT_TRUE(extractor.extract(std::string(1000, 'x')).empty());
}

TEST(PatternExtractorNoModel, PhrasesOnlyLowercased) {
    auto normalizer = std::make_shared<PhraseNormalizer>(nullptr);
    PatternExtractor extractor(normalizer);

    CandidateTable table = extractor.extract(kBagSentence);

    EXPECT_EQ(Labels(table, "100"), std::vector<std::string>({"the bag has a flexible main body"}));
    EXPECT_EQ(Labels(table, "120"), std::vector<std::string>({"and a front flap"}));
}
