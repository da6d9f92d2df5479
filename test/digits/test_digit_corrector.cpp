/**
 * @file test_digit_corrector.cpp
 * @brief DigitCorrector tests
 */

#include <gtest/gtest.h>
#include "digits/digit_corrector.h"
#include "../test_support.h"

using namespace refnum;
using refnum_test::Quad;

// ==================== correct ====================

TEST(DigitCorrector, GlyphSubstitution) {
    EXPECT_EQ(DigitCorrector::correct("1OO"), "100");
    EXPECT_EQ(DigitCorrector::correct("b0"), "60");
    EXPECT_EQ(DigitCorrector::correct("lI"), "11");
    EXPECT_EQ(DigitCorrector::correct("S2"), "52");
    EXPECT_EQ(DigitCorrector::correct("Zg"), "29");
    EXPECT_EQ(DigitCorrector::correct("D7"), "07");
    EXPECT_EQ(DigitCorrector::correct("Tq"), "79");
}

TEST(DigitCorrector, UnmappedCharactersDropped) {
    EXPECT_EQ(DigitCorrector::correct("12.5"), "12.5");
    EXPECT_EQ(DigitCorrector::correct("a1b"), "16");
    EXPECT_EQ(DigitCorrector::correct("FIG. 1"), "19.1");
    EXPECT_EQ(DigitCorrector::correct("xyz"), "");
    EXPECT_EQ(DigitCorrector::correct(""), "");
}

// ==================== parseFloat ====================

TEST(DigitCorrector, ParseFloatWholeString) {
    ASSERT_TRUE(DigitCorrector::parseFloat("12.5").has_value());
    EXPECT_DOUBLE_EQ(*DigitCorrector::parseFloat("12.5"), 12.5);
    EXPECT_DOUBLE_EQ(*DigitCorrector::parseFloat("1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(*DigitCorrector::parseFloat("-5"), -5.0);

    EXPECT_FALSE(DigitCorrector::parseFloat("").has_value());
    EXPECT_FALSE(DigitCorrector::parseFloat(" 5").has_value());
    EXPECT_FALSE(DigitCorrector::parseFloat("5x").has_value());
    EXPECT_FALSE(DigitCorrector::parseFloat("1.2.3").has_value());
    EXPECT_FALSE(DigitCorrector::parseFloat("0x1A").has_value());
    EXPECT_FALSE(DigitCorrector::parseFloat("nan").has_value());
}

// ==================== isNumber ====================

TEST(DigitCorrector, IsNumberByParse) {
    DigitCorrector corrector;
    EXPECT_TRUE(corrector.isNumber("100"));
    EXPECT_TRUE(corrector.isNumber("12.5"));
    EXPECT_TRUE(corrector.isNumber("-5"));
    EXPECT_TRUE(corrector.isNumber(" 42 "));
}

TEST(DigitCorrector, IsNumberByDigitRatio) {
    DigitCorrector corrector;
    EXPECT_TRUE(corrector.isNumber("1234567a"));    // 7/8
    EXPECT_FALSE(corrector.isNumber("1a2b3c4d"));   // 4/8
    EXPECT_FALSE(corrector.isNumber("1.2.3"));      // 3/5

    DigitCorrector lenient(0.6f, 0.5f);
    EXPECT_TRUE(lenient.isNumber("1a2b3c4d"));
    EXPECT_TRUE(lenient.isNumber("1.2.3"));
}

TEST(DigitCorrector, IsNumberRejectsText) {
    DigitCorrector corrector;
    EXPECT_FALSE(corrector.isNumber(""));
    EXPECT_FALSE(corrector.isNumber("abc"));
    EXPECT_FALSE(corrector.isNumber("..."));
    EXPECT_FALSE(corrector.isNumber("0x1A"));
}

// ==================== filterValid ====================

TEST(DigitCorrector, FilterKeepsConfidentNumbersInOrder) {
    DigitCorrector corrector(0.6f, 0.7f);

    std::vector<Detection> detections = {
        Detection(Quad(0, 0, 10, 10), "100", 0.9f),
        Detection(Quad(20, 0, 10, 10), "12O", 0.6f),    // at the threshold
        Detection(Quad(40, 0, 10, 10), "99", 0.59f),
        Detection(Quad(60, 0, 10, 10), "xyz", 0.9f),
        Detection(Quad(80, 0, 10, 10), "...", 0.9f),
    };

    size_t skipped = 0;
    auto numbers = corrector.filterValid(detections, &skipped);

    EXPECT_EQ(skipped, 0u);
    ASSERT_EQ(numbers.size(), 2u);

    EXPECT_EQ(numbers[0].correctedText, "100");
    EXPECT_DOUBLE_EQ(numbers[0].value, 100.0);

    EXPECT_EQ(numbers[1].originalText, "12O");
    EXPECT_EQ(numbers[1].correctedText, "120");
    EXPECT_DOUBLE_EQ(numbers[1].value, 120.0);
    EXPECT_FLOAT_EQ(numbers[1].confidence, 0.6f);
    EXPECT_EQ(numbers[1].box, detections[1].box);
}

TEST(DigitCorrector, MalformedDetectionsSkippedAndCounted) {
    DigitCorrector corrector;

    std::vector<Detection> detections = {
        Detection({{0, 0}, {10, 0}, {10, 10}}, "100", 0.9f),
        Detection(Quad(0, 0, 10, 10), "200", 1.5f),
        Detection(Quad(0, 0, 10, 10), "300", 0.9f),
    };

    size_t skipped = 0;
    auto numbers = corrector.filterValid(detections, &skipped);

    EXPECT_EQ(skipped, 2u);
    ASSERT_EQ(numbers.size(), 1u);
    EXPECT_EQ(numbers[0].correctedText, "300");

    // Counter is optional
    EXPECT_EQ(corrector.filterValid(detections).size(), 1u);
}

TEST(DigitCorrector, EmptyInput) {
    DigitCorrector corrector;
    EXPECT_TRUE(corrector.filterValid({}).empty());
}
