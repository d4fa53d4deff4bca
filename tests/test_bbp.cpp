#include <algorithm>
#include <cctype>
#include <string>

#include <gtest/gtest.h>

#include "digitloom/bbp.hpp"
#include "digitloom/compute.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/error.hpp"
#include "test_support.hpp"

using namespace digitloom;

class BbpTest : public test::DigitloomTest {
protected:
    static std::string upper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
};

TEST_F(BbpTest, LeadingDigits) {
    RandomAccessExtractor extractor(config_);
    EXPECT_EQ(extractor.digit_at(0), 2);
    EXPECT_EQ(extractor.digit_at(3), 0xF);
    EXPECT_EQ(extractor.extract(0, 4).digits, "243F");
    EXPECT_EQ(extractor.extract(0, 16).digits, "243F6A8885A308D3");
    EXPECT_EQ(extractor.extract(0, 50).digits, upper(test::PI_HEX));
}

TEST_F(BbpTest, SliceMetadata) {
    RandomAccessExtractor extractor(config_);
    HexSlice slice = extractor.extract(7, 9);
    EXPECT_EQ(slice.start, 7u);
    EXPECT_EQ(slice.digits.size(), 9u);
    EXPECT_GT(slice.confidence_bits, static_cast<double>(config_.bbp_guard_bits));

    HexSlice empty = extractor.extract(100, 0);
    EXPECT_TRUE(empty.digits.empty());
}

TEST_F(BbpTest, MatchesFullComputation) {
    DigitComputer computer(config_);
    DigitSequence full = computer.compute_with_retry(ConstantSpec::constant(ConstantId::Pi, Base::Hexadecimal, 1100),
                                                     PiAlgorithm::BinarySplitting);
    std::string hex = upper(full.fractional_string());

    RandomAccessExtractor extractor(config_);
    EXPECT_EQ(extractor.extract(1, 12).digits, hex.substr(1, 12));
    EXPECT_EQ(extractor.extract(1000, 40).digits, hex.substr(1000, 40));
    EXPECT_EQ(extractor.extract(1099, 1).digits, hex.substr(1099, 1));
}

TEST_F(BbpTest, MillionthPosition) {
    RandomAccessExtractor extractor(config_);
    EXPECT_EQ(extractor.extract(1000000, 8).digits, "26C65E52");
}

TEST_F(BbpTest, SingleThreadedAgrees) {
    EngineConfig single = config_;
    single.threads = 1;
    RandomAccessExtractor one(single);
    RandomAccessExtractor many(config_);
    EXPECT_EQ(one.extract(20000, 8).digits, many.extract(20000, 8).digits);
}

TEST_F(BbpTest, PrecisionCapIsEnforced) {
    EngineConfig strict = config_;
    strict.bbp_guard_bits = 1000;
    strict.bbp_max_precision_bits = 256;
    RandomAccessExtractor extractor(strict);
    EXPECT_THROW(extractor.extract(0, 1), PrecisionExhausted);
}
