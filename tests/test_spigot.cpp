#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "digitloom/digits.hpp"
#include "digitloom/error.hpp"
#include "digitloom/spigot.hpp"
#include "test_support.hpp"

using namespace digitloom;

class SpigotTest : public test::DigitloomTest {
protected:
    static std::string render(const std::vector<uint8_t>& digits) {
        std::string out;
        for (uint8_t d : digits) out += digit_char(d);
        return out;
    }
};

TEST_F(SpigotTest, DecimalPi) {
    SpigotStreamer streamer(Base::Decimal, 100);
    EXPECT_EQ(streamer.integer_part(), "3");

    std::vector<uint8_t> digits;
    EXPECT_EQ(streamer.next_batch(1000, digits), 100u);
    EXPECT_EQ(render(digits), test::PI_DIGITS);
    EXPECT_TRUE(streamer.finished());

    uint8_t digit = 0;
    EXPECT_FALSE(streamer.next_digit(digit));
}

TEST_F(SpigotTest, HexadecimalPi) {
    SpigotStreamer streamer(Base::Hexadecimal, 50);
    std::vector<uint8_t> digits;
    streamer.next_batch(50, digits);
    EXPECT_EQ(render(digits), test::PI_HEX);
}

TEST_F(SpigotTest, StepsEmitOrDefer) {
    SpigotStreamer streamer(Base::Decimal, 5);
    uint64_t emitted = 0;
    uint64_t deferred = 0;
    uint8_t digit = 0;
    std::string text;
    for (;;) {
        SpigotStep step = streamer.step(digit);
        if (step == SpigotStep::Finished) break;
        if (step == SpigotStep::Emitted) {
            emitted++;
            text += digit_char(digit);
        } else {
            deferred++;
        }
    }
    EXPECT_EQ(emitted, 5u);
    EXPECT_GT(deferred, 0u);
    EXPECT_EQ(text, "14159");
    EXPECT_EQ(streamer.step(digit), SpigotStep::Finished);
}

TEST_F(SpigotTest, UnboundedKeepsGoing) {
    SpigotStreamer streamer(Base::Decimal);
    EXPECT_EQ(streamer.limit(), SpigotStreamer::UNBOUNDED);
    std::vector<uint8_t> digits;
    EXPECT_EQ(streamer.next_batch(500, digits), 500u);
    EXPECT_FALSE(streamer.finished());
    EXPECT_EQ(render(digits).substr(0, 100), test::PI_DIGITS);
}

TEST_F(SpigotTest, SnapshotResumesTheStream) {
    SpigotStreamer first(Base::Decimal, 100);
    std::vector<uint8_t> head;
    first.next_batch(30, head);

    std::string saved = first.snapshot().serialize();
    SpigotStreamer resumed(SpigotSnapshot::parse(saved));
    EXPECT_EQ(resumed.emitted(), 30u);
    EXPECT_EQ(resumed.limit(), 100u);

    std::vector<uint8_t> tail;
    EXPECT_EQ(resumed.next_batch(1000, tail), 70u);
    EXPECT_EQ(render(head) + render(tail), test::PI_DIGITS);
}

TEST_F(SpigotTest, MalformedSnapshots) {
    EXPECT_THROW(SpigotSnapshot::parse("10 1 2"), InvalidRequest);
    EXPECT_THROW(SpigotSnapshot::parse("10 0 5 1 3 1 0 1 zz"), InvalidRequest);
    EXPECT_THROW(SpigotSnapshot::parse("10 0 5 1 3 1 0 1 3 extra"), InvalidRequest);
    EXPECT_THROW(SpigotSnapshot::parse("7 0 5 1 3 1 0 1 3"), UnsupportedBase);

    SpigotSnapshot impossible = SpigotSnapshot::parse("10 0 5 1 3 1 0 0 3");
    EXPECT_THROW(SpigotStreamer streamer(impossible), InvalidRequest);
}

TEST_F(SpigotTest, CancellationKeepsEmittedDigits) {
    CancellationToken token;
    SpigotStreamer streamer(Base::Decimal, SpigotStreamer::UNBOUNDED, &token);

    std::vector<uint8_t> digits;
    streamer.next_batch(10, digits);
    token.cancel();

    try {
        streamer.next_batch(10, digits);
        FAIL() << "cancellation ignored";
    } catch (const CancellationRequested& e) {
        EXPECT_EQ(e.digits_completed(), 10u);
    }
    EXPECT_EQ(digits.size(), 10u);
    EXPECT_EQ(streamer.emitted(), 10u);
}
