#include <cmath>
#include <string>

#include <gtest/gtest.h>

#include "digitloom/container.hpp"
#include "digitloom/export_sizes.hpp"
#include "test_support.hpp"

using namespace digitloom;

class ExportSizesTest : public test::DigitloomTest {};

TEST_F(ExportSizesTest, TextLayouts) {
    std::string value = "3." + std::string(test::PI_DIGITS).substr(0, 50);
    SizeEstimate sizes = estimate_sizes(50, Base::Decimal, 4096);

    EXPECT_EQ(sizes.text, value.size());
    EXPECT_EQ(sizes.ascii_binary, value.size());

    std::string json = "{\"constant\":\"pi\",\"base\":10,\"digits\":50,\"value\":\"" + value + "\"}";
    EXPECT_EQ(sizes.json, json.size());
    EXPECT_EQ(sizes.ndjson, json.size() + 1);

    std::string csv = "constant,base,digits,value\npi,10,50," + value + "\n";
    EXPECT_EQ(sizes.csv, csv.size());
    EXPECT_EQ(sizes.tsv, csv.size());
}

TEST_F(ExportSizesTest, BinaryAndContainer) {
    SizeEstimate sizes = estimate_sizes(50, Base::Decimal, 10);
    EXPECT_EQ(sizes.packed_binary, 26u);
    EXPECT_EQ(sizes.container, container_size(50, 10, 2, 1, false));
    EXPECT_NEAR(sizes.information_bits, 50 * std::log2(10.0), 1e-9);

    SizeEstimate hex = estimate_sizes(64, Base::Hexadecimal, 16, "e", "2", true);
    EXPECT_DOUBLE_EQ(hex.information_bits, 256.0);
    EXPECT_EQ(hex.container, container_size(64, 16, 1, 1, true));
    EXPECT_GT(hex.container, estimate_sizes(64, Base::Hexadecimal, 16, "e", "2", false).container);
}

TEST_F(ExportSizesTest, NoDigits) {
    SizeEstimate sizes = estimate_sizes(0, Base::Decimal, 10);
    EXPECT_EQ(sizes.text, 1u);
    EXPECT_EQ(sizes.information_bits, 0.0);
}
