#include "digitloom/export_sizes.hpp"

#include <cstring>

#include "digitloom/container.hpp"

namespace digitloom {

namespace {

uint64_t length(const char* text) { return std::strlen(text); }

} // namespace

SizeEstimate estimate_sizes(uint64_t digits, Base base, uint32_t chunk_size, const std::string& descriptor,
                            const std::string& integer_part, bool encrypted) {
    SizeEstimate out;

    const uint64_t value = integer_part.size() + (digits > 0 ? 1 + digits : 0);
    const uint64_t name = descriptor.size();
    const uint64_t base_text = std::to_string(radix(base)).size();
    const uint64_t count_text = std::to_string(digits).size();

    out.text = value;

    //  {"constant":"pi","base":10,"digits":50,"value":"3.14..."}
    out.json = length("{\"constant\":\"") + name + length("\",\"base\":") + base_text + length(",\"digits\":") +
               count_text + length(",\"value\":\"") + value + length("\"}");
    out.ndjson = out.json + 1;

    //  header row, then constant,base,digits,value
    out.csv = length("constant,base,digits,value\n") + name + 1 + base_text + 1 + count_text + 1 + value + 1;
    out.tsv = out.csv;

    out.sql = length("CREATE TABLE digits (id INTEGER PRIMARY KEY, constant TEXT, base INTEGER, "
                     "digits INTEGER, value TEXT);\n") +
              length("INSERT INTO digits (constant, base, digits, value) VALUES ('") + name + length("', ") +
              base_text + length(", ") + count_text + length(", '") + value + length("');\n");

    out.ascii_binary = value;
    out.packed_binary = (integer_part.size() + digits + 1) / 2;
    out.container = container_size(digits, chunk_size, descriptor.size(), integer_part.size(), encrypted);
    out.information_bits = static_cast<double>(digits) * log2_radix(base);
    return out;
}

} // namespace digitloom
