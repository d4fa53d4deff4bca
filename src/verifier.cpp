#include "digitloom/verifier.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "digitloom/bbp.hpp"
#include "digitloom/compute.hpp"
#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"
#include "digitloom/spigot.hpp"

namespace digitloom {

namespace {

void finish(VerificationReport& report) {
    if (report.mismatches() > 0) report.passed = false;
    auto log = logging::get();
    if (report.passed) {
        log->info("verification ({}): {} samples passed", verification_method_name(report.method),
                  report.samples.size());
    } else {
        log->warn("verification ({}) failed: {} of {} samples mismatched{}{}",
                  verification_method_name(report.method), report.mismatches(), report.samples.size(),
                  report.detail.empty() ? "" : "; ", report.detail);
    }
}

} // namespace

const char* verification_method_name(VerificationMethod method) {
    switch (method) {
        case VerificationMethod::Skipped:      return "skipped";
        case VerificationMethod::RandomAccess: return "bbp random access";
        case VerificationMethod::SpigotPrefix: return "spigot prefix";
        case VerificationMethod::Stability:    return "stability";
    }
    return "?";
}

size_t VerificationReport::mismatches() const {
    return static_cast<size_t>(std::count_if(samples.begin(), samples.end(),
                                             [](const SampleResult& s) { return !s.match; }));
}

Verifier::Verifier(const EngineConfig& config, const CancellationToken* cancel)
    : config_(config), cancel_(cancel) {}

std::vector<uint64_t> Verifier::sample_positions(uint64_t length, uint32_t samples) {
    std::vector<uint64_t> out;
    if (length == 0 || samples == 0) return out;
    if (samples == 1) {
        out.push_back(0);
        return out;
    }
    uint64_t count = std::min<uint64_t>(samples, length);
    for (uint64_t i = 0; i < count; i++) {
        //  i (length - 1) / (count - 1) without overflowing 64 bits
        unsigned __int128 scaled = static_cast<unsigned __int128>(i) * (length - 1);
        uint64_t position = static_cast<uint64_t>(scaled / (count - 1));
        if (out.empty() || out.back() != position) out.push_back(position);
    }
    return out;
}

VerificationReport Verifier::verify(const ConstantSpec& spec, const DigitSequence& sequence, uint32_t samples,
                                    PiAlgorithm pi_algorithm) {
    if (samples == 0) {
        VerificationReport report;
        report.detail = "verification skipped";
        return report;
    }

    VerificationReport report;
    if (spec.is_pi() && spec.base() == Base::Hexadecimal) {
        report = random_access(sequence, samples);
    } else if (spec.is_pi()) {
        report = spigot_prefix(sequence, samples);
    } else {
        report = stability(spec, sequence, pi_algorithm);
    }

    if (spec.is_pi() && (sequence.negative || sequence.integer_part != "3")) {
        report.passed = false;
        report.detail = "integer part " + sequence.integer_part + " is not 3";
    }
    finish(report);
    return report;
}

VerificationReport Verifier::random_access(const DigitSequence& sequence, uint32_t samples) {
    VerificationReport report;
    report.method = VerificationMethod::RandomAccess;

    RandomAccessExtractor extractor(config_);
    for (uint64_t position : sample_positions(sequence.digits.size(), samples)) {
        if (is_cancelled(cancel_)) throw CancellationRequested(sequence.digits.size());

        SampleResult sample;
        sample.position = position;
        sample.actual = sequence.digits[position];
        try {
            sample.expected = static_cast<uint8_t>(extractor.digit_at(position));
            sample.match = sample.expected == sample.actual;
        } catch (const PrecisionExhausted& e) {
            sample.match = false;
            report.detail = "position " + std::to_string(position) + " inconclusive: " + e.what();
        }
        report.samples.push_back(sample);
    }
    return report;
}

VerificationReport Verifier::spigot_prefix(const DigitSequence& sequence, uint32_t samples) {
    VerificationReport report;
    report.method = VerificationMethod::SpigotPrefix;

    uint64_t count = std::min<uint64_t>(samples, sequence.digits.size());
    SpigotStreamer streamer(sequence.base, count, cancel_);
    std::vector<uint8_t> expected;
    expected.reserve(count);
    streamer.next_batch(count, expected);

    for (uint64_t i = 0; i < count; i++) {
        SampleResult sample;
        sample.position = i;
        sample.expected = expected[i];
        sample.actual = sequence.digits[i];
        sample.match = sample.expected == sample.actual;
        report.samples.push_back(sample);
    }
    return report;
}

VerificationReport Verifier::stability(const ConstantSpec& spec, const DigitSequence& sequence,
                                       PiAlgorithm pi_algorithm) {
    VerificationReport report;
    report.method = VerificationMethod::Stability;

    uint64_t length = sequence.digits.size();
    uint64_t window = std::min<uint64_t>(config_.stability_window, length);
    uint32_t guard = config_.guard_digits + config_.retry_guard_digits + config_.stability_extra_guard;

    DigitComputer computer(config_, cancel_);
    DigitExtractor extractor(config_.min_guard_digits);
    std::string integer_part;
    bool negative = false;
    std::vector<uint8_t> expected;
    try {
        if (spec.is_rational()) {
            DigitSequence exact = computer.compute(spec.with_digits(length), pi_algorithm, guard);
            integer_part = exact.integer_part;
            negative = exact.negative;
            expected.assign(exact.digits.end() - static_cast<std::ptrdiff_t>(window), exact.digits.end());
        } else {
            //  Only the suffix window is re-extracted from the wider value.
            FixedPoint wider = computer.evaluate(spec, pi_algorithm, PrecisionBudget(length, spec.base(), guard));
            integer_part = extractor.extract(wider, 0).integer_part;
            negative = wider.value.sign() < 0 && (length > 0 || integer_part != "0");
            expected = extractor.extract_window(wider, length - window, window);
        }
    } catch (const PrecisionExhausted& e) {
        report.passed = false;
        report.detail = std::string("recomputation inconclusive: ") + e.what();
        return report;
    }

    if (integer_part != sequence.integer_part || negative != sequence.negative) {
        report.passed = false;
        report.detail = "integer part differs: " + std::string(negative ? "-" : "") + integer_part;
    }

    for (uint64_t position = length - window; position < length; position++) {
        SampleResult sample;
        sample.position = position;
        sample.expected = expected[position - (length - window)];
        sample.actual = sequence.digits[position];
        sample.match = sample.expected == sample.actual;
        report.samples.push_back(sample);
    }
    return report;
}

} // namespace digitloom
