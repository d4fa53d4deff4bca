#include "digitloom/generator.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

#include "digitloom/compute.hpp"
#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"
#include "digitloom/spigot.hpp"

namespace digitloom {

namespace {

const size_t DEFAULT_BATCH_DIGITS = 4096;

// pi inside other constants goes through binary splitting unless the
// caller pinned the series engine.
PiAlgorithm pi_algorithm_for(Algorithm requested) {
    return requested == Algorithm::Series ? PiAlgorithm::Series : PiAlgorithm::BinarySplitting;
}

// Collects a stream into a DigitSequence.
class SequenceSink : public DigitSink {
public:
    explicit SequenceSink(DigitSequence& out) : out_(out) {}

    void begin(Base base, bool negative, const std::string& integer_part) override {
        out_.base = base;
        out_.negative = negative;
        out_.integer_part = integer_part;
        out_.digits.clear();
    }

    void write(const uint8_t* digits, size_t count) override {
        out_.digits.insert(out_.digits.end(), digits, digits + count);
    }

private:
    DigitSequence& out_;
};

// Opens the container once the integer part is known.
class ContainerSink : public DigitSink {
public:
    ContainerSink(const std::string& path, const ConstantSpec& spec, const ContainerOptions& options,
                  const EngineConfig& config)
        : path_(path), spec_(spec), options_(options), config_(config) {}

    void begin(Base base, bool negative, const std::string& integer_part) override {
        ContainerMetadata metadata;
        metadata.descriptor = spec_.descriptor();
        metadata.base = base;
        metadata.negative = negative;
        metadata.integer_part = integer_part;
        metadata.declared_digits = spec_.digits();
        writer_ = std::make_unique<ContainerWriter>(path_, metadata, options_, config_);
    }

    void write(const uint8_t* digits, size_t count) override {
        writer_->append(digits, count);
        written_ += count;
    }

    uint64_t written() const { return written_; }

    void close(bool truncated) {
        if (writer_) {
            writer_->close(truncated);
        } else {
            logging::get()->warn("container {}: stream stopped before any output; nothing written", path_);
        }
    }

private:
    std::string path_;
    const ConstantSpec& spec_;
    const ContainerOptions& options_;
    const EngineConfig& config_;
    std::unique_ptr<ContainerWriter> writer_;
    uint64_t written_ = 0;
};

} // namespace

const char* algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::Auto:            return "auto";
        case Algorithm::Series:          return "series";
        case Algorithm::BinarySplitting: return "binary-splitting";
        case Algorithm::Spigot:          return "spigot";
    }
    return "?";
}

Algorithm parse_algorithm(const std::string& name) {
    if (name == "auto" || name.empty()) return Algorithm::Auto;
    if (name == "series") return Algorithm::Series;
    if (name == "binary-splitting" || name == "chudnovsky") return Algorithm::BinarySplitting;
    if (name == "spigot") return Algorithm::Spigot;
    throw InvalidRequest("unknown algorithm '" + name + "'");
}

Generator::Generator(const EngineConfig& config, const CancellationToken* cancel)
    : config_(config), cancel_(cancel) {}

Algorithm Generator::select_algorithm(const ConstantSpec& spec, OutputMode mode, Algorithm requested) const {
    switch (requested) {
        case Algorithm::Spigot:
            if (!spec.is_pi()) {
                throw UnsupportedConstant("the spigot streamer only produces pi, not " + spec.descriptor());
            }
            return Algorithm::Spigot;

        case Algorithm::BinarySplitting:
            if (!spec.uses_pi()) {
                throw UnsupportedConstant("binary splitting only evaluates pi, not " + spec.descriptor());
            }
            break;

        case Algorithm::Series:
            break;

        case Algorithm::Auto:
            if (spec.is_pi() && (mode == OutputMode::Streaming || spec.unbounded())) {
                return Algorithm::Spigot;
            }
            requested = spec.is_pi() ? Algorithm::BinarySplitting : Algorithm::Series;
            break;
    }

    if (spec.unbounded()) {
        throw InvalidRequest("only the pi spigot can run without a digit limit");
    }
    return requested;
}

DigitSequence Generator::compute(const ConstantSpec& spec, Algorithm algorithm, bool* retried) {
    if (spec.unbounded()) throw InvalidRequest("a whole sequence needs a digit limit");
    Algorithm chosen = select_algorithm(spec, OutputMode::Whole, algorithm);
    if (retried) *retried = false;

    auto start = std::chrono::steady_clock::now();
    DigitSequence out;
    if (chosen == Algorithm::Spigot) {
        SpigotStreamer streamer(spec.base(), spec.digits(), cancel_);
        out.base = spec.base();
        out.integer_part = streamer.integer_part();
        out.digits.reserve(spec.digits());
        try {
            streamer.next_batch(spec.digits(), out.digits);
        } catch (const CancellationRequested& e) {
            logging::get()->warn("{}: cancelled after {} of {} digits", spec.descriptor(), e.digits_completed(),
                                 spec.digits());
            out.complete = false;
            return out;
        }
    } else {
        DigitComputer computer(config_, cancel_);
        out = computer.compute_with_retry(spec, pi_algorithm_for(algorithm), retried);
    }
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    logging::get()->info("{}: {} digits in base {} via {} ({:.3f} s)", spec.descriptor(), spec.digits(),
                         radix(spec.base()), algorithm_name(chosen), elapsed.count());
    return out;
}

uint64_t Generator::stream(const ConstantSpec& spec, DigitSink& sink, Algorithm algorithm, size_t batch_digits,
                           const std::function<void(uint64_t)>& on_progress) {
    Algorithm chosen = select_algorithm(spec, OutputMode::Streaming, algorithm);
    if (batch_digits == 0) batch_digits = DEFAULT_BATCH_DIGITS;
    uint64_t emitted = 0;

    if (chosen == Algorithm::Spigot) {
        SpigotStreamer streamer(spec.base(), spec.digits(), cancel_);
        sink.begin(spec.base(), false, streamer.integer_part());
        logging::get()->debug("{}: streaming via spigot ({} digits)", spec.descriptor(),
                              spec.unbounded() ? std::string("unbounded") : std::to_string(spec.digits()));

        std::vector<uint8_t> batch;
        batch.reserve(batch_digits);
        for (;;) {
            batch.clear();
            size_t count = 0;
            try {
                count = streamer.next_batch(batch_digits, batch);
            } catch (const CancellationRequested&) {
                // Digits produced before the stop still belong to the output.
                if (!batch.empty()) sink.write(batch.data(), batch.size());
                throw;
            }
            if (count == 0) break;
            sink.write(batch.data(), count);
            emitted += count;
            if (on_progress) on_progress(emitted);
        }
        return emitted;
    }

    // Other engines need the full precision up front; compute, then feed.
    DigitSequence sequence = compute(spec, algorithm);
    sink.begin(sequence.base, sequence.negative, sequence.integer_part);
    while (emitted < sequence.digits.size()) {
        if (is_cancelled(cancel_)) throw CancellationRequested(emitted);
        size_t count = static_cast<size_t>(std::min<uint64_t>(batch_digits, sequence.digits.size() - emitted));
        sink.write(sequence.digits.data() + emitted, count);
        emitted += count;
        if (on_progress) on_progress(emitted);
    }
    return emitted;
}

VerificationReport Generator::verify(const ConstantSpec& spec, const DigitSequence& digits, uint32_t samples,
                                     Algorithm algorithm) {
    Verifier verifier(config_, cancel_);
    return verifier.verify(spec, digits, samples, pi_algorithm_for(algorithm));
}

GenerationResult Generator::run(const Request& request) {
    const ConstantSpec& spec = request.spec;
    if (request.container && request.container_path.empty()) {
        throw InvalidRequest("container output needs a path");
    }

    GenerationResult result;
    result.algorithm = select_algorithm(spec, request.mode, request.algorithm);

    // A stop during verification leaves finished digits unverified.
    auto verify_into = [&](const DigitSequence& digits) {
        try {
            result.verification = verify(spec, digits, request.verify.samples, request.algorithm);
        } catch (const CancellationRequested&) {
            logging::get()->warn("{}: cancelled during verification", spec.descriptor());
            result.cancelled = true;
        }
    };

    if (request.mode == OutputMode::Whole) {
        // False when the engine stopped before the integer part was known.
        bool produced = true;
        try {
            result.digits = compute(spec, request.algorithm, &result.retried);
        } catch (const CancellationRequested&) {
            logging::get()->warn("{}: cancelled before any digit was certified", spec.descriptor());
            result.digits.base = spec.base();
            result.digits.complete = false;
            produced = false;
        }
        result.cancelled = !result.digits.complete;
        result.digits_emitted = result.digits.digits.size();
        if (request.verify.enabled && !result.cancelled) verify_into(result.digits);
        if (request.container && produced) {
            ContainerMetadata metadata;
            metadata.descriptor = spec.descriptor();
            metadata.base = result.digits.base;
            metadata.negative = result.digits.negative;
            metadata.integer_part = result.digits.integer_part;
            metadata.declared_digits = spec.digits();

            ContainerWriter writer(request.container_path, metadata, *request.container, config_);
            writer.append(result.digits.digits);
            writer.close(!result.digits.complete);
        }
        return result;
    }

    size_t batch = request.batch_digits;
    if (batch == 0) batch = request.container ? request.container->chunk_size : DEFAULT_BATCH_DIGITS;

    if (!request.container) {
        SequenceSink sink(result.digits);
        try {
            result.digits_emitted = stream(spec, sink, request.algorithm, batch, request.on_progress);
        } catch (const CancellationRequested&) {
            result.digits.base = spec.base();
            result.digits.complete = false;
            result.digits_emitted = result.digits.digits.size();
            result.cancelled = true;
            logging::get()->warn("{}: cancelled after {} digits", spec.descriptor(), result.digits_emitted);
            return result;
        }
        if (request.verify.enabled) verify_into(result.digits);
        return result;
    }

    ContainerSink sink(request.container_path, spec, *request.container, config_);
    try {
        result.digits_emitted = stream(spec, sink, request.algorithm, batch, request.on_progress);
    } catch (const CancellationRequested&) {
        logging::get()->warn("{}: cancelled after {} digits; closing container as truncated",
                             spec.descriptor(), sink.written());
        sink.close(true);
        result.digits.base = spec.base();
        result.digits.complete = false;
        result.digits_emitted = sink.written();
        result.cancelled = true;
        return result;
    }
    sink.close(false);

    if (request.verify.enabled) {
        ContainerReader reader(request.container_path, request.container->password);
        verify_into(reader.to_sequence());
    }
    return result;
}

} // namespace digitloom
