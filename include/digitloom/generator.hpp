/**
 * Generation pipeline.
 *
 * Picks the engine for a request, computes (retrying once on
 * PrecisionExhausted), optionally verifies, and returns the digits or
 * streams them into a sink or container.
 *
 *      pi, whole sequence         binary splitting
 *      pi, streaming / unbounded  spigot
 *      everything else            series engine (pi inside via binary splitting)
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/container.hpp"
#include "digitloom/digits.hpp"
#include "digitloom/verifier.hpp"

namespace digitloom {

enum class Algorithm {
    Auto,
    Series,
    BinarySplitting,
    Spigot
};

const char* algorithm_name(Algorithm algorithm);
// "auto", "series", "binary-splitting", "spigot". Throws InvalidRequest.
Algorithm parse_algorithm(const std::string& name);

enum class OutputMode {
    Whole,
    Streaming
};

// Receives a stream: begin() once, then write() per batch.
class DigitSink {
public:
    virtual ~DigitSink() = default;
    virtual void begin(Base base, bool negative, const std::string& integer_part) = 0;
    virtual void write(const uint8_t* digits, size_t count) = 0;
};

struct Request {
    ConstantSpec spec;
    OutputMode mode = OutputMode::Whole;
    Algorithm algorithm = Algorithm::Auto;
    VerifyOptions verify;

    // Set to write the digits to a container at container_path.
    std::optional<ContainerOptions> container;
    std::string container_path;

    // Digits per streamed batch; 0 means the container chunk size (or 4096).
    size_t batch_digits = 0;
    // Called after each streamed batch with the running digit count.
    std::function<void(uint64_t)> on_progress;
};

struct GenerationResult {
    // Empty when the digits went only to a container. On cancellation holds
    // what was emitted so far with complete == false.
    DigitSequence digits;
    Algorithm algorithm = Algorithm::Auto;
    bool retried = false;
    uint64_t digits_emitted = 0;
    // Set when the cancellation token stopped the run. digits.complete tells
    // whether the digits themselves finished; verification is then absent.
    bool cancelled = false;
    std::optional<VerificationReport> verification;
};

class Generator {
public:
    explicit Generator(const EngineConfig& config, const CancellationToken* cancel = nullptr);

    // Engine for a request; throws UnsupportedConstant for a forced engine
    // that cannot produce spec, InvalidRequest for an unbounded request
    // outside the spigot.
    Algorithm select_algorithm(const ConstantSpec& spec, OutputMode mode,
                               Algorithm requested = Algorithm::Auto) const;

    // The whole bounded sequence. A cancelled spigot run returns the digits
    // emitted so far with complete == false; the other engines have nothing
    // certified before they finish and let CancellationRequested through.
    DigitSequence compute(const ConstantSpec& spec, Algorithm algorithm = Algorithm::Auto,
                          bool* retried = nullptr);

    // Streams into sink in batches of batch_digits. Throws
    // CancellationRequested (after the sink has everything emitted so far).
    uint64_t stream(const ConstantSpec& spec, DigitSink& sink, Algorithm algorithm = Algorithm::Auto,
                    size_t batch_digits = 4096, const std::function<void(uint64_t)>& on_progress = nullptr);

    // Full request: compute or stream, verify, write the container. On
    // cancellation the result comes back with cancelled set and the partial
    // digits marked incomplete; a container is closed as truncated.
    GenerationResult run(const Request& request);

    VerificationReport verify(const ConstantSpec& spec, const DigitSequence& digits, uint32_t samples,
                              Algorithm algorithm = Algorithm::Auto);

private:
    const EngineConfig& config_;
    const CancellationToken* cancel_;
};

} // namespace digitloom
