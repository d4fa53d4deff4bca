#include "digitloom/config.hpp"

#include <cstdlib>
#include <limits>

#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

template <typename T>
void read_unsigned(const char* key, T& target) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw) return;

    std::string value(raw);
    size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &used, 10);
    } catch (const std::exception&) {
        throw ConfigError("expected an unsigned integer, got '" + value + "'", key);
    }
    if (used != value.size() || value[0] == '-' ||
        parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw ConfigError("expected an unsigned integer, got '" + value + "'", key);
    }
    target = static_cast<T>(parsed);
}

void require(bool condition, const std::string& message, const char* key) {
    if (!condition) throw ConfigError(message, key);
}

} // namespace

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    read_unsigned("DIGITLOOM_GUARD_DIGITS", config.guard_digits);
    read_unsigned("DIGITLOOM_RETRY_GUARD_DIGITS", config.retry_guard_digits);
    read_unsigned("DIGITLOOM_STABILITY_EXTRA_GUARD", config.stability_extra_guard);
    read_unsigned("DIGITLOOM_STABILITY_WINDOW", config.stability_window);
    read_unsigned("DIGITLOOM_BBP_GUARD_BITS", config.bbp_guard_bits);
    read_unsigned("DIGITLOOM_BBP_MAX_PRECISION", config.bbp_max_precision_bits);
    read_unsigned("DIGITLOOM_THREADS", config.threads);
    read_unsigned("DIGITLOOM_SPLIT_LEAF_TERMS", config.split_leaf_terms);
    read_unsigned("DIGITLOOM_SPLIT_TASK_TERMS", config.split_task_terms);
    read_unsigned("DIGITLOOM_SCRYPT_LOG2_N", config.scrypt_log2_n);

    if (const char* level = std::getenv("DIGITLOOM_LOG_LEVEL")) {
        if (*level) config.log_level = level;
    }

    config.validate();
    logging::get()->debug("config: guard={} retry_guard={} bbp_guard_bits={} threads={}",
                          config.guard_digits, config.retry_guard_digits,
                          config.bbp_guard_bits, config.threads);
    return config;
}

void EngineConfig::validate() const {
    require(guard_digits >= 1, "guard_digits must be at least 1", "DIGITLOOM_GUARD_DIGITS");
    require(min_guard_digits <= guard_digits, "min_guard_digits must not exceed guard_digits",
            "DIGITLOOM_GUARD_DIGITS");
    require(retry_guard_digits >= 1, "retry_guard_digits must be at least 1",
            "DIGITLOOM_RETRY_GUARD_DIGITS");
    require(stability_extra_guard >= 1, "stability_extra_guard must be at least 1",
            "DIGITLOOM_STABILITY_EXTRA_GUARD");
    require(stability_window >= 1, "stability_window must be at least 1",
            "DIGITLOOM_STABILITY_WINDOW");
    require(bbp_guard_bits >= 10, "bbp_guard_bits must be at least 10", "DIGITLOOM_BBP_GUARD_BITS");
    require(bbp_max_precision_bits >= 128, "bbp_max_precision_bits must be at least 128",
            "DIGITLOOM_BBP_MAX_PRECISION");
    require(bbp_digits_per_eval >= 1 && bbp_digits_per_eval <= 12,
            "bbp_digits_per_eval must be in [1, 12]", "bbp_digits_per_eval");
    require(split_leaf_terms >= 1, "split_leaf_terms must be at least 1", "DIGITLOOM_SPLIT_LEAF_TERMS");
    require(split_task_terms > split_leaf_terms, "split_task_terms must exceed split_leaf_terms",
            "DIGITLOOM_SPLIT_TASK_TERMS");
    require(scrypt_log2_n >= 10 && scrypt_log2_n <= 22, "scrypt_log2_n must be in [10, 22]",
            "DIGITLOOM_SCRYPT_LOG2_N");
    require(scrypt_r >= 1 && scrypt_p >= 1, "scrypt r and p must be positive", "scrypt");
}

} // namespace digitloom
