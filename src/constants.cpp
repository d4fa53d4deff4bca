#include "digitloom/constants.hpp"

#include <algorithm>
#include <cctype>

#include "digitloom/binary_splitting.hpp"
#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"
#include "digitloom/series.hpp"

namespace digitloom {

namespace {

struct NameEntry {
    const char* name;
    ConstantId id;
};

const NameEntry NAMES[] = {
    {"pi", ConstantId::Pi},
    {"tau", ConstantId::Tau},
    {"e", ConstantId::E},
    {"sqrt2", ConstantId::Sqrt2},
    {"phi", ConstantId::Phi},
    {"gamma", ConstantId::EulerGamma},
    {"zeta3", ConstantId::Zeta3},
    {"catalan", ConstantId::Catalan},
    {"ln2", ConstantId::Ln2},
    {"zeta2", ConstantId::Zeta2},

    //  Aliases
    {"\xcf\x80", ConstantId::Pi},            //  π
    {"\xcf\x84", ConstantId::Tau},           //  τ
    {"\xcf\x86", ConstantId::Phi},           //  φ
    {"\xce\xb3", ConstantId::EulerGamma},    //  γ
    {"golden_ratio", ConstantId::Phi},
    {"goldenratio", ConstantId::Phi},
    {"euler", ConstantId::E},
    {"euler_gamma", ConstantId::EulerGamma},
    {"eulergamma", ConstantId::EulerGamma},
    {"apery", ConstantId::Zeta3},
    {"log2", ConstantId::Ln2},
};

std::string lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* constant_name(ConstantId id) {
    switch (id) {
        case ConstantId::Pi:         return "pi";
        case ConstantId::Tau:        return "tau";
        case ConstantId::E:          return "e";
        case ConstantId::Sqrt2:      return "sqrt2";
        case ConstantId::Phi:        return "phi";
        case ConstantId::EulerGamma: return "gamma";
        case ConstantId::Zeta3:      return "zeta3";
        case ConstantId::Catalan:    return "catalan";
        case ConstantId::Ln2:        return "ln2";
        case ConstantId::Zeta2:      return "zeta2";
    }
    return "?";
}

bool find_constant(const std::string& name, ConstantId& id) {
    std::string key = lower(name);
    for (const NameEntry& entry : NAMES) {
        if (key == entry.name) {
            id = entry.id;
            return true;
        }
    }
    return false;
}

ConstantId parse_constant(const std::string& name) {
    ConstantId id;
    if (!find_constant(name, id)) {
        throw UnsupportedConstant("unknown constant '" + name + "'");
    }
    return id;
}

const std::vector<ConstantId>& all_constants() {
    static const std::vector<ConstantId> ids = {
        ConstantId::Pi, ConstantId::Tau, ConstantId::E, ConstantId::Sqrt2, ConstantId::Phi,
        ConstantId::EulerGamma, ConstantId::Zeta3, ConstantId::Catalan, ConstantId::Ln2,
        ConstantId::Zeta2,
    };
    return ids;
}

ConstantEvaluator::ConstantEvaluator(const EngineConfig& config, const CancellationToken* cancel,
                                     PiAlgorithm pi_algorithm)
    : config_(config), cancel_(cancel), pi_algorithm_(pi_algorithm) {}

const BigFloat* ConstantEvaluator::lookup(ConstantId id, mpfr_prec_t bits) const {
    auto it = cache_.find(id);
    if (it != cache_.end() && it->second.bits >= bits) {
        return &it->second.value;
    }
    return nullptr;
}

void ConstantEvaluator::store(ConstantId id, mpfr_prec_t bits, const BigFloat& value) {
    auto it = cache_.find(id);
    if (it != cache_.end() && it->second.bits >= bits) return;
    cache_[id] = Cached{bits, value};
}

BigFloat ConstantEvaluator::evaluate(ConstantId id, mpfr_prec_t bits) {
    if (const BigFloat* cached = lookup(id, bits)) {
        return *cached;
    }

    BigFloat value = compute(id, bits);
    store(id, bits, value);
    return value;
}

BigFloat ConstantEvaluator::pi(mpfr_prec_t bits) {
    if (const BigFloat* cached = lookup(ConstantId::Pi, bits)) {
        return *cached;
    }

    BigFloat value;
    if (pi_algorithm_ == PiAlgorithm::BinarySplitting) {
        BinarySplittingEngine engine(config_, cancel_);
        value = engine.pi(bits);
    } else {
        SeriesEngine engine(config_, cancel_);
        value = engine.pi(bits);
    }
    store(ConstantId::Pi, bits, value);
    return value;
}

BigFloat ConstantEvaluator::compute(ConstantId id, mpfr_prec_t bits) {
    logging::get()->debug("evaluating {} to {} bits", constant_name(id), bits);

    SeriesEngine series(config_, cancel_);
    mpfr_prec_t precision = bits + 16;

    switch (id) {
        case ConstantId::Pi:
            return pi(bits);

        case ConstantId::Tau: {
            BigFloat out = pi(bits);
            mpfr_mul_2ui(out.get(), out.get(), 1, MPFR_RNDN);
            return out;
        }

        case ConstantId::E:
            return series.e(bits);

        case ConstantId::Sqrt2: {
            BigFloat out(precision);
            mpfr_sqrt_ui(out.get(), 2, MPFR_RNDN);
            return out;
        }

        case ConstantId::Phi: {
            //  (1 + sqrt 5) / 2
            BigFloat out(precision);
            mpfr_sqrt_ui(out.get(), 5, MPFR_RNDN);
            mpfr_add_ui(out.get(), out.get(), 1, MPFR_RNDN);
            mpfr_div_2ui(out.get(), out.get(), 1, MPFR_RNDN);
            return out;
        }

        case ConstantId::EulerGamma:
            return series.euler_gamma(bits);

        case ConstantId::Zeta3:
            return series.zeta3(bits);

        case ConstantId::Catalan:
            return series.catalan(bits, pi(bits + 8));

        case ConstantId::Ln2:
            return series.ln2(bits);

        case ConstantId::Zeta2: {
            //  pi^2 / 6
            BigFloat out = pi(bits + 4);
            mpfr_sqr(out.get(), out.get(), MPFR_RNDN);
            mpfr_div_ui(out.get(), out.get(), 6, MPFR_RNDN);
            return out;
        }
    }
    throw UnsupportedConstant("unhandled constant");
}

} // namespace digitloom
