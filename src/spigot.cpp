#include "digitloom/spigot.hpp"

#include <sstream>
#include <stdexcept>

#include "digitloom/error.hpp"

namespace digitloom {

SpigotStreamer::SpigotStreamer(Base base, uint64_t limit, const CancellationToken* cancel)
    : base_(base), limit_(limit), cancel_(cancel), q_(1), r_(0), t_(1), n_(3) {
    //  Run until the integer digit 3 comes out; the transform is then
    //  scaled so every later emission is a base-b fractional digit.
    while (!emit_ready()) absorb();
    uint8_t integer_digit = 0;
    emit(integer_digit);
}

SpigotStreamer::SpigotStreamer(const SpigotSnapshot& snapshot, const CancellationToken* cancel)
    : base_(snapshot.base),
      limit_(snapshot.limit),
      cancel_(cancel),
      emitted_(snapshot.emitted),
      q_(snapshot.q),
      r_(snapshot.r),
      t_(snapshot.t),
      n_(snapshot.n),
      k_(snapshot.k),
      l_(snapshot.l) {
    if (t_.sign() <= 0 || q_.sign() <= 0 || k_ == 0 || l_ < 3) {
        throw InvalidRequest("spigot snapshot holds an impossible state");
    }
}

//  4q + r - t < n t
bool SpigotStreamer::emit_ready() const {
    BigInt lhs;
    mpz_mul_ui(lhs.get(), q_.get(), 4);
    mpz_add(lhs.get(), lhs.get(), r_.get());
    mpz_sub(lhs.get(), lhs.get(), t_.get());

    BigInt rhs;
    mpz_mul(rhs.get(), n_.get(), t_.get());
    return mpz_cmp(lhs.get(), rhs.get()) < 0;
}

void SpigotStreamer::emit(uint8_t& digit) {
    const unsigned long b = static_cast<unsigned long>(radix(base_));
    digit = static_cast<uint8_t>(mpz_get_ui(n_.get()));

    //  n' = floor(b (3q + r) / t) - b n, from the old q and r
    BigInt next;
    mpz_mul_ui(next.get(), q_.get(), 3);
    mpz_add(next.get(), next.get(), r_.get());
    mpz_mul_ui(next.get(), next.get(), b);
    mpz_fdiv_q(next.get(), next.get(), t_.get());
    mpz_submul_ui(next.get(), n_.get(), b);

    //  r' = b (r - n t),  q' = b q
    mpz_mul(scratch_.get(), n_.get(), t_.get());
    mpz_sub(r_.get(), r_.get(), scratch_.get());
    mpz_mul_ui(r_.get(), r_.get(), b);
    mpz_mul_ui(q_.get(), q_.get(), b);

    mpz_swap(n_.get(), next.get());
}

void SpigotStreamer::absorb() {
    //  n' = (q (7k + 2) + r l) / (t l), from the old state
    BigInt numerator;
    mpz_mul_ui(numerator.get(), q_.get(), 7 * k_ + 2);
    mpz_addmul_ui(numerator.get(), r_.get(), l_);
    mpz_mul_ui(scratch_.get(), t_.get(), l_);
    mpz_fdiv_q(n_.get(), numerator.get(), scratch_.get());

    //  r' = (2q + r) l,  q' = q k,  t' = t l
    mpz_addmul_ui(r_.get(), q_.get(), 2);
    mpz_mul_ui(r_.get(), r_.get(), l_);
    mpz_mul_ui(q_.get(), q_.get(), k_);
    mpz_swap(t_.get(), scratch_.get());

    k_ += 1;
    l_ += 2;
}

SpigotStep SpigotStreamer::step(uint8_t& digit) {
    if (finished()) return SpigotStep::Finished;
    if (emit_ready()) {
        emit(digit);
        emitted_++;
        return SpigotStep::Emitted;
    }
    absorb();
    return SpigotStep::Deferred;
}

bool SpigotStreamer::next_digit(uint8_t& digit) {
    for (;;) {
        if (is_cancelled(cancel_)) throw CancellationRequested(emitted_);
        switch (step(digit)) {
            case SpigotStep::Emitted:  return true;
            case SpigotStep::Finished: return false;
            case SpigotStep::Deferred: break;
        }
    }
}

size_t SpigotStreamer::next_batch(size_t max, std::vector<uint8_t>& out) {
    size_t appended = 0;
    uint8_t digit = 0;
    while (appended < max && next_digit(digit)) {
        out.push_back(digit);
        appended++;
    }
    return appended;
}

SpigotSnapshot SpigotStreamer::snapshot() const {
    SpigotSnapshot out;
    out.base = base_;
    out.emitted = emitted_;
    out.limit = limit_;
    out.k = k_;
    out.l = l_;
    out.q = q_;
    out.r = r_;
    out.t = t_;
    out.n = n_;
    return out;
}

////////////////////////////////////////////////////////////////////////////////

std::string SpigotSnapshot::serialize() const {
    std::ostringstream out;
    out << radix(base) << ' ' << emitted << ' ' << limit << ' ' << k << ' ' << l << ' '
        << q.to_string(16) << ' ' << r.to_string(16) << ' ' << t.to_string(16) << ' '
        << n.to_string(16);
    return out.str();
}

SpigotSnapshot SpigotSnapshot::parse(const std::string& text) {
    std::istringstream in(text);
    int base = 0;
    SpigotSnapshot out;
    std::string q, r, t, n;
    if (!(in >> base >> out.emitted >> out.limit >> out.k >> out.l >> q >> r >> t >> n)) {
        throw InvalidRequest("malformed spigot snapshot");
    }
    std::string rest;
    if (in >> rest) throw InvalidRequest("trailing data in spigot snapshot");

    out.base = to_base(base);
    try {
        out.q = BigInt(q, 16);
        out.r = BigInt(r, 16);
        out.t = BigInt(t, 16);
        out.n = BigInt(n, 16);
    } catch (const std::invalid_argument& e) {
        throw InvalidRequest(std::string("malformed spigot snapshot: ") + e.what());
    }
    return out;
}

} // namespace digitloom
