#include <rho/bitset.hpp>
#include <sstream>
#include <algorithm>

namespace rho {

BitSet BitSet::until(std::size_t limit) const {
    BitSet result;
    if (limit == 0 || words_.empty()) {
        return result;
    }

    std::size_t full_words = limit / BITS_PER_WORD;
    std::size_t tail_bits = limit % BITS_PER_WORD;

    std::size_t keep = std::min(words_.size(), full_words + (tail_bits ? 1 : 0));
    result.words_.assign(words_.begin(), words_.begin() + keep);

    if (tail_bits && full_words < result.words_.size()) {
        result.words_[full_words] &= (1ULL << tail_bits) - 1;
    }
    result.normalize();
    return result;
}

BitSet BitSet::shifted_down(std::size_t n) const {
    if (n == 0) {
        return *this;
    }
    BitSet result;
    for_each([&](std::size_t i) {
        if (i >= n) {
            result.set(i - n);
        }
    });
    return result;
}

std::string BitSet::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for_each([&](std::size_t i) {
        if (!first) oss << ",";
        oss << i;
        first = false;
    });
    oss << "}";
    return oss.str();
}

} // namespace rho
