#ifndef RHO_BITSET_HPP
#define RHO_BITSET_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <initializer_list>
#include <string>

namespace rho {

// =============================================================================
// BitSet: growable set of small non-negative integers
// =============================================================================
//
// Records which enclosing-binder indices a subtree references (its
// "locally free" set). Storage is a vector of 64-bit words that is kept
// normalized (no trailing zero words) so that equality is a word compare.
//
// Value type: copies are independent, no sharing.

class BitSet {
public:
    static constexpr std::size_t BITS_PER_WORD = 64;

    BitSet() = default;

    BitSet(std::initializer_list<std::size_t> indices) {
        for (std::size_t i : indices) {
            set(i);
        }
    }

    bool contains(std::size_t index) const {
        std::size_t word_idx = index / BITS_PER_WORD;
        if (word_idx >= words_.size()) return false;
        return (words_[word_idx] >> (index % BITS_PER_WORD)) & 1;
    }

    void set(std::size_t index) {
        std::size_t word_idx = index / BITS_PER_WORD;
        if (word_idx >= words_.size()) {
            words_.resize(word_idx + 1, 0);
        }
        words_[word_idx] |= (1ULL << (index % BITS_PER_WORD));
    }

    void clear(std::size_t index) {
        std::size_t word_idx = index / BITS_PER_WORD;
        if (word_idx >= words_.size()) return;
        words_[word_idx] &= ~(1ULL << (index % BITS_PER_WORD));
        normalize();
    }

    bool empty() const {
        return words_.empty();
    }

    std::size_t count() const {
        std::size_t total = 0;
        for (uint64_t w : words_) {
            total += static_cast<std::size_t>(__builtin_popcountll(w));
        }
        return total;
    }

    // Indices strictly below `limit`
    BitSet until(std::size_t limit) const;

    // Indices >= `n`, each reduced by `n`: the view from outside a binder of n
    BitSet shifted_down(std::size_t n) const;

    BitSet& operator|=(const BitSet& other) {
        if (other.words_.size() > words_.size()) {
            words_.resize(other.words_.size(), 0);
        }
        for (std::size_t i = 0; i < other.words_.size(); ++i) {
            words_[i] |= other.words_[i];
        }
        return *this;
    }

    friend BitSet operator|(BitSet lhs, const BitSet& rhs) {
        lhs |= rhs;
        return lhs;
    }

    bool operator==(const BitSet& other) const {
        return words_ == other.words_;
    }

    bool operator!=(const BitSet& other) const {
        return !(*this == other);
    }

    // Iterate set indices in ascending order
    template<typename F>
    void for_each(F&& f) const {
        for (std::size_t w = 0; w < words_.size(); ++w) {
            uint64_t word = words_[w];
            while (word) {
                std::size_t bit = static_cast<std::size_t>(__builtin_ctzll(word));
                f(w * BITS_PER_WORD + bit);
                word &= word - 1;
            }
        }
    }

    std::vector<std::size_t> to_vector() const {
        std::vector<std::size_t> out;
        out.reserve(count());
        for_each([&out](std::size_t i) { out.push_back(i); });
        return out;
    }

    std::string to_string() const;

private:
    std::vector<uint64_t> words_;

    void normalize() {
        while (!words_.empty() && words_.back() == 0) {
            words_.pop_back();
        }
    }
};

} // namespace rho

#endif // RHO_BITSET_HPP
