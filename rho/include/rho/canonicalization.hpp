#ifndef RHO_CANONICALIZATION_HPP
#define RHO_CANONICALIZATION_HPP

#include <rho/par.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace rho {

/**
 * Node tags used as the first leaf of every score node.
 * Their numeric order fixes the relative order of different node kinds.
 */
enum class ScoreTag : int64_t {
    BoundVar = 1,
    FreeVar,
    Wildcard,
    Quote,
    ChanVar,
    Send,
    Receive,
    Bind,
    New,
    Match,
    Case,
    Eval,
    Private,
    GBool,
    GInt,
    GString,
    GUri,
    EVar,
    EUnary,
    EBinary,
    EList,
    ETuple,
    ESet,
    EMap,
    KeyValue,
    Expr,
    Par
};

/**
 * Sort key of a term.
 *
 * A tree whose leaves are integers or strings. Trees are totally ordered:
 * integers sort before strings, strings before nodes, and nodes compare their
 * children lexicographically (a proper prefix sorts first).
 *
 * Scores cover only what a term means. free_count, locally_free and
 * connective_used are derived bookkeeping and never scored.
 */
class ScoreTree {
public:
    using Children = std::vector<ScoreTree>;

    static ScoreTree leaf(int64_t value) {
        ScoreTree t;
        t.value_ = value;
        return t;
    }

    static ScoreTree leaf(std::string value) {
        ScoreTree t;
        t.value_ = std::move(value);
        return t;
    }

    static ScoreTree node(ScoreTag tag) {
        ScoreTree t;
        t.value_ = Children{leaf(static_cast<int64_t>(tag))};
        return t;
    }

    // Append a child to a node. Has no effect on a leaf.
    ScoreTree& add(ScoreTree child) {
        if (auto* children = std::get_if<Children>(&value_)) {
            children->push_back(std::move(child));
        }
        return *this;
    }

    bool is_leaf() const { return !std::holds_alternative<Children>(value_); }

    // <0, 0 or >0
    int compare(const ScoreTree& other) const;

    bool operator<(const ScoreTree& other) const { return compare(other) < 0; }
    bool operator==(const ScoreTree& other) const { return compare(other) == 0; }
    bool operator!=(const ScoreTree& other) const { return compare(other) != 0; }

    // FNV-1a over a structural encoding of the tree
    uint64_t hash() const;

    std::string to_string() const;

private:
    ScoreTree() = default;

    std::variant<int64_t, std::string, Children> value_;
};

/**
 * Produces the canonical representative of a term.
 *
 * Implementations must be deterministic and total, and canonicalizing a
 * canonical term must return it unchanged.
 */
class TermCanonicalizer {
public:
    virtual ~TermCanonicalizer() = default;

    virtual Par canonicalize(const Par& par) const = 0;
    virtual Send canonicalize(const Send& send) const = 0;
    virtual Receive canonicalize(const Receive& receive) const = 0;
    virtual New canonicalize(const New& block) const = 0;
    virtual Match canonicalize(const Match& match) const = 0;
    virtual Expr canonicalize(const Expr& expr) const = 0;
    virtual Channel canonicalize(const Channel& channel) const = 0;
    virtual Eval canonicalize(const Eval& eval) const = 0;
};

/**
 * Score-sorting canonicalizer.
 *
 * Canonical form is reached recursively:
 * - every child list of a Par is sorted by score
 * - set elements are sorted by score with duplicates removed
 * - map pairs are sorted by key score; for a repeated key the last pair wins
 *
 * Send data, list and tuple elements, receive binds, match cases and
 * binary operands keep their order.
 */
class Canonicalizer : public TermCanonicalizer {
public:
    Par canonicalize(const Par& par) const override;
    Send canonicalize(const Send& send) const override;
    Receive canonicalize(const Receive& receive) const override;
    New canonicalize(const New& block) const override;
    Match canonicalize(const Match& match) const override;
    Expr canonicalize(const Expr& expr) const override;
    Channel canonicalize(const Channel& channel) const override;
    Eval canonicalize(const Eval& eval) const override;

    // Score of the canonical form
    ScoreTree score(const Par& par) const;
    ScoreTree score(const Expr& expr) const;

    // Content address of a term: equal for equivalent terms
    uint64_t hash(const Par& par) const {
        return score(par).hash();
    }

    // Same canonical form, ignoring bookkeeping
    bool equivalent(const Par& a, const Par& b) const {
        return score(a) == score(b);
    }
};

/**
 * Process-wide canonicalizer used by the free substitution functions.
 * Stateless, so it is safe to share between threads.
 */
const Canonicalizer& default_canonicalizer();

} // namespace rho

namespace std {
    template<>
    struct hash<rho::Par> {
        std::size_t operator()(const rho::Par& par) const {
            return static_cast<std::size_t>(rho::default_canonicalizer().hash(par));
        }
    };
}

#endif // RHO_CANONICALIZATION_HPP
