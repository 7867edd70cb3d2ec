#ifndef RHO_BUILDERS_HPP
#define RHO_BUILDERS_HPP

#include <rho/par.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace rho {

// =============================================================================
// Locally-free sets
// =============================================================================
// A node references the union of what its children reference. A binder that
// introduces n slots hides indices 0..n-1 of its body and shifts the rest
// down by n.

BitSet locally_free_of(const Var& var);
BitSet locally_free_of(const Channel& channel);
BitSet locally_free_of(const Expr& expr);
BitSet locally_free_of(const Eval& eval);

// =============================================================================
// Leaf factories
// =============================================================================

inline Var bound_var(std::size_t index) { return Var{BoundVar{index}}; }
inline Var free_var(std::size_t index) { return Var{FreeVar{index}}; }
inline Var wildcard() { return Var{Wildcard{}}; }

inline Channel quote(Par p) { return Channel{Quote{std::move(p)}}; }
inline Channel chan_var(Var v) { return Channel{ChanVar{std::move(v)}}; }

inline Expr gbool(bool value) { return Expr{GBool{value}}; }
inline Expr gint(int64_t value) { return Expr{GInt{value}}; }
inline Expr gstring(std::string value) { return Expr{GString{std::move(value)}}; }
inline Expr guri(std::string value) { return Expr{GUri{std::move(value)}}; }
inline Expr evar(Var v) { return Expr{EVar{std::move(v)}}; }

inline GPrivate make_private(std::string id) { return GPrivate{std::move(id)}; }

// =============================================================================
// Composite factories
// =============================================================================

Expr make_unary(UnaryOp op, Par p);
Expr make_binary(BinaryOp op, Par p1, Par p2);

Expr make_elist(std::vector<Par> ps, bool connective_used = false);
Expr make_etuple(std::vector<Par> ps, bool connective_used = false);
Expr make_eset(std::vector<Par> ps, bool connective_used = false);
Expr make_emap(std::vector<std::pair<Par, Par>> kvs, bool connective_used = false);

Send make_send(Channel chan, std::vector<Par> data, bool persistent = false);

ReceiveBind make_bind(std::vector<Channel> patterns, Channel source, uint32_t free_count);

// bind_count is the sum of the clauses' free counts. Throws
// std::invalid_argument when `binds` is empty.
Receive make_receive(std::vector<ReceiveBind> binds, Par body, bool persistent = false);

New make_new(uint32_t bind_count, Par body);

MatchCase make_case(Par pattern, Par body, uint32_t free_count);

// Throws std::invalid_argument when `cases` is empty.
Match make_match(Par target, std::vector<MatchCase> cases);

inline Eval make_eval(Channel channel) { return Eval{std::move(channel)}; }

// =============================================================================
// ParBuilder
// =============================================================================
// Fluent interface for building a parallel composition. Every added child
// contributes its locally-free set to the result.

class ParBuilder {
    Par par_;

public:
    ParBuilder() = default;

    ParBuilder& add(Send send);
    ParBuilder& add(Receive receive);
    ParBuilder& add(New block);
    ParBuilder& add(Expr expr);
    ParBuilder& add(Match match);
    ParBuilder& add(Eval eval);
    ParBuilder& add(GPrivate id);

    // Merge another composition in
    ParBuilder& add(const Par& par);

    // Free-variable slots introduced when this term is used as a pattern
    ParBuilder& free_count(uint32_t count) {
        par_.free_count = count;
        return *this;
    }

    Par build() const {
        return par_;
    }
};

// Single-child composition
template<typename Node>
Par make_par(Node node) {
    return ParBuilder().add(std::move(node)).build();
}

inline Par nil() { return Par{}; }

} // namespace rho

#endif // RHO_BUILDERS_HPP
