#ifndef RHO_SUBSTITUTE_HPP
#define RHO_SUBSTITUTE_HPP

#include <rho/par.hpp>
#include <rho/env.hpp>
#include <rho/canonicalization.hpp>
#include <stdexcept>
#include <variant>

namespace rho {

/**
 * Raised when a free variable or a wildcard reaches substitution.
 * Trees must be fully elaborated before they are substituted into; this
 * signals a defect upstream, not a recoverable condition.
 */
class IllegalSubstitutionError : public std::logic_error {
public:
    explicit IllegalSubstitutionError(const Var& var);

    const Var& var() const { return var_; }

private:
    Var var_;
};

/**
 * A reference the environment has no value for. Holds the rebuilt node,
 * with its index unchanged.
 */
template<typename Node>
struct Unresolved {
    Node node;
};

// Either the node stays a reference, or it resolves to a whole process
template<typename Node>
using Resolution = std::variant<Unresolved<Node>, Par>;

/**
 * Capture-avoiding substitution of environment values into terms.
 *
 * Every rebuilt node is passed through the canonicalizer before it is
 * returned, so results are always in canonical form. Each binder extends the
 * environment before its body is visited:
 *
 *   New       body under env.shift(bind_count)
 *   Receive   sources under env, body under env.shift(bind_count)
 *   Match     target under env, each case body under env.shift(case free_count)
 *
 * Rebuilt nodes keep their free_count; their locally_free set is trimmed to
 * the indices below env.current_shift().
 *
 * Substituters are immutable and can be shared between threads. The
 * canonicalizer must outlive the substituter.
 */
class Substituter {
public:
    Substituter() : canonicalizer_(default_canonicalizer()) {}

    explicit Substituter(const TermCanonicalizer& canonicalizer)
        : canonicalizer_(canonicalizer) {}

    /**
     * Resolve a single variable. Throws IllegalSubstitutionError for
     * anything but a bound variable.
     */
    Resolution<Var> maybe_substitute(const Var& var, const Env& env) const;
    Resolution<EVar> maybe_substitute(const EVar& evar, const Env& env) const;

    /**
     * Dereference of a quoted process resolves to that process, substituted.
     * Dereference of a variable resolves when the variable does.
     */
    Resolution<Eval> maybe_substitute(const Eval& eval, const Env& env) const;

    /**
     * Variable expressions and dereferences that resolve are spliced into the
     * result as parallel siblings.
     */
    Par substitute(const Par& par, const Env& env) const;

    Send substitute(const Send& send, const Env& env) const;
    Receive substitute(const Receive& receive, const Env& env) const;
    New substitute(const New& block, const Env& env) const;
    Match substitute(const Match& match, const Env& env) const;
    Expr substitute(const Expr& expr, const Env& env) const;

    // A resolved channel variable becomes a quote of its value
    Channel substitute(const Channel& channel, const Env& env) const;
    Quote substitute(const Quote& quote, const Env& env) const;

    const TermCanonicalizer& canonicalizer() const { return canonicalizer_; }

private:
    const TermCanonicalizer& canonicalizer_;
};

// =============================================================================
// Convenience functions using the default canonicalizer
// =============================================================================

Resolution<Var> maybe_substitute(const Var& var, const Env& env);
Resolution<EVar> maybe_substitute(const EVar& evar, const Env& env);
Resolution<Eval> maybe_substitute(const Eval& eval, const Env& env);

Par substitute(const Par& par, const Env& env);
Send substitute(const Send& send, const Env& env);
Receive substitute(const Receive& receive, const Env& env);
New substitute(const New& block, const Env& env);
Match substitute(const Match& match, const Env& env);
Expr substitute(const Expr& expr, const Env& env);
Channel substitute(const Channel& channel, const Env& env);
Quote substitute(const Quote& quote, const Env& env);

} // namespace rho

#endif // RHO_SUBSTITUTE_HPP
