#include <rho/substitute.hpp>
#include <rho/debug_log.hpp>

namespace rho {

IllegalSubstitutionError::IllegalSubstitutionError(const Var& var)
    : std::logic_error("Illegal substitution [" + debug::to_string(var) + "]")
    , var_(var) {}

namespace {

struct ExprSubstituter {
    const Substituter& sub;
    const Env& env;

    Expr operator()(const EUnary& e) const {
        return Expr{EUnary{e.op, sub.substitute(*e.p, env)}};
    }

    Expr operator()(const EBinary& e) const {
        return Expr{EBinary{e.op, sub.substitute(*e.p1, env), sub.substitute(*e.p2, env)}};
    }

    Expr operator()(const EList& e) const { return Expr{rebuild(e)}; }
    Expr operator()(const ETuple& e) const { return Expr{rebuild(e)}; }
    Expr operator()(const ESet& e) const { return Expr{rebuild(e)}; }

    Expr operator()(const EMap& e) const {
        EMap result;
        result.kvs.reserve(e.kvs.size());
        for (const auto& kv : e.kvs) {
            result.kvs.push_back(KeyValuePair{sub.substitute(*kv.key, env),
                                              sub.substitute(*kv.value, env)});
        }
        result.free_count = e.free_count;
        result.locally_free = e.locally_free.until(env.current_shift());
        result.connective_used = e.connective_used;
        return Expr{std::move(result)};
    }

    // Ground values and variable expressions are left alone
    template<typename Leaf>
    Expr operator()(const Leaf& e) const {
        return Expr{e};
    }

private:
    template<typename Collection>
    Collection rebuild(const Collection& e) const {
        Collection result;
        result.ps.reserve(e.ps.size());
        for (const auto& p : e.ps) {
            result.ps.push_back(sub.substitute(p, env));
        }
        result.free_count = e.free_count;
        result.locally_free = e.locally_free.until(env.current_shift());
        result.connective_used = e.connective_used;
        return result;
    }
};

} // namespace

// =============================================================================
// Reference resolution
// =============================================================================

Resolution<Var> Substituter::maybe_substitute(const Var& var, const Env& env) const {
    const auto* bound = std::get_if<BoundVar>(&var.instance);
    if (!bound) {
        RHO_DEBUG_LOG("Substitution aborted on %s", debug::to_string(var).c_str());
        throw IllegalSubstitutionError(var);
    }

    if (const Par* value = env.get(bound->index)) {
        return *value;
    }
    return Unresolved<Var>{var};
}

Resolution<EVar> Substituter::maybe_substitute(const EVar& evar, const Env& env) const {
    auto resolved = maybe_substitute(evar.v, env);
    if (auto* par = std::get_if<Par>(&resolved)) {
        return std::move(*par);
    }
    return Unresolved<EVar>{EVar{std::get<Unresolved<Var>>(resolved).node}};
}

Resolution<Eval> Substituter::maybe_substitute(const Eval& eval, const Env& env) const {
    if (const auto* q = std::get_if<Quote>(&eval.channel.instance)) {
        return substitute(*q->value, env);
    }

    auto resolved = maybe_substitute(std::get<ChanVar>(eval.channel.instance).var, env);
    if (auto* par = std::get_if<Par>(&resolved)) {
        return std::move(*par);
    }
    Eval kept{Channel{ChanVar{std::get<Unresolved<Var>>(resolved).node}}};
    return Unresolved<Eval>{canonicalizer_.canonicalize(kept)};
}

// =============================================================================
// Channels
// =============================================================================

Quote Substituter::substitute(const Quote& quote, const Env& env) const {
    return Quote{substitute(*quote.value, env)};
}

Channel Substituter::substitute(const Channel& channel, const Env& env) const {
    if (const auto* q = std::get_if<Quote>(&channel.instance)) {
        return canonicalizer_.canonicalize(Channel{substitute(*q, env)});
    }

    auto resolved = maybe_substitute(std::get<ChanVar>(channel.instance).var, env);
    if (auto* par = std::get_if<Par>(&resolved)) {
        return canonicalizer_.canonicalize(Channel{Quote{std::move(*par)}});
    }
    return canonicalizer_.canonicalize(channel);
}

// =============================================================================
// Processes
// =============================================================================

Par Substituter::substitute(const Par& par, const Env& env) const {
    Par result;
    result.free_count = par.free_count;
    result.locally_free = par.locally_free.until(env.current_shift());

    for (const auto& expr : par.exprs) {
        if (const auto* evar = std::get_if<EVar>(&expr.instance)) {
            auto resolved = maybe_substitute(*evar, env);
            if (auto* value = std::get_if<Par>(&resolved)) {
                result += *value;
            } else {
                result.exprs.push_back(
                    canonicalizer_.canonicalize(Expr{std::get<Unresolved<EVar>>(resolved).node}));
            }
        } else {
            result.exprs.push_back(substitute(expr, env));
        }
    }

    for (const auto& eval : par.evals) {
        auto resolved = maybe_substitute(eval, env);
        if (auto* value = std::get_if<Par>(&resolved)) {
            result += *value;
        } else {
            result.evals.push_back(std::get<Unresolved<Eval>>(resolved).node);
        }
    }

    for (const auto& send : par.sends) {
        result.sends.push_back(substitute(send, env));
    }
    for (const auto& receive : par.receives) {
        result.receives.push_back(substitute(receive, env));
    }
    for (const auto& block : par.news) {
        result.news.push_back(substitute(block, env));
    }
    for (const auto& match : par.matches) {
        result.matches.push_back(substitute(match, env));
    }
    result.ids.insert(result.ids.end(), par.ids.begin(), par.ids.end());

    return canonicalizer_.canonicalize(result);
}

Send Substituter::substitute(const Send& send, const Env& env) const {
    Send result;
    result.chan = substitute(send.chan, env);
    result.data.reserve(send.data.size());
    for (const auto& datum : send.data) {
        result.data.push_back(substitute(datum, env));
    }
    result.persistent = send.persistent;
    result.free_count = send.free_count;
    result.locally_free = send.locally_free.until(env.current_shift());
    return canonicalizer_.canonicalize(result);
}

Receive Substituter::substitute(const Receive& receive, const Env& env) const {
    Receive result;
    result.binds.reserve(receive.binds.size());
    for (const auto& bind : receive.binds) {
        // Patterns are left as written; only the source is resolved
        result.binds.push_back(ReceiveBind{bind.patterns, substitute(bind.source, env), bind.free_count});
    }
    result.body = substitute(*receive.body, env.shift(receive.bind_count));
    result.persistent = receive.persistent;
    result.bind_count = receive.bind_count;
    result.free_count = receive.free_count;
    result.locally_free = receive.locally_free.until(env.current_shift());
    return canonicalizer_.canonicalize(result);
}

New Substituter::substitute(const New& block, const Env& env) const {
    New result;
    result.bind_count = block.bind_count;
    result.p = substitute(*block.p, env.shift(block.bind_count));
    result.locally_free = block.locally_free.until(env.current_shift());
    return canonicalizer_.canonicalize(result);
}

Match Substituter::substitute(const Match& match, const Env& env) const {
    Match result;
    result.target = substitute(*match.target, env);
    result.cases.reserve(match.cases.size());
    for (const auto& c : match.cases) {
        result.cases.push_back(MatchCase{c.pattern, substitute(*c.body, env.shift(c.free_count)), c.free_count});
    }
    result.free_count = match.free_count;
    result.locally_free = match.locally_free.until(env.current_shift());
    return canonicalizer_.canonicalize(result);
}

Expr Substituter::substitute(const Expr& expr, const Env& env) const {
    return canonicalizer_.canonicalize(std::visit(ExprSubstituter{*this, env}, expr.instance));
}

// =============================================================================
// Free functions
// =============================================================================

namespace {

const Substituter& default_substituter() {
    static const Substituter instance;
    return instance;
}

} // namespace

Resolution<Var> maybe_substitute(const Var& var, const Env& env) {
    return default_substituter().maybe_substitute(var, env);
}

Resolution<EVar> maybe_substitute(const EVar& evar, const Env& env) {
    return default_substituter().maybe_substitute(evar, env);
}

Resolution<Eval> maybe_substitute(const Eval& eval, const Env& env) {
    return default_substituter().maybe_substitute(eval, env);
}

Par substitute(const Par& par, const Env& env) {
    return default_substituter().substitute(par, env);
}

Send substitute(const Send& send, const Env& env) {
    return default_substituter().substitute(send, env);
}

Receive substitute(const Receive& receive, const Env& env) {
    return default_substituter().substitute(receive, env);
}

New substitute(const New& block, const Env& env) {
    return default_substituter().substitute(block, env);
}

Match substitute(const Match& match, const Env& env) {
    return default_substituter().substitute(match, env);
}

Expr substitute(const Expr& expr, const Env& env) {
    return default_substituter().substitute(expr, env);
}

Channel substitute(const Channel& channel, const Env& env) {
    return default_substituter().substitute(channel, env);
}

Quote substitute(const Quote& quote, const Env& env) {
    return default_substituter().substitute(quote, env);
}

} // namespace rho
