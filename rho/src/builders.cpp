#include <rho/builders.hpp>
#include <stdexcept>

namespace rho {

namespace {

BitSet union_of(const std::vector<Par>& ps) {
    BitSet result;
    for (const auto& p : ps) {
        result |= p.locally_free;
    }
    return result;
}

uint32_t free_count_of(const std::vector<Par>& ps) {
    uint32_t total = 0;
    for (const auto& p : ps) {
        total += p.free_count;
    }
    return total;
}

struct ExprLocallyFree {
    BitSet operator()(const GBool&) const { return {}; }
    BitSet operator()(const GInt&) const { return {}; }
    BitSet operator()(const GString&) const { return {}; }
    BitSet operator()(const GUri&) const { return {}; }
    BitSet operator()(const EVar& e) const { return locally_free_of(e.v); }
    BitSet operator()(const EUnary& e) const { return e.p->locally_free; }
    BitSet operator()(const EBinary& e) const { return e.p1->locally_free | e.p2->locally_free; }
    BitSet operator()(const EList& e) const { return e.locally_free; }
    BitSet operator()(const ETuple& e) const { return e.locally_free; }
    BitSet operator()(const ESet& e) const { return e.locally_free; }
    BitSet operator()(const EMap& e) const { return e.locally_free; }
};

template<typename Collection>
Expr make_sequence(std::vector<Par> ps, bool connective_used) {
    Collection c;
    c.locally_free = union_of(ps);
    c.free_count = free_count_of(ps);
    c.ps = std::move(ps);
    c.connective_used = connective_used;
    return Expr{std::move(c)};
}

} // namespace

BitSet locally_free_of(const Var& var) {
    if (const auto* bound = std::get_if<BoundVar>(&var.instance)) {
        return BitSet{bound->index};
    }
    return {};
}

BitSet locally_free_of(const Channel& channel) {
    if (const auto* q = std::get_if<Quote>(&channel.instance)) {
        return q->value->locally_free;
    }
    return locally_free_of(std::get<ChanVar>(channel.instance).var);
}

BitSet locally_free_of(const Expr& expr) {
    return std::visit(ExprLocallyFree{}, expr.instance);
}

BitSet locally_free_of(const Eval& eval) {
    return locally_free_of(eval.channel);
}

Expr make_unary(UnaryOp op, Par p) {
    return Expr{EUnary{op, std::move(p)}};
}

Expr make_binary(BinaryOp op, Par p1, Par p2) {
    return Expr{EBinary{op, std::move(p1), std::move(p2)}};
}

Expr make_elist(std::vector<Par> ps, bool connective_used) {
    return make_sequence<EList>(std::move(ps), connective_used);
}

Expr make_etuple(std::vector<Par> ps, bool connective_used) {
    return make_sequence<ETuple>(std::move(ps), connective_used);
}

Expr make_eset(std::vector<Par> ps, bool connective_used) {
    return make_sequence<ESet>(std::move(ps), connective_used);
}

Expr make_emap(std::vector<std::pair<Par, Par>> kvs, bool connective_used) {
    EMap m;
    m.connective_used = connective_used;
    m.kvs.reserve(kvs.size());
    for (auto& [key, value] : kvs) {
        m.locally_free |= key.locally_free;
        m.locally_free |= value.locally_free;
        m.free_count += key.free_count + value.free_count;
        m.kvs.push_back(KeyValuePair{std::move(key), std::move(value)});
    }
    return Expr{std::move(m)};
}

Send make_send(Channel chan, std::vector<Par> data, bool persistent) {
    Send send;
    send.locally_free = locally_free_of(chan) | union_of(data);
    send.free_count = free_count_of(data);
    send.chan = std::move(chan);
    send.data = std::move(data);
    send.persistent = persistent;
    return send;
}

ReceiveBind make_bind(std::vector<Channel> patterns, Channel source, uint32_t free_count) {
    return ReceiveBind{std::move(patterns), std::move(source), free_count};
}

Receive make_receive(std::vector<ReceiveBind> binds, Par body, bool persistent) {
    if (binds.empty()) {
        throw std::invalid_argument("Receive must have at least one bind");
    }

    Receive receive;
    for (const auto& bind : binds) {
        receive.bind_count += bind.free_count;
        receive.locally_free |= locally_free_of(bind.source);
        for (const auto& pattern : bind.patterns) {
            receive.locally_free |= locally_free_of(pattern);
        }
    }
    receive.locally_free |= body.locally_free.shifted_down(receive.bind_count);
    receive.binds = std::move(binds);
    receive.body = std::move(body);
    receive.persistent = persistent;
    return receive;
}

New make_new(uint32_t bind_count, Par body) {
    New block;
    block.bind_count = bind_count;
    block.locally_free = body.locally_free.shifted_down(bind_count);
    block.p = std::move(body);
    return block;
}

MatchCase make_case(Par pattern, Par body, uint32_t free_count) {
    return MatchCase{std::move(pattern), std::move(body), free_count};
}

Match make_match(Par target, std::vector<MatchCase> cases) {
    if (cases.empty()) {
        throw std::invalid_argument("Match must have at least one case");
    }

    Match match;
    match.locally_free = target.locally_free;
    for (const auto& c : cases) {
        match.locally_free |= c.pattern->locally_free;
        match.locally_free |= c.body->locally_free.shifted_down(c.free_count);
    }
    match.target = std::move(target);
    match.cases = std::move(cases);
    return match;
}

ParBuilder& ParBuilder::add(Send send) {
    par_.locally_free |= send.locally_free;
    par_.sends.push_back(std::move(send));
    return *this;
}

ParBuilder& ParBuilder::add(Receive receive) {
    par_.locally_free |= receive.locally_free;
    par_.receives.push_back(std::move(receive));
    return *this;
}

ParBuilder& ParBuilder::add(New block) {
    par_.locally_free |= block.locally_free;
    par_.news.push_back(std::move(block));
    return *this;
}

ParBuilder& ParBuilder::add(Expr expr) {
    par_.locally_free |= locally_free_of(expr);
    par_.exprs.push_back(std::move(expr));
    return *this;
}

ParBuilder& ParBuilder::add(Match match) {
    par_.locally_free |= match.locally_free;
    par_.matches.push_back(std::move(match));
    return *this;
}

ParBuilder& ParBuilder::add(Eval eval) {
    par_.locally_free |= locally_free_of(eval);
    par_.evals.push_back(std::move(eval));
    return *this;
}

ParBuilder& ParBuilder::add(GPrivate id) {
    par_.ids.push_back(std::move(id));
    return *this;
}

ParBuilder& ParBuilder::add(const Par& par) {
    par_ += par;
    return *this;
}

} // namespace rho
