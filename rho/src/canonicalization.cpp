#include <rho/canonicalization.hpp>
#include <algorithm>
#include <sstream>
#include <utility>

namespace rho {

// =============================================================================
// ScoreTree
// =============================================================================

int ScoreTree::compare(const ScoreTree& other) const {
    if (value_.index() != other.value_.index()) {
        return value_.index() < other.value_.index() ? -1 : 1;
    }

    if (const auto* n = std::get_if<int64_t>(&value_)) {
        int64_t m = std::get<int64_t>(other.value_);
        return *n < m ? -1 : (*n > m ? 1 : 0);
    }

    if (const auto* s = std::get_if<std::string>(&value_)) {
        int c = s->compare(std::get<std::string>(other.value_));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    const auto& lhs = std::get<Children>(value_);
    const auto& rhs = std::get<Children>(other.value_);
    std::size_t common = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < common; ++i) {
        int c = lhs[i].compare(rhs[i]);
        if (c != 0) return c;
    }
    if (lhs.size() == rhs.size()) return 0;
    return lhs.size() < rhs.size() ? -1 : 1;
}

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv_byte(uint64_t h, uint8_t byte) {
    h ^= byte;
    h *= FNV_PRIME;
    return h;
}

inline uint64_t fnv_word(uint64_t h, uint64_t word) {
    for (int i = 0; i < 8; ++i) {
        h = fnv_byte(h, static_cast<uint8_t>(word >> (i * 8)));
    }
    return h;
}

} // namespace

uint64_t ScoreTree::hash() const {
    // Each value is prefixed with its kind and length so that differently
    // shaped trees never encode to the same byte stream
    struct Encoder {
        uint64_t h = FNV_OFFSET;

        void operator()(const ScoreTree& t) {
            std::visit(*this, t.value_);
        }

        void operator()(int64_t n) {
            h = fnv_byte(h, 0);
            h = fnv_word(h, static_cast<uint64_t>(n));
        }

        void operator()(const std::string& s) {
            h = fnv_byte(h, 1);
            h = fnv_word(h, s.size());
            for (char c : s) {
                h = fnv_byte(h, static_cast<uint8_t>(c));
            }
        }

        void operator()(const Children& children) {
            h = fnv_byte(h, 2);
            h = fnv_word(h, children.size());
            for (const auto& child : children) {
                (*this)(child);
            }
        }
    };

    Encoder encoder;
    encoder(*this);
    return encoder.h;
}

std::string ScoreTree::to_string() const {
    if (const auto* n = std::get_if<int64_t>(&value_)) {
        return std::to_string(*n);
    }
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return "\"" + *s + "\"";
    }

    std::ostringstream oss;
    oss << "(";
    const auto& children = std::get<Children>(value_);
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (i > 0) oss << " ";
        oss << children[i].to_string();
    }
    oss << ")";
    return oss.str();
}

// =============================================================================
// Canonical pass
// =============================================================================
// A single bottom-up walk produces each canonical node together with its
// score. Child scores are moved into the parent's score, so every node is
// scored exactly once per pass.

namespace {

template<typename T>
struct Scored {
    T term;
    ScoreTree score;
};

Scored<Par> canonical(const Par& par);
Scored<Channel> canonical(const Channel& channel);
Scored<Send> canonical(const Send& send);
Scored<Receive> canonical(const Receive& receive);
Scored<New> canonical(const New& block);
Scored<Match> canonical(const Match& match);
Scored<Eval> canonical(const Eval& eval);
Scored<GPrivate> canonical(const GPrivate& id);
Scored<Expr> canonical(const Expr& expr);

inline ScoreTree flag(bool value) {
    return ScoreTree::leaf(static_cast<int64_t>(value ? 1 : 0));
}

inline ScoreTree count(uint64_t value) {
    return ScoreTree::leaf(static_cast<int64_t>(value));
}

ScoreTree score_of(const Var& var) {
    if (const auto* bound = std::get_if<BoundVar>(&var.instance)) {
        ScoreTree score = ScoreTree::node(ScoreTag::BoundVar);
        score.add(count(bound->index));
        return score;
    }
    if (const auto* free = std::get_if<FreeVar>(&var.instance)) {
        ScoreTree score = ScoreTree::node(ScoreTag::FreeVar);
        score.add(count(free->index));
        return score;
    }
    return ScoreTree::node(ScoreTag::Wildcard);
}

template<typename T>
std::vector<Scored<T>> canonical_all(const std::vector<T>& items) {
    std::vector<Scored<T>> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(canonical(item));
    }
    return result;
}

template<typename T>
void sort_by_score(std::vector<Scored<T>>& items) {
    std::stable_sort(items.begin(), items.end(),
        [](const Scored<T>& a, const Scored<T>& b) { return a.score < b.score; });
}

// Moves terms into `terms` and their scores under `score`, keeping order
template<typename T>
void unpack(std::vector<Scored<T>>& scored, std::vector<T>& terms, ScoreTree& score) {
    terms.clear();
    terms.reserve(scored.size());
    for (auto& item : scored) {
        terms.push_back(std::move(item.term));
        score.add(std::move(item.score));
    }
}

// One child list of a Par: canonicalized, sorted, scored under `tag`
template<typename T>
void add_sorted(ScoreTag tag, const std::vector<T>& items, std::vector<T>& terms, ScoreTree& parent) {
    auto scored = canonical_all(items);
    sort_by_score(scored);
    ScoreTree list = ScoreTree::node(tag);
    unpack(scored, terms, list);
    parent.add(std::move(list));
}

Scored<Par> canonical(const Par& par) {
    Par result;
    result.free_count = par.free_count;
    result.locally_free = par.locally_free;

    ScoreTree score = ScoreTree::node(ScoreTag::Par);
    add_sorted(ScoreTag::Send, par.sends, result.sends, score);
    add_sorted(ScoreTag::Receive, par.receives, result.receives, score);
    add_sorted(ScoreTag::New, par.news, result.news, score);
    add_sorted(ScoreTag::Expr, par.exprs, result.exprs, score);
    add_sorted(ScoreTag::Match, par.matches, result.matches, score);
    add_sorted(ScoreTag::Eval, par.evals, result.evals, score);
    add_sorted(ScoreTag::Private, par.ids, result.ids, score);
    return {std::move(result), std::move(score)};
}

Scored<Channel> canonical(const Channel& channel) {
    if (const auto* q = std::get_if<Quote>(&channel.instance)) {
        Scored<Par> value = canonical(*q->value);
        ScoreTree score = ScoreTree::node(ScoreTag::Quote);
        score.add(std::move(value.score));
        return {Channel{Quote{std::move(value.term)}}, std::move(score)};
    }

    ScoreTree score = ScoreTree::node(ScoreTag::ChanVar);
    score.add(score_of(std::get<ChanVar>(channel.instance).var));
    return {channel, std::move(score)};
}

Scored<Send> canonical(const Send& send) {
    Send result;
    result.persistent = send.persistent;
    result.free_count = send.free_count;
    result.locally_free = send.locally_free;

    ScoreTree score = ScoreTree::node(ScoreTag::Send);
    score.add(flag(send.persistent));
    Scored<Channel> chan = canonical(send.chan);
    result.chan = std::move(chan.term);
    score.add(std::move(chan.score));

    auto data = canonical_all(send.data);
    unpack(data, result.data, score);
    return {std::move(result), std::move(score)};
}

// Binds keep their order: it fixes the indices the body sees
Scored<Receive> canonical(const Receive& receive) {
    Receive result;
    result.persistent = receive.persistent;
    result.bind_count = receive.bind_count;
    result.free_count = receive.free_count;
    result.locally_free = receive.locally_free;

    ScoreTree score = ScoreTree::node(ScoreTag::Receive);
    score.add(flag(receive.persistent));
    score.add(count(receive.bind_count));

    result.binds.reserve(receive.binds.size());
    for (const auto& bind : receive.binds) {
        ReceiveBind b;
        b.free_count = bind.free_count;

        ScoreTree bind_score = ScoreTree::node(ScoreTag::Bind);
        bind_score.add(count(bind.free_count));
        Scored<Channel> source = canonical(bind.source);
        b.source = std::move(source.term);
        bind_score.add(std::move(source.score));

        auto patterns = canonical_all(bind.patterns);
        unpack(patterns, b.patterns, bind_score);

        result.binds.push_back(std::move(b));
        score.add(std::move(bind_score));
    }

    Scored<Par> body = canonical(*receive.body);
    result.body = std::move(body.term);
    score.add(std::move(body.score));
    return {std::move(result), std::move(score)};
}

Scored<New> canonical(const New& block) {
    New result;
    result.bind_count = block.bind_count;
    result.locally_free = block.locally_free;

    Scored<Par> body = canonical(*block.p);
    result.p = std::move(body.term);

    ScoreTree score = ScoreTree::node(ScoreTag::New);
    score.add(count(block.bind_count));
    score.add(std::move(body.score));
    return {std::move(result), std::move(score)};
}

// Cases keep their order: the first matching case wins
Scored<Match> canonical(const Match& match) {
    Match result;
    result.free_count = match.free_count;
    result.locally_free = match.locally_free;

    ScoreTree score = ScoreTree::node(ScoreTag::Match);
    Scored<Par> target = canonical(*match.target);
    result.target = std::move(target.term);
    score.add(std::move(target.score));

    result.cases.reserve(match.cases.size());
    for (const auto& c : match.cases) {
        Scored<Par> pattern = canonical(*c.pattern);
        Scored<Par> body = canonical(*c.body);

        ScoreTree case_score = ScoreTree::node(ScoreTag::Case);
        case_score.add(count(c.free_count));
        case_score.add(std::move(pattern.score));
        case_score.add(std::move(body.score));
        score.add(std::move(case_score));

        result.cases.push_back(MatchCase{std::move(pattern.term), std::move(body.term), c.free_count});
    }
    return {std::move(result), std::move(score)};
}

Scored<Eval> canonical(const Eval& eval) {
    Scored<Channel> channel = canonical(eval.channel);
    ScoreTree score = ScoreTree::node(ScoreTag::Eval);
    score.add(std::move(channel.score));
    return {Eval{std::move(channel.term)}, std::move(score)};
}

Scored<GPrivate> canonical(const GPrivate& id) {
    ScoreTree score = ScoreTree::node(ScoreTag::Private);
    score.add(ScoreTree::leaf(id.id));
    return {id, std::move(score)};
}

struct ExprCanonicalizer {
    Scored<Expr> operator()(const GBool& e) const {
        return leaf(e, ScoreTag::GBool, flag(e.value));
    }

    Scored<Expr> operator()(const GInt& e) const {
        return leaf(e, ScoreTag::GInt, ScoreTree::leaf(e.value));
    }

    Scored<Expr> operator()(const GString& e) const {
        return leaf(e, ScoreTag::GString, ScoreTree::leaf(e.value));
    }

    Scored<Expr> operator()(const GUri& e) const {
        return leaf(e, ScoreTag::GUri, ScoreTree::leaf(e.value));
    }

    Scored<Expr> operator()(const EVar& e) const {
        return leaf(e, ScoreTag::EVar, score_of(e.v));
    }

    Scored<Expr> operator()(const EUnary& e) const {
        Scored<Par> operand = canonical(*e.p);
        ScoreTree score = ScoreTree::node(ScoreTag::EUnary);
        score.add(count(static_cast<uint64_t>(e.op)));
        score.add(std::move(operand.score));
        return {Expr{EUnary{e.op, std::move(operand.term)}}, std::move(score)};
    }

    Scored<Expr> operator()(const EBinary& e) const {
        Scored<Par> lhs = canonical(*e.p1);
        Scored<Par> rhs = canonical(*e.p2);
        ScoreTree score = ScoreTree::node(ScoreTag::EBinary);
        score.add(count(static_cast<uint64_t>(e.op)));
        score.add(std::move(lhs.score));
        score.add(std::move(rhs.score));
        return {Expr{EBinary{e.op, std::move(lhs.term), std::move(rhs.term)}}, std::move(score)};
    }

    Scored<Expr> operator()(const EList& e) const { return in_order(e, ScoreTag::EList); }
    Scored<Expr> operator()(const ETuple& e) const { return in_order(e, ScoreTag::ETuple); }

    Scored<Expr> operator()(const ESet& e) const {
        auto items = canonical_all(e.ps);
        sort_by_score(items);

        std::vector<Scored<Par>> unique;
        unique.reserve(items.size());
        for (auto& item : items) {
            if (!unique.empty() && unique.back().score == item.score) continue;
            unique.push_back(std::move(item));
        }

        ESet result = with_metadata(e);
        ScoreTree score = ScoreTree::node(ScoreTag::ESet);
        unpack(unique, result.ps, score);
        return {Expr{std::move(result)}, std::move(score)};
    }

    Scored<Expr> operator()(const EMap& e) const {
        struct ScoredPair {
            KeyValuePair pair;
            ScoreTree key;
            ScoreTree value;
        };

        std::vector<ScoredPair> pairs;
        pairs.reserve(e.kvs.size());
        for (const auto& kv : e.kvs) {
            Scored<Par> key = canonical(*kv.key);
            Scored<Par> value = canonical(*kv.value);
            pairs.push_back(ScoredPair{KeyValuePair{std::move(key.term), std::move(value.term)},
                                       std::move(key.score), std::move(value.score)});
        }
        std::stable_sort(pairs.begin(), pairs.end(),
            [](const ScoredPair& a, const ScoredPair& b) { return a.key < b.key; });

        EMap result = with_metadata(e);
        ScoreTree score = ScoreTree::node(ScoreTag::EMap);
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            // Stable sort keeps insertion order within a key: keep the last
            if (i + 1 < pairs.size() && pairs[i].key == pairs[i + 1].key) continue;

            ScoreTree entry = ScoreTree::node(ScoreTag::KeyValue);
            entry.add(std::move(pairs[i].key));
            entry.add(std::move(pairs[i].value));
            score.add(std::move(entry));
            result.kvs.push_back(std::move(pairs[i].pair));
        }
        return {Expr{std::move(result)}, std::move(score)};
    }

private:
    template<typename Leaf>
    static Scored<Expr> leaf(const Leaf& e, ScoreTag tag, ScoreTree value) {
        ScoreTree score = ScoreTree::node(tag);
        score.add(std::move(value));
        return {Expr{e}, std::move(score)};
    }

    // Copy of a collection's bookkeeping with no elements
    template<typename Collection>
    static Collection with_metadata(const Collection& e) {
        Collection result;
        result.free_count = e.free_count;
        result.locally_free = e.locally_free;
        result.connective_used = e.connective_used;
        return result;
    }

    template<typename Collection>
    static Scored<Expr> in_order(const Collection& e, ScoreTag tag) {
        Collection result = with_metadata(e);
        ScoreTree score = ScoreTree::node(tag);
        auto items = canonical_all(e.ps);
        unpack(items, result.ps, score);
        return {Expr{std::move(result)}, std::move(score)};
    }
};

Scored<Expr> canonical(const Expr& expr) {
    return std::visit(ExprCanonicalizer{}, expr.instance);
}

} // namespace

// =============================================================================
// Canonicalizer
// =============================================================================

Par Canonicalizer::canonicalize(const Par& par) const {
    return canonical(par).term;
}

Send Canonicalizer::canonicalize(const Send& send) const {
    return canonical(send).term;
}

Receive Canonicalizer::canonicalize(const Receive& receive) const {
    return canonical(receive).term;
}

New Canonicalizer::canonicalize(const New& block) const {
    return canonical(block).term;
}

Match Canonicalizer::canonicalize(const Match& match) const {
    return canonical(match).term;
}

Expr Canonicalizer::canonicalize(const Expr& expr) const {
    return canonical(expr).term;
}

Channel Canonicalizer::canonicalize(const Channel& channel) const {
    return canonical(channel).term;
}

Eval Canonicalizer::canonicalize(const Eval& eval) const {
    return canonical(eval).term;
}

ScoreTree Canonicalizer::score(const Par& par) const {
    return canonical(par).score;
}

ScoreTree Canonicalizer::score(const Expr& expr) const {
    return canonical(expr).score;
}

const Canonicalizer& default_canonicalizer() {
    static const Canonicalizer instance{};
    return instance;
}

} // namespace rho
