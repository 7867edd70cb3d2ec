#include <rho/par.hpp>

namespace rho {

namespace {

template<typename T>
void append(std::vector<T>& to, const std::vector<T>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

} // namespace

Par& Par::operator+=(const Par& other) {
    append(sends, other.sends);
    append(receives, other.receives);
    append(news, other.news);
    append(exprs, other.exprs);
    append(matches, other.matches);
    append(evals, other.evals);
    append(ids, other.ids);
    free_count += other.free_count;
    locally_free |= other.locally_free;
    return *this;
}

Par operator+(Par lhs, const Par& rhs) {
    lhs += rhs;
    return lhs;
}

bool operator==(const BoundVar& a, const BoundVar& b) { return a.index == b.index; }
bool operator==(const FreeVar& a, const FreeVar& b) { return a.index == b.index; }
bool operator==(const Wildcard&, const Wildcard&) { return true; }
bool operator==(const Var& a, const Var& b) { return a.instance == b.instance; }

bool operator==(const Quote& a, const Quote& b) { return a.value == b.value; }
bool operator==(const ChanVar& a, const ChanVar& b) { return a.var == b.var; }
bool operator==(const Channel& a, const Channel& b) { return a.instance == b.instance; }

bool operator==(const Send& a, const Send& b) {
    return a.persistent == b.persistent &&
           a.free_count == b.free_count &&
           a.chan == b.chan &&
           a.data == b.data &&
           a.locally_free == b.locally_free;
}

bool operator==(const ReceiveBind& a, const ReceiveBind& b) {
    return a.free_count == b.free_count &&
           a.source == b.source &&
           a.patterns == b.patterns;
}

bool operator==(const Receive& a, const Receive& b) {
    return a.persistent == b.persistent &&
           a.bind_count == b.bind_count &&
           a.free_count == b.free_count &&
           a.binds == b.binds &&
           a.body == b.body &&
           a.locally_free == b.locally_free;
}

bool operator==(const New& a, const New& b) {
    return a.bind_count == b.bind_count &&
           a.p == b.p &&
           a.locally_free == b.locally_free;
}

bool operator==(const MatchCase& a, const MatchCase& b) {
    return a.free_count == b.free_count &&
           a.pattern == b.pattern &&
           a.body == b.body;
}

bool operator==(const Match& a, const Match& b) {
    return a.free_count == b.free_count &&
           a.target == b.target &&
           a.cases == b.cases &&
           a.locally_free == b.locally_free;
}

bool operator==(const Eval& a, const Eval& b) { return a.channel == b.channel; }
bool operator==(const GPrivate& a, const GPrivate& b) { return a.id == b.id; }

bool operator==(const GBool& a, const GBool& b) { return a.value == b.value; }
bool operator==(const GInt& a, const GInt& b) { return a.value == b.value; }
bool operator==(const GString& a, const GString& b) { return a.value == b.value; }
bool operator==(const GUri& a, const GUri& b) { return a.value == b.value; }
bool operator==(const EVar& a, const EVar& b) { return a.v == b.v; }

bool operator==(const EUnary& a, const EUnary& b) {
    return a.op == b.op && a.p == b.p;
}

bool operator==(const EBinary& a, const EBinary& b) {
    return a.op == b.op && a.p1 == b.p1 && a.p2 == b.p2;
}

bool operator==(const EList& a, const EList& b) {
    return a.free_count == b.free_count && a.connective_used == b.connective_used &&
           a.ps == b.ps && a.locally_free == b.locally_free;
}

bool operator==(const ETuple& a, const ETuple& b) {
    return a.free_count == b.free_count && a.connective_used == b.connective_used &&
           a.ps == b.ps && a.locally_free == b.locally_free;
}

bool operator==(const ESet& a, const ESet& b) {
    return a.free_count == b.free_count && a.connective_used == b.connective_used &&
           a.ps == b.ps && a.locally_free == b.locally_free;
}

bool operator==(const KeyValuePair& a, const KeyValuePair& b) {
    return a.key == b.key && a.value == b.value;
}

bool operator==(const EMap& a, const EMap& b) {
    return a.free_count == b.free_count && a.connective_used == b.connective_used &&
           a.kvs == b.kvs && a.locally_free == b.locally_free;
}

bool operator==(const Expr& a, const Expr& b) { return a.instance == b.instance; }

bool operator==(const Par& a, const Par& b) {
    return a.free_count == b.free_count &&
           a.locally_free == b.locally_free &&
           a.sends == b.sends &&
           a.receives == b.receives &&
           a.news == b.news &&
           a.exprs == b.exprs &&
           a.matches == b.matches &&
           a.evals == b.evals &&
           a.ids == b.ids;
}

const char* to_string(UnaryOp op) {
    switch (op) {
        case UnaryOp::Not: return "not";
        case UnaryOp::Neg: return "-";
    }
    return "?";
}

const char* to_string(BinaryOp op) {
    switch (op) {
        case BinaryOp::Mult: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Plus: return "+";
        case BinaryOp::Minus: return "-";
        case BinaryOp::Lt: return "<";
        case BinaryOp::Lte: return "<=";
        case BinaryOp::Gt: return ">";
        case BinaryOp::Gte: return ">=";
        case BinaryOp::Eq: return "==";
        case BinaryOp::Neq: return "!=";
        case BinaryOp::And: return "and";
        case BinaryOp::Or: return "or";
    }
    return "?";
}

} // namespace rho
