#include <rho/par.hpp>
#include <sstream>

namespace rho {
namespace debug {

namespace {

template<typename T, typename Fn>
void join(std::ostringstream& oss, const std::vector<T>& items, const char* sep, Fn&& fn) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << sep;
        oss << fn(items[i]);
    }
}

std::string par_list(const std::vector<Par>& ps) {
    std::ostringstream oss;
    join(oss, ps, ", ", [](const Par& p) { return to_string(p); });
    return oss.str();
}

struct ExprPrinter {
    std::string operator()(const GBool& e) const { return e.value ? "true" : "false"; }
    std::string operator()(const GInt& e) const { return std::to_string(e.value); }
    std::string operator()(const GString& e) const { return "\"" + e.value + "\""; }
    std::string operator()(const GUri& e) const { return "`" + e.value + "`"; }
    std::string operator()(const EVar& e) const { return to_string(e.v); }

    std::string operator()(const EUnary& e) const {
        const char* sep = e.op == UnaryOp::Not ? " " : "";
        return std::string("(") + rho::to_string(e.op) + sep + to_string(*e.p) + ")";
    }

    std::string operator()(const EBinary& e) const {
        return "(" + to_string(*e.p1) + " " + rho::to_string(e.op) + " " + to_string(*e.p2) + ")";
    }

    std::string operator()(const EList& e) const { return "[" + par_list(e.ps) + "]"; }

    std::string operator()(const ETuple& e) const {
        // A 1-tuple needs the trailing comma to read as a tuple
        return "(" + par_list(e.ps) + (e.ps.size() == 1 ? ",)" : ")");
    }

    std::string operator()(const ESet& e) const { return "Set(" + par_list(e.ps) + ")"; }

    std::string operator()(const EMap& e) const {
        std::ostringstream oss;
        oss << "{";
        join(oss, e.kvs, ", ", [](const KeyValuePair& kv) {
            return to_string(*kv.key) + ": " + to_string(*kv.value);
        });
        oss << "}";
        return oss.str();
    }
};

} // namespace

std::string to_string(const Var& var) {
    if (const auto* bound = std::get_if<BoundVar>(&var.instance)) {
        return "b" + std::to_string(bound->index);
    }
    if (const auto* free = std::get_if<FreeVar>(&var.instance)) {
        return "f" + std::to_string(free->index);
    }
    return "_";
}

std::string to_string(const Channel& channel) {
    if (const auto* quote = std::get_if<Quote>(&channel.instance)) {
        return "@{" + to_string(*quote->value) + "}";
    }
    return to_string(std::get<ChanVar>(channel.instance).var);
}

std::string to_string(const Send& send) {
    return to_string(send.chan) + (send.persistent ? "!!(" : "!(") + par_list(send.data) + ")";
}

std::string to_string(const Receive& receive) {
    std::ostringstream oss;
    oss << "for (";
    const char* arrow = receive.persistent ? " <= " : " <- ";
    join(oss, receive.binds, "; ", [arrow](const ReceiveBind& bind) {
        std::ostringstream b;
        join(b, bind.patterns, ", ", [](const Channel& c) { return to_string(c); });
        b << arrow << to_string(bind.source);
        return b.str();
    });
    oss << ") { " << to_string(*receive.body) << " }";
    return oss.str();
}

std::string to_string(const New& block) {
    return "new " + std::to_string(block.bind_count) + " in { " + to_string(*block.p) + " }";
}

std::string to_string(const Match& match) {
    std::ostringstream oss;
    oss << "match " << to_string(*match.target) << " { ";
    join(oss, match.cases, " ", [](const MatchCase& c) {
        return to_string(*c.pattern) + " => { " + to_string(*c.body) + " }";
    });
    oss << " }";
    return oss.str();
}

std::string to_string(const Eval& eval) {
    return "*" + to_string(eval.channel);
}

std::string to_string(const Expr& expr) {
    return std::visit(ExprPrinter{}, expr.instance);
}

std::string to_string(const Par& par) {
    if (par.is_nil()) {
        return "Nil";
    }

    std::vector<std::string> parts;
    parts.reserve(par.num_children());
    for (const auto& s : par.sends) parts.push_back(to_string(s));
    for (const auto& r : par.receives) parts.push_back(to_string(r));
    for (const auto& n : par.news) parts.push_back(to_string(n));
    for (const auto& e : par.exprs) parts.push_back(to_string(e));
    for (const auto& m : par.matches) parts.push_back(to_string(m));
    for (const auto& e : par.evals) parts.push_back(to_string(e));
    for (const auto& id : par.ids) parts.push_back("Unforgeable(" + id.id + ")");

    std::ostringstream oss;
    join(oss, parts, " | ", [](const std::string& s) { return s; });
    return oss.str();
}

} // namespace debug
} // namespace rho
