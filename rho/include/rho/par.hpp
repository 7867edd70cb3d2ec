#ifndef RHO_PAR_HPP
#define RHO_PAR_HPP

#include <rho/bitset.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * Syntax tree of elaborated Rholang processes.
 *
 * Every node kind is a closed sum (std::variant) and every node is an
 * immutable value once built. Bound variables are de Bruijn indices counted
 * outward from the innermost binder (index 0).
 *
 * Bookkeeping carried by the composite nodes:
 *   free_count   - number of free-variable slots a pattern introduces
 *   locally_free - which enclosing-binder indices the subtree references
 */
namespace rho {

// =============================================================================
// Variables
// =============================================================================

struct BoundVar {
    std::size_t index;
};

struct FreeVar {
    std::size_t index;
};

struct Wildcard {};

struct Var {
    std::variant<BoundVar, FreeVar, Wildcard> instance;
};

// =============================================================================
// Box: immutable shared child
// =============================================================================
// Holds a single child term. The pointee is never mutated, so copies share it.

struct Par;

template<typename T>
class Box {
public:
    Box() : ptr_(std::make_shared<const T>()) {}
    Box(T value) : ptr_(std::make_shared<const T>(std::move(value))) {}

    const T& get() const { return *ptr_; }
    const T& operator*() const { return *ptr_; }
    const T* operator->() const { return ptr_.get(); }

    bool operator==(const Box& other) const {
        return ptr_ == other.ptr_ || *ptr_ == *other.ptr_;
    }

    bool operator!=(const Box& other) const {
        return !(*this == other);
    }

private:
    std::shared_ptr<const T> ptr_;
};

// =============================================================================
// Channels
// =============================================================================

// A process used in name position: @P
struct Quote {
    Box<Par> value;
};

struct ChanVar {
    Var var;
};

struct Channel {
    std::variant<Quote, ChanVar> instance;
};

// =============================================================================
// Processes
// =============================================================================

struct Send {
    Channel chan;
    std::vector<Par> data;
    bool persistent = false;
    uint32_t free_count = 0;
    BitSet locally_free;
};

// One `patterns <- source` clause of a receive
struct ReceiveBind {
    std::vector<Channel> patterns;
    Channel source;
    uint32_t free_count = 0;
};

// for (binds) { body }; body is scoped under bind_count new variables
struct Receive {
    std::vector<ReceiveBind> binds;
    Box<Par> body;
    bool persistent = false;
    uint32_t bind_count = 0;
    uint32_t free_count = 0;
    BitSet locally_free;
};

// new x0..x(n-1) in { p }
struct New {
    uint32_t bind_count = 0;
    Box<Par> p;
    BitSet locally_free;
};

struct MatchCase {
    Box<Par> pattern;
    Box<Par> body;
    uint32_t free_count = 0;
};

struct Match {
    Box<Par> target;
    std::vector<MatchCase> cases;
    uint32_t free_count = 0;
    BitSet locally_free;
};

// *chan
struct Eval {
    Channel channel;
};

// Unforgeable name
struct GPrivate {
    std::string id;
};

// =============================================================================
// Expressions
// =============================================================================

struct GBool {
    bool value;
};

struct GInt {
    int64_t value;
};

struct GString {
    std::string value;
};

struct GUri {
    std::string value;
};

struct EVar {
    Var v;
};

enum class UnaryOp : uint8_t {
    Not,
    Neg
};

enum class BinaryOp : uint8_t {
    Mult,
    Div,
    Plus,
    Minus,
    Lt,
    Lte,
    Gt,
    Gte,
    Eq,
    Neq,
    And,
    Or
};

struct EUnary {
    UnaryOp op;
    Box<Par> p;
};

struct EBinary {
    BinaryOp op;
    Box<Par> p1;
    Box<Par> p2;
};

struct EList {
    std::vector<Par> ps;
    uint32_t free_count = 0;
    BitSet locally_free;
    bool connective_used = false;
};

struct ETuple {
    std::vector<Par> ps;
    uint32_t free_count = 0;
    BitSet locally_free;
    bool connective_used = false;
};

struct ESet {
    std::vector<Par> ps;
    uint32_t free_count = 0;
    BitSet locally_free;
    bool connective_used = false;
};

struct KeyValuePair {
    Box<Par> key;
    Box<Par> value;
};

struct EMap {
    std::vector<KeyValuePair> kvs;
    uint32_t free_count = 0;
    BitSet locally_free;
    bool connective_used = false;
};

struct Expr {
    std::variant<GBool, GInt, GString, GUri, EVar, EUnary, EBinary,
                 EList, ETuple, ESet, EMap> instance;
};

// =============================================================================
// Par: parallel composition
// =============================================================================

struct Par {
    std::vector<Send> sends;
    std::vector<Receive> receives;
    std::vector<New> news;
    std::vector<Expr> exprs;
    std::vector<Match> matches;
    std::vector<Eval> evals;
    std::vector<GPrivate> ids;
    uint32_t free_count = 0;
    BitSet locally_free;

    // The empty process
    bool is_nil() const {
        return sends.empty() && receives.empty() && news.empty() && exprs.empty() &&
               matches.empty() && evals.empty() && ids.empty();
    }

    std::size_t num_children() const {
        return sends.size() + receives.size() + news.size() + exprs.size() +
               matches.size() + evals.size() + ids.size();
    }

    // Parallel merge: concatenates children, sums free counts, unions locally_free
    Par& operator+=(const Par& other);
};

Par operator+(Par lhs, const Par& rhs);

// Structural equality, bookkeeping included. Child order matters; compare
// canonical forms for order-independent equality.
bool operator==(const BoundVar& a, const BoundVar& b);
bool operator==(const FreeVar& a, const FreeVar& b);
bool operator==(const Wildcard& a, const Wildcard& b);
bool operator==(const Var& a, const Var& b);
bool operator==(const Quote& a, const Quote& b);
bool operator==(const ChanVar& a, const ChanVar& b);
bool operator==(const Channel& a, const Channel& b);
bool operator==(const Send& a, const Send& b);
bool operator==(const ReceiveBind& a, const ReceiveBind& b);
bool operator==(const Receive& a, const Receive& b);
bool operator==(const New& a, const New& b);
bool operator==(const MatchCase& a, const MatchCase& b);
bool operator==(const Match& a, const Match& b);
bool operator==(const Eval& a, const Eval& b);
bool operator==(const GPrivate& a, const GPrivate& b);
bool operator==(const GBool& a, const GBool& b);
bool operator==(const GInt& a, const GInt& b);
bool operator==(const GString& a, const GString& b);
bool operator==(const GUri& a, const GUri& b);
bool operator==(const EVar& a, const EVar& b);
bool operator==(const EUnary& a, const EUnary& b);
bool operator==(const EBinary& a, const EBinary& b);
bool operator==(const EList& a, const EList& b);
bool operator==(const ETuple& a, const ETuple& b);
bool operator==(const ESet& a, const ESet& b);
bool operator==(const KeyValuePair& a, const KeyValuePair& b);
bool operator==(const EMap& a, const EMap& b);
bool operator==(const Expr& a, const Expr& b);
bool operator==(const Par& a, const Par& b);

/**
 * Type trait marking syntax tree node types
 */
template<typename T>
struct is_term_node : std::false_type {};

template<> struct is_term_node<BoundVar> : std::true_type {};
template<> struct is_term_node<FreeVar> : std::true_type {};
template<> struct is_term_node<Wildcard> : std::true_type {};
template<> struct is_term_node<Var> : std::true_type {};
template<> struct is_term_node<Quote> : std::true_type {};
template<> struct is_term_node<ChanVar> : std::true_type {};
template<> struct is_term_node<Channel> : std::true_type {};
template<> struct is_term_node<Send> : std::true_type {};
template<> struct is_term_node<ReceiveBind> : std::true_type {};
template<> struct is_term_node<Receive> : std::true_type {};
template<> struct is_term_node<New> : std::true_type {};
template<> struct is_term_node<MatchCase> : std::true_type {};
template<> struct is_term_node<Match> : std::true_type {};
template<> struct is_term_node<Eval> : std::true_type {};
template<> struct is_term_node<GPrivate> : std::true_type {};
template<> struct is_term_node<GBool> : std::true_type {};
template<> struct is_term_node<GInt> : std::true_type {};
template<> struct is_term_node<GString> : std::true_type {};
template<> struct is_term_node<GUri> : std::true_type {};
template<> struct is_term_node<EVar> : std::true_type {};
template<> struct is_term_node<EUnary> : std::true_type {};
template<> struct is_term_node<EBinary> : std::true_type {};
template<> struct is_term_node<EList> : std::true_type {};
template<> struct is_term_node<ETuple> : std::true_type {};
template<> struct is_term_node<ESet> : std::true_type {};
template<> struct is_term_node<KeyValuePair> : std::true_type {};
template<> struct is_term_node<EMap> : std::true_type {};
template<> struct is_term_node<Expr> : std::true_type {};
template<> struct is_term_node<Par> : std::true_type {};

template<typename T, typename = std::enable_if_t<is_term_node<T>::value>>
bool operator!=(const T& a, const T& b) {
    return !(a == b);
}

const char* to_string(UnaryOp op);
const char* to_string(BinaryOp op);

/**
 * Debug utilities: render nodes in Rholang-like surface syntax.
 * Bound variables print as b<index>, free variables as f<index>.
 */
namespace debug {
    std::string to_string(const Var& var);
    std::string to_string(const Channel& channel);
    std::string to_string(const Send& send);
    std::string to_string(const Receive& receive);
    std::string to_string(const New& block);
    std::string to_string(const Match& match);
    std::string to_string(const Eval& eval);
    std::string to_string(const Expr& expr);
    std::string to_string(const Par& par);
}

} // namespace rho

#endif // RHO_PAR_HPP
