#ifndef RHO_ENV_HPP
#define RHO_ENV_HPP

#include <rho/par.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace rho {

/**
 * Scope environment for substitution.
 *
 * Maps de Bruijn indices to the values bound at them, viewed through a shift:
 * the number of binder levels entered since the values were bound. Indices
 * below the shift belong to those binders and are never resolvable here.
 *
 * Environments are immutable values. The binding map is shared between copies
 * and between an environment and every shift of it; only put() copies it.
 */
class Env {
public:
    Env() : map_(std::make_shared<const Map>()) {}

    /**
     * Build an environment that binds each index of `bindings` to its value.
     * Indices missing from `bindings` stay unbound.
     */
    static Env from_indices(const std::map<std::size_t, Par>& bindings);

    /**
     * Bind `value` to the innermost slot. Existing bindings move one index
     * outward; seen through the current shift the new value is index
     * current_shift().
     */
    Env put(Par value) const;

    // Pushes each value in turn; the last one ends up innermost
    Env put(const std::vector<Par>& values) const;

    /**
     * Value bound at `index`, or nullptr when the index falls inside the
     * shifted range or names an unbound slot. The pointee lives as long as
     * any environment sharing this map.
     */
    const Par* get(std::size_t index) const;

    // Same bindings, viewed from `n` binder levels deeper
    Env shift(std::size_t n) const {
        return Env(map_, level_, shift_ + n);
    }

    std::size_t current_shift() const { return shift_; }

    // Number of base slots, bound or not
    std::size_t level() const { return level_; }

    bool empty() const { return map_->empty(); }

private:
    // Keyed by slot level: slot 0 is the outermost binding
    using Map = std::map<std::size_t, Par>;

    Env(std::shared_ptr<const Map> map, std::size_t level, std::size_t shift)
        : map_(std::move(map)), level_(level), shift_(shift) {}

    std::shared_ptr<const Map> map_;
    std::size_t level_ = 0;
    std::size_t shift_ = 0;
};

} // namespace rho

#endif // RHO_ENV_HPP
