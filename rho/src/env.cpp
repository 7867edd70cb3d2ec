#include <rho/env.hpp>

namespace rho {

Env Env::from_indices(const std::map<std::size_t, Par>& bindings) {
    if (bindings.empty()) {
        return Env();
    }

    // Index i counts inward-to-outward, slot levels count outward-to-inward
    std::size_t level = bindings.rbegin()->first + 1;
    auto map = std::make_shared<Map>();
    for (const auto& [index, value] : bindings) {
        map->emplace(level - index - 1, value);
    }
    return Env(std::move(map), level, 0);
}

Env Env::put(Par value) const {
    auto map = std::make_shared<Map>(*map_);
    (*map)[level_] = std::move(value);
    return Env(std::move(map), level_ + 1, shift_);
}

Env Env::put(const std::vector<Par>& values) const {
    if (values.empty()) {
        return *this;
    }

    auto map = std::make_shared<Map>(*map_);
    std::size_t level = level_;
    for (const auto& value : values) {
        (*map)[level++] = value;
    }
    return Env(std::move(map), level, shift_);
}

const Par* Env::get(std::size_t index) const {
    if (index < shift_) {
        return nullptr;
    }

    std::size_t unshifted = index - shift_;
    if (unshifted >= level_) {
        return nullptr;
    }

    auto it = map_->find(level_ - unshifted - 1);
    return it == map_->end() ? nullptr : &it->second;
}

} // namespace rho
