/// @file src/core/types.cpp
/// @brief Value rendering and Proposal lookup.

#include "medsim/types.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace medsim {

std::string to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{:g}", x);
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else {
            return x;
        }
    }, v);
}

const Value* Proposal::find(const std::string& dimension_id) const noexcept {
    const auto it = values.find(dimension_id);
    return it == values.end() ? nullptr : &it->second;
}

}  // namespace medsim
