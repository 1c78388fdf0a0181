/**
 * @file types.cpp
 * @brief Helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <sstream>
#include <type_traits>

namespace dagbuild {

std::string param_to_string(const ParamValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else {
            return std::to_string(v);
        }
    }, value);
}

}  // namespace dagbuild
