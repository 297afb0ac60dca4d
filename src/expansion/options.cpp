/// @file options.cpp
/// @brief Expansion option names

#include <jsonld_engine/expansion/options.hpp>

namespace jsonld_expansion {

const char* key_policy_name(KeyPolicy policy) noexcept {
    switch (policy) {
        case KeyPolicy::Relaxed: return "relaxed";
        case KeyPolicy::Standard: return "standard";
        case KeyPolicy::Strict: return "strict";
        case KeyPolicy::Strictest: return "strictest";
        default: return "unknown";
    }
}

std::optional<KeyPolicy> key_policy_from_string(const std::string& name) noexcept {
    if (name == "relaxed") return KeyPolicy::Relaxed;
    if (name == "standard") return KeyPolicy::Standard;
    if (name == "strict") return KeyPolicy::Strict;
    if (name == "strictest") return KeyPolicy::Strictest;
    return std::nullopt;
}

} // namespace jsonld_expansion
