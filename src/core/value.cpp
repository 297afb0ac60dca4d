/// @file value.cpp
/// @brief Value tree helpers

#include <jsonld_engine/core/value.hpp>

#include <algorithm>

namespace jsonld_core {

// =============================================================================
// Construction Helpers
// =============================================================================

Value as_array(const Value& value) {
    if (value.is_array()) {
        return value;
    }
    Value result = Value::array();
    if (!value.is_null()) {
        result.push_back(value);
    }
    return result;
}

Value as_array(Value&& value) {
    if (value.is_array()) {
        return std::move(value);
    }
    Value result = Value::array();
    if (!value.is_null()) {
        result.push_back(std::move(value));
    }
    return result;
}

bool has_only_keys(const Value& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return false;
    }
    std::size_t found = 0;
    for (const char* key : keys) {
        if (object.contains(key)) {
            ++found;
        }
    }
    return found == object.size();
}

void add_value(Value& object, const std::string& key, const Value& value, bool as_array) {
    if (as_array) {
        auto it = object.find(key);
        if (it == object.end()) {
            object[key] = Value::array();
        } else if (!it->is_array()) {
            Value existing = std::move(*it);
            *it = Value::array();
            it->push_back(std::move(existing));
        }
    }

    if (value.is_array()) {
        for (const auto& item : value) {
            add_value(object, key, item, as_array);
        }
        return;
    }

    auto it = object.find(key);
    if (it == object.end()) {
        object[key] = value;
        return;
    }

    if (!it->is_array()) {
        Value existing = std::move(*it);
        *it = Value::array();
        it->push_back(std::move(existing));
    }
    it->push_back(value);
}

std::vector<std::string> sorted_keys(const Value& object) {
    std::vector<std::string> keys;
    if (!object.is_object()) {
        return keys;
    }
    keys.reserve(object.size());
    for (const auto& [key, _] : object.items()) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<std::string> object_keys(const Value& object, bool ordered) {
    if (ordered) {
        return sorted_keys(object);
    }
    std::vector<std::string> keys;
    if (!object.is_object()) {
        return keys;
    }
    keys.reserve(object.size());
    for (const auto& [key, _] : object.items()) {
        keys.push_back(key);
    }
    return keys;
}

// =============================================================================
// Comparison
// =============================================================================

namespace {

bool ordered_array_equal(const Value& a, const Value& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!json_ld_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool json_ld_equal(const Value& a, const Value& b) {
    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) {
            return false;
        }
        std::vector<bool> selected(b.size(), false);
        for (const auto& item : a) {
            bool matched = false;
            for (std::size_t i = 0; i < b.size(); ++i) {
                if (!selected[i] && json_ld_equal(item, b[i])) {
                    selected[i] = true;
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                return false;
            }
        }
        return true;
    }

    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& [key, value_a] : a.items()) {
            auto it = b.find(key);
            if (it == b.end()) {
                return false;
            }
            if (key == "@list" && value_a.is_array() && it->is_array()) {
                if (!ordered_array_equal(value_a, *it)) {
                    return false;
                }
            } else if (!json_ld_equal(value_a, *it)) {
                return false;
            }
        }
        return true;
    }

    if (a.is_number() && b.is_number()) {
        return a == b;
    }

    return a.type() == b.type() && a == b;
}

} // namespace jsonld_core
