/// @file value.cpp
/// @brief Value comparison helpers

#include <mobdef/data/value.hpp>

namespace mobdef_data {

bool values_equal_loose(const Value& a, const Value& b) {
    if (a.is_numeric() && b.is_numeric()) {
        if (a.is_int() && b.is_int()) {
            return a.as_int() == b.as_int();
        }
        return a.as_numeric() == b.as_numeric();
    }

    if (a.type() != b.type()) {
        return false;
    }

    if (auto* ta = a.try_table()) {
        const Table& tb = b.as_table();
        if (ta->size() != tb.size()) {
            return false;
        }
        for (const auto& [key, value] : *ta) {
            auto it = tb.find(key);
            if (it == tb.end() || !values_equal_loose(value, it->second)) {
                return false;
            }
        }
        return true;
    }

    if (auto* aa = a.try_array()) {
        const Array& ab = b.as_array();
        if (aa->size() != ab.size()) {
            return false;
        }
        for (std::size_t i = 0; i < aa->size(); ++i) {
            if (!values_equal_loose((*aa)[i], ab[i])) {
                return false;
            }
        }
        return true;
    }

    return a == b;
}

} // namespace mobdef_data
