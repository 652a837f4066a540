/// @file merge.cpp
/// @brief Hierarchical merge of definition documents

#include <mobdef/data/merge.hpp>

namespace mobdef_data {

void merge(Value& base, Value override_value) {
    Table* base_table = base.try_table_mut();
    Table* over_table = override_value.try_table_mut();

    if (base_table == nullptr || over_table == nullptr) {
        base = std::move(override_value);
        return;
    }

    for (auto& [key, value] : *over_table) {
        auto it = base_table->find(key);
        if (it == base_table->end()) {
            base_table->emplace(key, std::move(value));
        } else {
            merge(it->second, std::move(value));
        }
    }
}

Value merged(Value base, Value override_value) {
    merge(base, std::move(override_value));
    return base;
}

} // namespace mobdef_data
