#include "tabula/schema.hpp"
#include "tabula/log.hpp"
#include <sstream>

namespace tabula {

std::vector<std::string> table_schema::primary_key() const {
    std::vector<std::string> keys;
    for (const auto& col : columns) {
        if (col.is_primary_key) {
            keys.push_back(col.name);
        }
    }
    return keys;
}

std::string table_schema::describe() const {
    std::ostringstream sql;
    sql << name << " (";
    for (const auto& col : columns) {
        sql << col.name << " " << column_type_name(col.type) << ",";
    }

    sql << "PRIMARY KEY (";
    bool first = true;
    for (const auto& key : primary_key()) {
        if (!first) sql << ",";
        sql << key;
        first = false;
    }
    sql << "))";
    return sql.str();
}

schema_registry& schema_registry::instance() {
    static schema_registry registry;
    return registry;
}

void schema_registry::register_model(const std::type_info& type, table_schema schema) {
    LOG_DEBUG("schema", "Registering %s", schema.name.c_str());
    type_to_table_[type.name()] = schema.name;
    schemas_by_name_[schema.name] = std::move(schema);
}

const table_schema* schema_registry::get_schema(const std::type_info& type) const {
    auto it = type_to_table_.find(type.name());
    if (it == type_to_table_.end()) {
        return nullptr;
    }
    return get_schema(it->second);
}

const table_schema* schema_registry::get_schema(const std::string& table_name) const {
    auto it = schemas_by_name_.find(table_name);
    if (it == schemas_by_name_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<const table_schema*> schema_registry::all_schemas() const {
    std::vector<const table_schema*> result;
    result.reserve(schemas_by_name_.size());
    for (const auto& [_, schema] : schemas_by_name_) {
        result.push_back(&schema);
    }
    return result;
}

} // namespace tabula
