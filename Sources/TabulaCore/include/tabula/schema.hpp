#pragma once

#include "types.hpp"
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace tabula {

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
    bool is_primary_key = false;
};

// Table schema derived from a record
struct table_schema {
    std::string name;
    std::vector<column_def> columns;

    /// Columns forming the primary key, in column order
    std::vector<std::string> primary_key() const;

    /// "<name> (<col> <TYPE>,...,PRIMARY KEY (<col>[,<col>...]))"
    std::string describe() const;
};

// Global schema registry
class schema_registry {
public:
    static schema_registry& instance();

    void register_model(const std::type_info& type, table_schema schema);
    const table_schema* get_schema(const std::type_info& type) const;
    const table_schema* get_schema(const std::string& table_name) const;

    std::vector<const table_schema*> all_schemas() const;

private:
    schema_registry() = default;
    std::unordered_map<std::string, table_schema> schemas_by_name_;
    std::unordered_map<std::string, std::string> type_to_table_;
};

// Helper to register schema at static init time. T must be default constructible.
template<typename T>
struct schema_registrar {
    schema_registrar() {
        T prototype{};
        schema_registry::instance().register_model(typeid(T), prototype.schema());
    }
};

} // namespace tabula

// Usage (at namespace scope, after the entity definition):
//   TABULA_REGISTER(Album);
#define TABULA_REGISTER(cls) \
    static ::tabula::schema_registrar<cls> _tabula_registrar_##cls {}
