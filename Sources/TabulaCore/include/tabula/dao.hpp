#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "record.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tabula {

// True for arguments that name a key value rather than a whole record
template<typename K>
inline constexpr bool is_key_argument_v =
    std::is_constructible_v<wire_value_t, K&&> &&
    !std::is_same_v<std::decay_t<K>, wire_value_t> &&
    !std::is_base_of_v<record, std::decay_t<K>>;

// ============================================================================
// dao<T> - typed CRUD over a store for one entity type
// ============================================================================

template<typename T>
class dao {
    static_assert(std::is_base_of_v<record, T>, "dao<T> requires a tabula::record");
    static_assert(std::is_default_constructible_v<T>, "dao<T> requires a default constructible T");

public:
    explicit dao(std::shared_ptr<store> backend)
        : store_(std::move(backend)), table_(T{}.table()) {
        if (!store_) {
            throw std::invalid_argument("dao requires a store");
        }
    }

    const std::string& table() const noexcept { return table_; }

    /// Insert `obj`; returns the store's row id.
    int64_t create(const T& obj) {
        LOG_DEBUG("dao", "insert into %s", table_.c_str());
        return store_->insert(table_, obj.to_row());
    }

    /// Every row of the table, rebuilt as T, in store order.
    std::vector<T> get(const std::optional<std::vector<std::string>>& columns = std::nullopt) {
        auto rows = store_->query(table_, columns);
        std::vector<T> result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(T::from_map(row));
        }
        return result;
    }

    /// Overwrite the row matching `obj`'s primary key.
    int64_t update(const T& obj) {
        auto [where, args] = where_clause(obj);
        auto changed = store_->update(table_, obj.to_row(), where, args);
        if (changed == 0) {
            LOG_WARN("dao", "update on %s matched no rows (%s)", table_.c_str(), where.c_str());
            throw no_rows_affected_error("update", table_);
        }
        return changed;
    }

    template<typename K, typename = std::enable_if_t<is_key_argument_v<K>>>
    int64_t remove(K&& key) {
        return remove(wire_value_t(std::forward<K>(key)));
    }

    /// Delete by the first member's value.
    int64_t remove(const wire_value_t& key) {
        T blank{};
        auto where = blank.id_column() + " = ?";
        auto changed = store_->remove(table_, where, {key});
        if (changed == 0) {
            LOG_WARN("dao", "remove on %s matched no rows (%s)", table_.c_str(), where.c_str());
            throw no_rows_affected_error("remove", table_);
        }
        return changed;
    }

    /// Delete every row matching `obj`'s primary key values.
    int64_t remove(const T& obj) {
        auto [where, args] = where_clause(obj);
        auto changed = store_->remove(table_, where, args);
        if (changed == 0) {
            LOG_WARN("dao", "remove on %s matched no rows (%s)", table_.c_str(), where.c_str());
            throw no_rows_affected_error("remove", table_);
        }
        return changed;
    }

    int64_t remove_all() {
        return store_->remove(table_);
    }

    /// "k0 = ? AND k1 = ?" over the primary key members, with their values.
    static std::pair<std::string, std::vector<wire_value_t>> where_clause(const T& obj) {
        std::string where;
        std::vector<wire_value_t> args;
        for (const auto* m : obj.primary_key_members()) {
            if (!where.empty()) where += " AND ";
            where += m->key() + " = ?";
            args.push_back(m->to_wire());
        }
        return {std::move(where), std::move(args)};
    }

private:
    std::shared_ptr<store> store_;
    std::string table_;
};

} // namespace tabula
