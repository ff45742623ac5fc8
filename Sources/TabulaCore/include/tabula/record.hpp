#pragma once

#include "members.hpp"
#include "schema.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tabula {

// ============================================================================
// record - the bridge between a model class and its table representation
//
// Model classes derive from entity<T> and add their members in the
// constructor. The member list is fixed after construction; only the member
// values change afterward.
//
//   struct Album : tabula::entity<Album> {
//       Album(std::string name = "") {
//           add(tabula::scalar_member("name", std::move(name)));
//       }
//       std::string name() const { return member(0).get<std::string>(); }
//   };
// ============================================================================

class record : public serializable {
public:
    ~record() override = default;

    /// Table name: the unqualified name of the dynamic type. Override when the
    /// type name is not a stable table name.
    virtual std::string table() const;

    const std::vector<db_member>& members() const noexcept { return members_; }

    db_member& member(std::size_t index);
    const db_member& member(std::size_t index) const;

    // Throws std::out_of_range for an unknown key
    db_member& member(const std::string& key);
    const db_member& member(const std::string& key) const;

    /// The first member's key; it always takes part in the primary key.
    const std::string& id_column() const;

    /// {member 0} plus every member flagged primary, in member order
    std::vector<const db_member*> primary_key_members() const;

    table_schema schema() const;

    /// Describe the SQL table based on the table name and individual members.
    std::string describe_table() const;

    row_t to_row() const override;

    /// Fill every member from `row`; a missing key raises unknown_field_error.
    void from_row(const row_t& row) override;

    bool operator==(const record& other) const;
    bool operator!=(const record& other) const { return !(*this == other); }

    std::size_t hash() const;

    bool equals(const serializable& other) const override;
    std::size_t hash_value() const override { return hash(); }

protected:
    record() = default;
    record(const record&) = default;
    record(record&&) = default;
    record& operator=(const record&) = default;
    record& operator=(record&&) = default;

    template<typename M>
    db_member& add(M&& member) {
        members_.emplace_back(std::forward<M>(member));
        return members_.back();
    }

private:
    std::vector<db_member> members_;
};

// ============================================================================
// entity<T> - record with a zero-argument factory for T
// ============================================================================

template<typename T>
class entity : public record {
public:
    /// Build a T from a row retrieved from the store.
    static T from_map(const row_t& row) {
        T obj{};
        obj.from_row(row);
        return obj;
    }

    /// Factory usable by object / object-list members that nest T
    static serializable_factory factory() {
        return [] { return std::make_shared<T>(); };
    }

protected:
    entity() = default;
};

// Hash functor so entities can be stored in unordered containers
struct record_hash {
    std::size_t operator()(const record& r) const { return r.hash(); }
};

} // namespace tabula
