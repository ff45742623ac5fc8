#include "tabula/record.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include <cxxabi.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <typeinfo>

namespace tabula {

namespace {

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    std::string result = (status == 0 && name) ? name.get() : mangled;

    // Strip namespaces and template arguments: "app::Album" -> "Album"
    auto angle = result.find('<');
    if (angle != std::string::npos) {
        result.erase(angle);
    }
    auto colon = result.rfind("::");
    if (colon != std::string::npos) {
        result.erase(0, colon + 2);
    }
    return result;
}

} // namespace

std::string record::table() const {
    return demangle(typeid(*this).name());
}

db_member& record::member(std::size_t index) {
    return members_.at(index);
}

const db_member& record::member(std::size_t index) const {
    return members_.at(index);
}

db_member& record::member(const std::string& key) {
    for (auto& m : members_) {
        if (m.key() == key) return m;
    }
    throw std::out_of_range("No member named " + key);
}

const db_member& record::member(const std::string& key) const {
    for (const auto& m : members_) {
        if (m.key() == key) return m;
    }
    throw std::out_of_range("No member named " + key);
}

const std::string& record::id_column() const {
    if (members_.empty()) {
        throw tabula_error(table() + " has no members");
    }
    return members_.front().key();
}

std::vector<const db_member*> record::primary_key_members() const {
    std::vector<const db_member*> keys;
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (i == 0 || members_[i].primary()) {
            keys.push_back(&members_[i]);
        }
    }
    return keys;
}

table_schema record::schema() const {
    table_schema result;
    result.name = table();
    result.columns.reserve(members_.size());
    for (std::size_t i = 0; i < members_.size(); ++i) {
        const auto& m = members_[i];
        result.columns.push_back({m.key(), m.type(), i == 0 || m.primary()});
    }
    return result;
}

std::string record::describe_table() const {
    if (members_.empty()) {
        throw tabula_error(table() + " has no members");
    }
    return schema().describe();
}

row_t record::to_row() const {
    row_t row;
    row.reserve(members_.size());
    for (const auto& m : members_) {
        row.emplace(m.key(), m.to_wire());
    }
    return row;
}

void record::from_row(const row_t& row) {
    for (auto& m : members_) {
        auto it = row.find(m.key());
        if (it == row.end()) {
            LOG_ERROR("record", "%s: row has no value for %s", table().c_str(), m.key().c_str());
            throw unknown_field_error(m.key());
        }
        m.from_wire(it->second);
    }
}

bool record::operator==(const record& other) const {
    if (this == &other) return true;
    if (typeid(*this) != typeid(other)) return false;
    return members_ == other.members_;
}

bool record::equals(const serializable& other) const {
    auto* r = dynamic_cast<const record*>(&other);
    return r && *this == *r;
}

std::size_t record::hash() const {
    std::size_t seed = std::hash<std::string>{}(table());
    for (const auto& m : members_) {
        detail::hash_combine(seed, m.hash());
    }
    return seed;
}

} // namespace tabula
