#pragma once

#include "dao.hpp"

namespace tabula {

// Pass-through over dao<T>; the seam where caching or remote sources would go.
template<typename T>
class repository {
public:
    explicit repository(std::shared_ptr<store> backend) : dao_(std::move(backend)) {}
    explicit repository(dao<T> access) : dao_(std::move(access)) {}

    std::vector<T> get(const std::optional<std::vector<std::string>>& columns = std::nullopt) {
        return dao_.get(columns);
    }

    int64_t create(const T& obj) { return dao_.create(obj); }
    int64_t update(const T& obj) { return dao_.update(obj); }
    template<typename K, typename = std::enable_if_t<is_key_argument_v<K>>>
    int64_t remove(K&& key) { return dao_.remove(wire_value_t(std::forward<K>(key))); }
    int64_t remove(const wire_value_t& key) { return dao_.remove(key); }
    int64_t remove(const T& obj) { return dao_.remove(obj); }
    int64_t remove_all() { return dao_.remove_all(); }

    const std::string& table() const noexcept { return dao_.table(); }

private:
    dao<T> dao_;
};

} // namespace tabula
