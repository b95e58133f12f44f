#ifndef GD_STORAGE_HPP
#define GD_STORAGE_HPP

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>

namespace gd {

/**
 * @brief side table attaching algorithm-private attributes to vertices or arcs.
 *
 * An algorithm invocation creates the tables it needs and passes them by reference to its helpers, so the
 * attributes live exactly as long as the invocation. Missing entries are created with `TValue{}` (or the
 * configured default) on first write access.
 */
template<typename TKey, typename TValue, typename THash = std::hash<TKey>>
class Storage {
    std::unordered_map<TKey, TValue, THash> _values;
    TValue                                  _default{};

public:
    Storage() = default;
    explicit Storage(TValue defaultValue) : _default(std::move(defaultValue)) {}

    TValue& operator[](const TKey& key) { return _values.try_emplace(key, _default).first->second; }

    [[nodiscard]] const TValue& at(const TKey& key) const {
        auto it = _values.find(key);
        return it == _values.end() ? _default : it->second;
    }

    [[nodiscard]] const TValue* find(const TKey& key) const {
        auto it = _values.find(key);
        return it == _values.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool        contains(const TKey& key) const { return _values.contains(key); }
    [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }
    void                      erase(const TKey& key) { _values.erase(key); }
    void                      clear() noexcept { _values.clear(); }

    [[nodiscard]] auto begin() noexcept { return _values.begin(); }
    [[nodiscard]] auto end() noexcept { return _values.end(); }
    [[nodiscard]] auto begin() const noexcept { return _values.begin(); }
    [[nodiscard]] auto end() const noexcept { return _values.end(); }
};

} // namespace gd

#endif // GD_STORAGE_HPP
