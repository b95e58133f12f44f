#ifndef GD_ALGORITHM_REGISTRY_HPP
#define GD_ALGORITHM_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gd/Export.hpp>
#include <gd/LayoutAlgorithm.hpp>

namespace gd {

/**
 * @brief maps string keys (the values of the `algorithm` option) to factories of a common interface.
 *
 * The registry is filled once at start-up; look-ups happen once per layout request. `create` returns `nullptr`
 * for unknown keys and leaves the reaction to the caller.
 */
template<typename TModel, typename... TArgs>
class Registry {
public:
    using Factory = std::function<std::unique_ptr<TModel>(TArgs...)>;

private:
    struct THandler {
        Factory         createFunction;
        AlgorithmTraits traits;
    };

    std::map<std::string, THandler, std::less<>> _handlers;

public:
    Registry()                                 = default;
    Registry(const Registry& other)            = delete;
    Registry& operator=(const Registry& other) = delete;

    Registry(Registry&& other) noexcept : _handlers(std::exchange(other._handlers, {})) {}
    Registry& operator=(Registry&& other) noexcept {
        auto tmp = std::move(other);
        std::swap(_handlers, tmp._handlers);
        return *this;
    }

    /// registers `TImpl` under `key`; returns false if the key was already taken (the new factory wins)
    template<typename TImpl>
    requires std::derived_from<TImpl, TModel> && std::is_constructible_v<TImpl, TArgs...>
    bool insert(std::string_view key, AlgorithmTraits traits = {}) {
        return insert(key, [](TArgs... args) -> std::unique_ptr<TModel> { return std::make_unique<TImpl>(std::forward<TArgs>(args)...); }, traits);
    }

    bool insert(std::string_view key, Factory factory, AlgorithmTraits traits = {}) {
        auto [it, inserted] = _handlers.insert_or_assign(std::string(key), THandler{std::move(factory), traits});
        return inserted;
    }

    [[nodiscard]] std::unique_ptr<TModel> create(std::string_view key, TArgs... args) const {
        if (auto it = _handlers.find(key); it != _handlers.end()) {
            return it->second.createFunction(std::forward<TArgs>(args)...);
        }
        return nullptr;
    }

    [[nodiscard]] std::optional<AlgorithmTraits> traits(std::string_view key) const {
        if (auto it = _handlers.find(key); it != _handlers.end()) {
            return it->second.traits;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::vector<std::string> keys() const {
        auto view = _handlers | std::views::keys;
        return {view.begin(), view.end()};
    }

    [[nodiscard]] bool contains(std::string_view key) const { return _handlers.contains(key); }
};

using AlgorithmRegistry = Registry<LayoutAlgorithm, AlgorithmContext>;

GD_EXPORT AlgorithmRegistry& globalAlgorithmRegistry(std::source_location location = std::source_location::current());

} // namespace gd

extern "C" {
GD_EXPORT
gd::AlgorithmRegistry* gdGlobalAlgorithmRegistry(std::source_location location = std::source_location::current());
}

#endif // GD_ALGORITHM_REGISTRY_HPP
