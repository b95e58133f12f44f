#ifndef GD_ALGORITHM_BUILTINS_HPP
#define GD_ALGORITHM_BUILTINS_HPP

#include <cstddef>

#include <gd/AlgorithmRegistry.hpp>
#include <gd/Export.hpp>

namespace gd {

/// registers the force-based and layered algorithms; returns the number of keys that were not registered before
GD_EXPORT std::size_t registerBuiltinAlgorithms(AlgorithmRegistry& registry = globalAlgorithmRegistry());

} // namespace gd

#endif // GD_ALGORITHM_BUILTINS_HPP
