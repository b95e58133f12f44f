#include <gd/AlgorithmRegistry.hpp>

extern "C" {
GD_EXPORT
gd::AlgorithmRegistry* gdGlobalAlgorithmRegistry([[maybe_unused]] std::source_location location) {
    static gd::AlgorithmRegistry s_instance;
    return std::addressof(s_instance);
}
}

namespace gd {
AlgorithmRegistry& globalAlgorithmRegistry(std::source_location location) { return *gdGlobalAlgorithmRegistry(location); }
} // namespace gd
