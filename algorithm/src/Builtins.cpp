#include <gd/algorithm/Builtins.hpp>

#include <memory>

#include <gd/algorithm/force/ForceLayouts.hpp>
#include <gd/algorithm/force/SpringHu2006.hpp>
#include <gd/algorithm/layered/LayeredLayout.hpp>

namespace gd {

std::size_t registerBuiltinAlgorithms(AlgorithmRegistry& registry) {
    constexpr AlgorithmTraits kConnected{.connected = true};
    constexpr AlgorithmTraits kConnectedLoopFree{.connected = true, .loopFree = true};

    std::size_t result = 0UZ;
    result += registry.insert(
        "spring electrical layout", [](AlgorithmContext context) -> std::unique_ptr<LayoutAlgorithm> { return std::make_unique<force::SpringElectricalHu2006>(context, 0.2); }, kConnectedLoopFree);
    result += registry.insert<force::SpringElectricalHu2006>("spring electrical Hu 2006 layout", kConnectedLoopFree);
    result += registry.insert<force::SpringHu2006>("spring layout", kConnectedLoopFree);
    result += registry.insert<force::SpringHu2006>("spring Hu 2006 layout", kConnectedLoopFree);

    result += registry.insert<force::HuSpringElectricalFW>("jedi spring electric layout", kConnected);
    result += registry.insert<force::FruchtermanReingold>("spring electric no coarsen layout", kConnected);
    result += registry.insert<force::SimpleSpring>("trivial spring layout", kConnected);
    result += registry.insert<force::SocialGravityDegree>("social degree layout", kConnected);
    result += registry.insert<force::SocialGravityCloseness>("social closeness layout", kConnected);

    result += registry.insert<layered::LayeredLayout>("layered layout", kConnectedLoopFree);
    return result;
}

} // namespace gd

namespace {
[[maybe_unused]] const std::size_t gdBuiltinAlgorithmsInvoked = gd::registerBuiltinAlgorithms();
} // namespace
