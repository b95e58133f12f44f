#include <gd/algorithm/force/ForceLayouts.hpp>

#include <gd/algorithm/force/ForceController.hpp>
#include <gd/algorithm/force/PathLengths.hpp>

namespace gd::force {

namespace {

ForceConfig forceConfig(std::vector<std::string> epochs, ForceFunction law, TimeFunction timeFunction = {}) {
    ForceConfig config;
    config.epochs       = std::move(epochs);
    config.funU         = std::move(law);
    config.timeFunction = std::move(timeFunction);
    return config;
}

double frameworkValue(const ForceArguments& args, std::string_view key) {
    const property_map* values = args.attributes.framework.find(args.u);
    return values == nullptr ? 0.0 : options::value<double>(*values, key, 0.0);
}

} // namespace

void HuSpringElectricalFW::run(Digraph& /*digraph*/, const property_map& options) {
    CoarseningAttributes attributes;
    ForceController      hu(_context.ugraph, _context.random, options, attributes);
    hu.addForce<ForceCanvasDistance>(forceConfig({"during expand", "after expand"}, [](const ForceArguments& a) { return a.k * a.k / a.d; }));
    hu.addForce<ForceGraphDistance>(forceConfig({"during expand", "after expand"}, [](const ForceArguments& a) { return -(a.d * a.d) / a.k; }));
    hu.run();
}

void FruchtermanReingold::run(Digraph& /*digraph*/, const property_map& options) {
    CoarseningAttributes attributes;
    ForceController      controller(_context.ugraph, _context.random, options, attributes);
    controller.addForce<ForceCanvasDistance>(forceConfig({"after expand"}, [](const ForceArguments& a) { return a.k * a.k / a.d; }, [](double tTotal, double tNow) { return tNow / tTotal <= 0.5 ? 0.5 : 2.0; }));
    controller.addForce<ForceGraphDistance>(forceConfig({"after expand"}, [](const ForceArguments& a) { return -(a.d * a.d) / a.k; }));
    controller.run();
}

void SimpleSpring::run(Digraph& /*digraph*/, const property_map& options) {
    CoarseningAttributes attributes;
    ForceController      controller(_context.ugraph, _context.random, options, attributes);
    controller.addForce<ForceGraphDistance>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return a.k * (a.k - a.d); }));
    controller.run();
}

void SocialGravityDegree::run(Digraph& /*digraph*/, const property_map& options) {
    Digraph&             ugraph = _context.ugraph;
    CoarseningAttributes attributes;
    for (VertexId v : ugraph.vertices()) {
        attributes.framework[v]["social mass"] = static_cast<double>(ugraph.incoming(v).size());
    }

    ForceController controller(ugraph, _context.random, options, attributes);
    controller.addForce<ForceCanvasDistance>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return 4.0 * a.k / (a.d * a.d); }));
    controller.addForce<ForceCanvasPosition>(forceConfig(
        {"after expand", "during expand"}, [](const ForceArguments& a) { return frameworkValue(a, "social mass") * options::required<double>(a.options, "gravity"); },
        [](double tTotal, double tNow) { return tNow > 3.0 * tTotal / 4.0 ? tNow / tTotal : 0.0; }));
    controller.addForce<ForceGraphDistance>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return -a.d / (a.k * a.k); }, [](double tTotal, double tNow) { return tNow >= tTotal / 2.0 ? 2.0 : 1.0; }));
    controller.run();
}

void SocialGravityCloseness::run(Digraph& /*digraph*/, const property_map& options) {
    Digraph&             ugraph    = _context.ugraph;
    const DistanceTable  distances = breadthFirstSearch(ugraph);
    CoarseningAttributes attributes;
    for (VertexId v : ugraph.vertices()) {
        double sum = 0.0;
        for (VertexId w : ugraph.vertices()) {
            sum += distances(v, w);
        }
        sum /= static_cast<double>(ugraph.size());
        attributes.framework[v]["closeness mass"] = sum > 0.0 ? 1.0 / sum : 0.0;
    }

    ForceController controller(ugraph, _context.random, options, attributes);
    controller.addForce<ForceCanvasDistance>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return a.k / (a.d * a.d); }));
    controller.addForce<ForceCanvasPosition>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return frameworkValue(a, "closeness mass") * options::required<double>(a.options, "gravity"); }));
    controller.addForce<ForceGraphDistance>(forceConfig({"after expand", "during expand"}, [](const ForceArguments& a) { return -a.d / (a.k * a.k); }));
    controller.run();
}

} // namespace gd::force
