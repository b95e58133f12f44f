#include <gd/Options.hpp>

namespace gd::options {

namespace {
constexpr double kOneCentimetre = 28.452755; // in pt
} // namespace

const property_map& defaults() {
    static const property_map kDefaults = [] {
        property_map map;
        // general layout
        map["node distance"]    = kOneCentimetre;
        map["level distance"]   = kOneCentimetre;
        map["sibling distance"] = kOneCentimetre;
        map["random seed"]      = 42.0;
        map["debug layout"]     = false;

        // spring and spring-electrical algorithms
        map["iterations"]                = 500.0;
        map["cooling factor"]            = 0.95;
        map["initial step length"]       = 0.0;
        map["convergence tolerance"]     = 0.01;
        map["spring constant"]           = 0.01;
        map["electric charge"]           = 1.0;
        map["electric force order"]      = 1.0;
        map["approximate remote forces"] = false;
        map["coarsen"]                   = true;
        map["downsize ratio"]            = 0.25;
        map["minimum coarsening size"]   = 2.0;

        // force framework
        map["maximum displacement per step"] = 100.0;
        map["global speed factor"]           = 1.0;
        map["maximum time"]                  = 50.0;
        map["find equilibrium"]              = true;
        map["equilibrium threshold"]         = 3.0;
        map["grid x length"]                 = 10.0;
        map["grid y length"]                 = 10.0;
        map["snap to grid"]                  = false;
        map["mass"]                          = 1.0;
        map["coarsening weight"]             = 1.0;
        map["gravity"]                       = 0.2;
        map["initial positioning"]           = std::string("circular initial position");
        map["radius"]                        = 0.0;
        map["node pre sep"]                  = 5.0;
        map["node post sep"]                 = 5.0;
        map["sibling pre sep"]               = 5.0;
        map["sibling post sep"]              = 5.0;

        // components
        map["componentwise"]       = false;
        map["component order"]     = std::string("by first specified node");
        map["component direction"] = 0.0;
        map["component sep"]       = 8.0;
        map["component align"]     = std::string("first node");
        map["component packing"]   = std::string("skyline");

        // edges
        map["tail cut"]           = true;
        map["head cut"]           = true;
        map["cut policy"]         = std::string("as edge requests");
        map["allow inside edges"] = true;
        return map;
    }();
    return kDefaults;
}

} // namespace gd::options
