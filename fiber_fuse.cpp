#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include "assembly.h"
#include "fusion_io.h"
#include "structures.h"

struct CLI {
    std::string preset;
    std::string layout;
    std::optional<double> fusionDegree;
    double radius = 1.0;
    double scaleDown = 1.0;
    std::optional<double> tolerance;
    std::optional<double> coreTolerance;
    double scramble = 0.0;
    unsigned seed = 0;
    std::string out = "fusion.json";
    std::string svg;
    bool verbose = false;
};

static CLI parse(int ac, char** av){
    CLI c;
    cxxopts::Options options(av[0], "Area-conserving fusion of fiber cross-sections");
    options.add_options()
        ("p,preset", "preset cluster (ring-1..7, ring-10, ring-12, ring-19, line-1..5)", cxxopts::value<std::string>())
        ("l,layout", "fiber layout JSON", cxxopts::value<std::string>())
        ("f,fusion-degree", "fusion degree in [0,1]", cxxopts::value<double>())
        ("r,radius", "fiber radius for presets", cxxopts::value<double>())
        ("scale-down", "scale every fiber center toward the origin", cxxopts::value<double>())
        ("t,tolerance", "shift tolerance factor", cxxopts::value<double>())
        ("core-tolerance", "core split tolerance", cxxopts::value<double>())
        ("scramble", "core position scrambling factor", cxxopts::value<double>())
        ("seed", "scrambling seed", cxxopts::value<unsigned>())
        ("o,out", "output JSON", cxxopts::value<std::string>())
        ("svg", "output SVG", cxxopts::value<std::string>())
        ("v,verbose", "verbose", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "print help");

    auto result = options.parse(ac, av);
    if(result.count("help") || ac==1){
        std::cout << options.help() << "\n";
        std::exit(0);
    }

    c.preset   = result.count("preset")   ? result["preset"].as<std::string>() : "";
    c.layout   = result.count("layout")   ? result["layout"].as<std::string>() : "";
    c.radius   = result.count("radius")   ? result["radius"].as<double>()      : 1.0;
    c.scaleDown = result.count("scale-down") ? result["scale-down"].as<double>() : 1.0;
    c.scramble = result.count("scramble") ? result["scramble"].as<double>()    : 0.0;
    c.seed     = result.count("seed")     ? result["seed"].as<unsigned>()      : 0u;
    c.out      = result.count("out")      ? result["out"].as<std::string>()    : "fusion.json";
    c.svg      = result.count("svg")      ? result["svg"].as<std::string>()    : "";
    c.verbose  = result["verbose"].as<bool>();
    if(result.count("fusion-degree")) c.fusionDegree = result["fusion-degree"].as<double>();
    if(result.count("tolerance")) c.tolerance = result["tolerance"].as<double>();
    if(result.count("core-tolerance")) c.coreTolerance = result["core-tolerance"].as<double>();

    if(c.preset.empty() == c.layout.empty())
        throw std::runtime_error("give exactly one of --preset or --layout, use --help for usage");
    return c;
}

static Assembly assemble(const CLI& cli){
    if(!cli.preset.empty())
        return makePreset(cli.preset, cli.radius, cli.fusionDegree, DEFAULT_RESOLUTION, cli.scaleDown);

    LayoutFile layout = loadLayoutJson(cli.layout);
    if(layout.fibers.empty()) throw std::runtime_error("no fibers loaded from " + cli.layout);

    std::vector<Vec2> centers;
    for(const auto& f : layout.fibers) centers.push_back(f.center);
    std::optional<double> degree = cli.fusionDegree ? cli.fusionDegree : layout.fusionDegree;
    if(degree) applyFusionDegree(centers, *degree);

    Assembly assembly;
    int resolution = layout.resolution.value_or(DEFAULT_RESOLUTION);
    for(size_t i=0;i<centers.size();++i) assembly.addFiber(centers[i], layout.fibers[i].radius, resolution);
    if(cli.scaleDown != 1.0) assembly.scalePositions(cli.scaleDown);

    if(layout.toleranceFactor) assembly.options().shift.toleranceFactor = *layout.toleranceFactor;
    if(layout.coreTolerance) assembly.options().core.tolerance = *layout.coreTolerance;
    if(layout.shiftBounds) assembly.options().shift.bounds = layout.shiftBounds;
    return assembly;
}

int main(int argc, char** argv){
    try {
        CLI cli = parse(argc, argv);
        spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
        spdlog::set_level(cli.verbose ? spdlog::level::debug : spdlog::level::warn);

        Assembly assembly = assemble(cli);
        if(cli.tolerance) assembly.options().shift.toleranceFactor = *cli.tolerance;
        if(cli.coreTolerance) assembly.options().core.tolerance = *cli.coreTolerance;
        if(cli.verbose){
            assembly.options().shift.observer = [](double shift, double added, double removed, double cost){
                spdlog::debug("trial shift {:.8g}: added {:.6g}, removed {:.6g}, cost {:.3e}",
                              shift, added, removed, cost);
            };
        }

        assembly.build();
        scrambleCores(assembly, cli.scramble, cli.seed);

        ExportResultJson(cli.out, assembly);
        spdlog::info("result written to {}", cli.out);
        if(!cli.svg.empty()){
            ExportFusionToSVG(cli.svg, assembly);
            spdlog::info("SVG exported to {}", cli.svg);
        }
        std::cout << assembly.size() << " fibers, " << assembly.connections().size()
                  << " connections, shift " << assembly.shift()
                  << " (" << toString(assembly.topology()) << ")  ->  " << cli.out << "\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 1;
    }
}
