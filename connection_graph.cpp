#include "connection_graph.h"
#include "bvh.h"
#include <spdlog/spdlog.h>

std::vector<PairConnection> ConnectionGraph::build(std::vector<Circle>& fibers){
    std::vector<Rect64> boxes;
    boxes.reserve(fibers.size());
    for(const auto& f : fibers) boxes.push_back(f.shape().bounds());

    BVH bvh = buildBVH(boxes);
    auto candidates = candidatePairs(bvh);

    std::vector<PairConnection> connections;
    for(auto [i, j] : candidates){
        if(!fibers[i].overlaps(fibers[j])) continue;
        connections.emplace_back(fibers[i], fibers[j], i, j);
    }
    spdlog::debug("connection graph: {} fibers, {} candidate pairs, {} connections",
                  fibers.size(), candidates.size(), connections.size());
    return connections;
}
