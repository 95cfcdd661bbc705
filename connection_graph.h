#pragma once
#include "connection.h"
#include <vector>

// Pairs up fibers whose disks overlap with positive area. Boundary contact
// does not connect two fibers.
class ConnectionGraph {
public:
    // Connections refer into `fibers`, which must not reallocate afterwards.
    static std::vector<PairConnection> build(std::vector<Circle>& fibers);
};
