#pragma once
#include "core/Common.hpp"
#include "core/GraphBuilder.hpp"

class SpanningTree
{
public:
    // Prim's algorithm rooted at the center node. A disconnected graph yields the
    // tree of the center's component.
    static MazeGraph Prim(const MazeGraph& graph);
};
