#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"

#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

enum class State
{
    START,
    EXPLORE,
    END
};

class Exploer
{
public:
    explicit Exploer(Maze maze) : maze(std::move(maze)) {}
    virtual ~Exploer() = default;

    Maze maze;
    State state{State::START};
    uint32_t timeStep{0};

    std::vector<Point> way;   // explored order
    std::vector<Point> path;  // final path: start -> exit

    bool found{false};
    std::string error;

    virtual void update();
};

// Center -> Exit connectivity search. The room edge cells that open to the
// outside are seeded behind the center, so the center is expanded first.
// DepthFirst pushes on the tail, BreadthFirst on the head; both pop the tail.
class RouteExploer : public Exploer
{
private:
    RouteOrder order_;
    std::deque<uint32_t> work_;
    std::vector<uint8_t> visited_;
    std::unordered_map<uint32_t, uint32_t> parent_;

    void seed_();
    void push_(uint32_t k);
    void buildPath_(uint32_t endK);

public:
    RouteExploer(Maze maze, RouteOrder order);
    void update() override;
};
