#include <algorithm>
#include <cstdint>
#include <queue>
#include <stdexcept>
#include <vector>
#include "grid.hpp"

#include "maze-bfs-solver.hpp"

std::vector<Coordinate> BFSMazeSolver(const Grid &grid, const Coordinate &start, const Coordinate &end, int* visited_nodes) {
    if (!grid.is_traversable(start)) {
        throw std::invalid_argument("Start must be a traversable cell inside the grid");
    }
    if (!grid.is_traversable(end)) {
        throw std::invalid_argument("End must be a traversable cell inside the grid");
    }

    std::vector<Coordinate> path;
    const size_t no_predecessor = SIZE_MAX;
    size_t start_index = grid.index_of(start);
    size_t end_index = grid.index_of(end);

    // predecessor[i] == no_predecessor for the start and for undiscovered cells
    std::vector<size_t> predecessor(grid.get_cell_count(), no_predecessor);
    std::vector<bool> discovered(grid.get_cell_count(), false);
    std::queue<size_t> frontier;
    frontier.push(start_index);
    discovered[start_index] = true;

    bool found = false;
    while (!frontier.empty()) {
        size_t current = frontier.front();
        frontier.pop();
        if (visited_nodes) {
            (*visited_nodes)++;
        }

        if (current == end_index) {
            found = true;
            break;
        }

        for (const auto &next : grid.get_neighbors(grid.coordinate_of(current))) {
            size_t next_index = grid.index_of(next);
            if (!discovered[next_index]) {
                discovered[next_index] = true;
                predecessor[next_index] = current;
                frontier.push(next_index);
            }
        }
    }

    if (!found) {
        return path;
    }
    for (size_t at = end_index; at != no_predecessor; at = predecessor[at]) {
        path.push_back(grid.coordinate_of(at));
    }
    std::reverse(path.begin(), path.end());
    return path;
}
