#ifndef __MAZE_BFS_SOLVER_HPP___
#define __MAZE_BFS_SOLVER_HPP___

#include <vector>

#include "grid.hpp"

/**
 * @file maze-bfs-solver.hpp
 * @brief Breadth-first search shortest path over a maze `Grid`.
 */

/**
 * @brief Find the shortest 4-connected path from start to end.
 *
 * Neighbors are expanded in the order up, down, left, right, and a cell is
 * marked visited when it is enqueued, so ties between equally short paths
 * are always broken the same way. The search stops as soon as `end` is
 * dequeued.
 *
 * @param grid Maze grid; wall cells are not traversable.
 * @param start Starting cell.
 * @param end Target cell.
 * @param visited_nodes Optional out-parameter to receive number of expanded nodes.
 * @return Sequence of cells from start to end inclusive (empty if no path exists).
 * @throws std::invalid_argument if start or end lies outside the grid or on a wall.
 */
std::vector<Coordinate> BFSMazeSolver(const Grid &grid, const Coordinate &start, const Coordinate &end, int* visited_nodes = nullptr);

#endif // __MAZE_BFS_SOLVER_HPP___
