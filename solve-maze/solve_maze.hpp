/**
 * @file solve_maze.hpp
 * @brief Timed parse + BFS + render pipeline over a single maze string.
 */

#ifndef __SOLVE_MAZE_HPP___
#define __SOLVE_MAZE_HPP___

#include <optional>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"
#include "maze_renderer.hpp"

enum class SolveStatus { Solved, NoPathFound, ParseError };

const char* solve_status_name(SolveStatus status);

/**
 * @brief Outcome of one solve_maze() call.
 *
 * `elapsed_ms` covers parsing and the search (not rendering) and is set for
 * every status. `rows` and `columns` are the grid dimensions, 0 on a parse
 * error. `path` is non-empty only when `status == Solved`;
 * `parse_error` is set only when `status == ParseError`. `output` holds the
 * artifact: the rendered solution or the matching diagnostic text.
 */
struct SolveReport {
    SolveStatus status = SolveStatus::ParseError;
    double elapsed_ms = 0.0;
    int rows = 0;
    int columns = 0;
    std::vector<Coordinate> path;
    int visited_nodes = 0;
    std::string output;
    std::optional<MazeParseError> parse_error;
};

/**
 * @brief Parse and solve a maze, timing parse + search.
 *
 * Parse errors are reported through the returned status rather than thrown.
 *
 * @param maze Raw maze text.
 * @param marker Path marker passed to render_solution().
 * @return Tagged report with timing and the rendered artifact.
 */
SolveReport solve_maze(const std::string& maze, const std::string& marker = DEFAULT_PATH_MARKER);

/**
 * @brief Solve a maze and write the artifact to `output_file`.
 *
 * A failure to write `output_file` is reported on std::cerr; the elapsed
 * time is still returned.
 *
 * @param maze Raw maze text.
 * @param output_file Destination of the rendered artifact.
 * @param marker Path marker passed to render_solution().
 * @return Elapsed milliseconds, for every outcome including parse errors
 *         and output write failures.
 */
double solve_maze_to_file(const std::string& maze, const std::string& output_file,
                          const std::string& marker = DEFAULT_PATH_MARKER);

#endif // __SOLVE_MAZE_HPP___
