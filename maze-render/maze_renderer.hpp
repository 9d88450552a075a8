/**
 * @file maze_renderer.hpp
 * @brief Text artifacts for solved mazes, unsolvable mazes and parse errors.
 */

#ifndef __MAZE_RENDERER_HPP___
#define __MAZE_RENDERER_HPP___

#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"

/**
 * @brief Default marker for traveled cells: U+00B7 MIDDLE DOT, UTF-8 encoded.
 */
extern const char* const DEFAULT_PATH_MARKER;

/**
 * @brief Serialize a grid, one row per line, without a trailing newline.
 */
std::string grid_to_string(const Grid& grid);

/**
 * @brief Draw a path onto a copy of the grid and serialize it.
 *
 * Every path cell except the start and end markers is written as `marker`.
 * The grid itself is not modified.
 *
 * @param grid Parsed maze.
 * @param path Cells to mark, usually the output of BFSMazeSolver().
 * @param marker Text written in place of each traveled cell.
 * @return Rendered maze, rows separated by '\n'.
 * @throws std::out_of_range if a path cell lies outside the grid.
 */
std::string render_solution(const Grid& grid, const std::vector<Coordinate>& path,
                            const std::string& marker = DEFAULT_PATH_MARKER);

/**
 * @brief Format milliseconds with four decimals (e.g. "1.2500").
 */
std::string format_elapsed_ms(double elapsed_ms);

/**
 * @brief Diagnostic for a valid maze without a route from start to end.
 *
 * States that no path exists, the processing time, and echoes the maze.
 */
std::string render_no_path(const std::string& maze, double elapsed_ms);

/**
 * @brief Diagnostic for a maze rejected by the parser.
 *
 * Contains the error message, the time spent until the error, and the maze.
 */
std::string render_parse_error(const MazeParseError& error, double elapsed_ms, const std::string& maze);

#endif // __MAZE_RENDERER_HPP___
