#include <exception>
#include <string>
#include "maze_file_operations.hpp"
#include "solve_maze.hpp"

#include "bfs_api.hpp"

extern "C" {
    int maze_solve_to_file(
        const char* maze,
        const char* output_file,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    ) {
        if (!maze || !output_file || !out_time_ms || !out_steps || !out_visited) {
            return MAZE_API_BAD_ARGUMENTS;
        }
        SolveReport report;
        try {
            report = solve_maze(std::string(maze));
        } catch (const std::exception&) {
            return MAZE_API_INTERNAL_ERROR;
        }

        *out_time_ms = report.elapsed_ms;
        *out_steps = static_cast<int>(report.path.size());
        *out_visited = report.visited_nodes;

        try {
            write_output_to_file(report.output, std::string(output_file));
        } catch (const std::exception&) {
            return MAZE_API_OUTPUT_ERROR;
        }

        switch (report.status) {
            case SolveStatus::Solved: return MAZE_API_SOLVED;
            case SolveStatus::NoPathFound: return MAZE_API_NO_PATH;
            case SolveStatus::ParseError: return MAZE_API_PARSE_ERROR;
        }
        return MAZE_API_PARSE_ERROR;
    }
}
