#ifndef __BFS_API_HPP___
#define __BFS_API_HPP___

/**
 * @file bfs_api.hpp
 * @brief C entry point for solving a maze string and writing the artifact.
 */

#define MAZE_API_SOLVED 1
#define MAZE_API_NO_PATH 0
#define MAZE_API_BAD_ARGUMENTS -1
#define MAZE_API_PARSE_ERROR -2
#define MAZE_API_OUTPUT_ERROR -3
#define MAZE_API_INTERNAL_ERROR -4

extern "C" {
    /**
     * @brief Solve `maze` and write the rendered artifact to `output_file`.
     *
     * @param maze NUL-terminated maze text.
     * @param output_file Path of the artifact to write.
     * @param out_time_ms Receives elapsed milliseconds (parse + search).
     * @param out_steps Receives number of cells on the path (0 if none).
     * @param out_visited Receives number of expanded nodes.
     * @return One of the MAZE_API_* codes. Outputs are left untouched on
     *         MAZE_API_BAD_ARGUMENTS and MAZE_API_INTERNAL_ERROR (the solve
     *         itself failed, e.g. out of memory).
     */
    int maze_solve_to_file(
        const char* maze,
        const char* output_file,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    );
}

#endif // __BFS_API_HPP___
