#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"
#include "maze_renderer.hpp"
#include "maze_file_operations.hpp"
#include "maze-bfs-solver.hpp"
#include "solve_maze.hpp"

using namespace std;

const char* solve_status_name(SolveStatus status) {
    switch (status) {
        case SolveStatus::Solved: return "Solved";
        case SolveStatus::NoPathFound: return "NoPathFound";
        case SolveStatus::ParseError: return "ParseError";
    }
    return "Unknown";
}

static double elapsed_since(chrono::steady_clock::time_point t0) {
    auto t1 = chrono::steady_clock::now();
    return chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();
}

SolveReport solve_maze(const string& maze, const string& marker) {
    SolveReport report;
    auto t0 = chrono::steady_clock::now();

    ParsedMaze parsed;
    try {
        parsed = parse_maze(maze);
    } catch (const MazeParseError& e) {
        report.elapsed_ms = elapsed_since(t0);
        report.status = SolveStatus::ParseError;
        report.parse_error = e;
        report.output = render_parse_error(e, report.elapsed_ms, maze);
        return report;
    }

    report.rows = parsed.grid.get_rows();
    report.columns = parsed.grid.get_columns();
    report.path = BFSMazeSolver(parsed.grid, parsed.start, parsed.end, &report.visited_nodes);
    report.elapsed_ms = elapsed_since(t0);

    if (report.path.empty()) {
        report.status = SolveStatus::NoPathFound;
        report.output = render_no_path(maze, report.elapsed_ms);
    } else {
        report.status = SolveStatus::Solved;
        report.output = render_solution(parsed.grid, report.path, marker);
    }
    return report;
}

double solve_maze_to_file(const string& maze, const string& output_file, const string& marker) {
    SolveReport report = solve_maze(maze, marker);
    try {
        write_output_to_file(report.output, output_file);
    } catch (const std::exception& e) {
        cerr << "Error writing solution artifact: " << e.what() << '\n';
    }
    return report.elapsed_ms;
}
