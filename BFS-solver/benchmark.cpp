#include <iostream>
#include <string>

#include "maze_file_operations.hpp"
#include "maze_parser.hpp"
#include "maze_renderer.hpp"
#include "solve_maze.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    string output_file = "output.txt";
    string marker = DEFAULT_PATH_MARKER;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
        else if (a == "--marker" && i + 1 < argc) { marker = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: maze-solver --input-file FILE [--output-file FILE] [--marker TEXT]\n";
            return 0;
        }
        else {
            cerr << "Unknown or incomplete argument: " << a << '\n';
            return 1;
        }
    }
    if (input_file.empty()) {
        cerr << "--input-file is required\n";
        return 1;
    }

    string maze;
    try {
        maze = read_maze_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error reading maze: " << e.what() << '\n';
        return 2;
    }

    SolveReport report = solve_maze(maze, marker);
    try {
        write_output_to_file(report.output, output_file);
    } catch (const std::exception& e) {
        cerr << "Error writing output: " << e.what() << '\n';
        return 3;
    }

    if (report.status == SolveStatus::ParseError) {
        cerr << "Invalid maze (" << parse_error_kind_name(report.parse_error->get_kind()) << "): "
             << report.parse_error->what() << '\n';
        cout << "time: " << report.elapsed_ms << "ms, status: " << solve_status_name(report.status) << '\n';
        return 4;
    }

    bool found = report.status == SolveStatus::Solved;
    cout << report.rows << "x" << report.columns << ", time: " << report.elapsed_ms << "ms, solution found: " << (found?1:0)
         << ", steps: " << report.path.size() << ", visited nodes: " << report.visited_nodes
         << ", output: " << output_file << '\n';

    return 0;
}
