#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"
#include "maze_renderer.hpp"

using namespace std;

const char* const DEFAULT_PATH_MARKER = "\xC2\xB7";

string grid_to_string(const Grid& grid) {
    return render_solution(grid, {}, "");
}

string render_solution(const Grid& grid, const vector<Coordinate>& path, const string& marker) {
    int rows = grid.get_rows();
    int columns = grid.get_columns();
    vector<bool> traveled(grid.get_cell_count(), false);
    for (const auto& step : path) {
        if (!grid.in_bounds(step)) {
            throw out_of_range("Path cell (" + to_string(step.row) + "," +
                               to_string(step.column) + ") is outside the grid");
        }
        traveled[grid.index_of(step)] = true;
    }

    string out;
    out.reserve(static_cast<size_t>(rows) * (columns + 1));
    const auto& row_strings = grid.get_row_strings();
    for (int r = 0; r < rows; ++r) {
        if (r) out += '\n';
        for (int c = 0; c < columns; ++c) {
            char symbol = row_strings[r][c];
            bool is_marker = symbol == START_SYMBOL || symbol == END_SYMBOL;
            if (traveled[grid.index_of(Coordinate{r, c})] && !is_marker) {
                out += marker;
            } else {
                out += symbol;
            }
        }
    }
    return out;
}

string format_elapsed_ms(double elapsed_ms) {
    ostringstream ss;
    ss << fixed << setprecision(4) << elapsed_ms;
    return ss.str();
}

string render_no_path(const string& maze, double elapsed_ms) {
    string out = "No path found in maze.\n";
    out += "(Processing time: " + format_elapsed_ms(elapsed_ms) + " ms)\n\n";
    out += maze;
    return out;
}

string render_parse_error(const MazeParseError& error, double elapsed_ms, const string& maze) {
    string out = string("Error processing maze (") + parse_error_kind_name(error.get_kind()) + "): " + error.what() + "\n";
    out += "Elapsed time until error: " + format_elapsed_ms(elapsed_ms) + " ms\n\n";
    out += "Maze provided:\n" + maze;
    return out;
}
