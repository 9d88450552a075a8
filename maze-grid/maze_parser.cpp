#include <cctype>
#include <climits>
#include <cstddef>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"

using namespace std;

const char* parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::EmptyInput: return "EmptyInput";
        case ParseErrorKind::MalformedGrid: return "MalformedGrid";
        case ParseErrorKind::InvalidCharacter: return "InvalidCharacter";
        case ParseErrorKind::MissingStart: return "MissingStart";
        case ParseErrorKind::MissingEnd: return "MissingEnd";
    }
    return "Unknown";
}

MazeParseError::MazeParseError(ParseErrorKind kind, const string& message)
    : invalid_argument(message), kind(kind) {}

MazeParseError MazeParseError::empty_input() {
    return MazeParseError(ParseErrorKind::EmptyInput,
                          "Maze is empty or contains only whitespace");
}

MazeParseError MazeParseError::malformed_grid(int row, int expected_length, int actual_length) {
    MazeParseError error(ParseErrorKind::MalformedGrid,
                         "Row " + to_string(row) + " has inconsistent length. Expected: " +
                         to_string(expected_length) + ", got: " + to_string(actual_length));
    error.row = row;
    error.expected = expected_length;
    error.actual = actual_length;
    return error;
}

MazeParseError MazeParseError::oversized_grid(size_t rows, size_t columns) {
    MazeParseError error(ParseErrorKind::MalformedGrid,
                         "Maze of " + to_string(rows) + "x" + to_string(columns) +
                         " is too large. Rows and row length must not exceed " + to_string(INT_MAX));
    error.expected = INT_MAX;
    return error;
}

MazeParseError MazeParseError::invalid_character(int row, int column, char character) {
    MazeParseError error(ParseErrorKind::InvalidCharacter,
                         string("Invalid character '") + character + "' at (" + to_string(row) +
                         "," + to_string(column) + "). Use only 'S', 'E', '#', ' '");
    error.row = row;
    error.column = column;
    error.character = character;
    return error;
}

MazeParseError MazeParseError::missing_start(int found) {
    MazeParseError error(ParseErrorKind::MissingStart,
                         found == 0 ? string("Start point 'S' not found in maze")
                                    : "Start point 'S' must appear exactly once, found " + to_string(found));
    error.expected = 1;
    error.actual = found;
    return error;
}

MazeParseError MazeParseError::missing_end(int found) {
    MazeParseError error(ParseErrorKind::MissingEnd,
                         found == 0 ? string("End point 'E' not found in maze")
                                    : "End point 'E' must appear exactly once, found " + to_string(found));
    error.expected = 1;
    error.actual = found;
    return error;
}

static vector<string> split_rows(const string& maze) {
    size_t first = maze.find_first_not_of("\r\n");
    size_t last = maze.find_last_not_of("\r\n");
    vector<string> rows;
    if (first == string::npos) return rows;

    size_t begin = first;
    while (begin <= last) {
        size_t end = maze.find('\n', begin);
        if (end == string::npos || end > last) end = last + 1;
        string row = maze.substr(begin, end - begin);
        if (!row.empty() && row.back() == '\r') row.pop_back();
        rows.push_back(row);
        begin = end + 1;
    }
    return rows;
}

ParsedMaze parse_maze(const string& maze) {
    bool blank = true;
    for (char c : maze) {
        if (!isspace(static_cast<unsigned char>(c))) {
            blank = false;
            break;
        }
    }
    if (blank) {
        throw MazeParseError::empty_input();
    }

    vector<string> rows = split_rows(maze);
    if (rows.size() > static_cast<size_t>(INT_MAX) || rows[0].size() > static_cast<size_t>(INT_MAX)) {
        throw MazeParseError::oversized_grid(rows.size(), rows[0].size());
    }
    int columns = static_cast<int>(rows[0].size());

    Coordinate start, end;
    int start_count = 0;
    int end_count = 0;
    for (int r = 0; r < static_cast<int>(rows.size()); ++r) {
        const string& row = rows[r];
        if (row.size() != static_cast<size_t>(columns)) {
            size_t actual = row.size() > static_cast<size_t>(INT_MAX) ? static_cast<size_t>(INT_MAX) : row.size();
            throw MazeParseError::malformed_grid(r, columns, static_cast<int>(actual));
        }
        for (int c = 0; c < columns; ++c) {
            Cell cell;
            if (!classify_symbol(row[c], cell)) {
                throw MazeParseError::invalid_character(r, c, row[c]);
            }
            if (cell == Cell::Start) {
                start = Coordinate{r, c};
                ++start_count;
            } else if (cell == Cell::End) {
                end = Coordinate{r, c};
                ++end_count;
            }
        }
    }

    if (start_count != 1) {
        throw MazeParseError::missing_start(start_count);
    }
    if (end_count != 1) {
        throw MazeParseError::missing_end(end_count);
    }
    return ParsedMaze{Grid(rows), start, end};
}
