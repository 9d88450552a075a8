#include <climits>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"

using namespace std;

bool classify_symbol(char symbol, Cell& cell) {
    switch (symbol) {
        case WALL_SYMBOL: cell = Cell::Wall; return true;
        case FREE_SYMBOL: cell = Cell::Free; return true;
        case START_SYMBOL: cell = Cell::Start; return true;
        case END_SYMBOL: cell = Cell::End; return true;
        default: return false;
    }
}

Grid::Grid(const vector<string>& rows) {
    if (rows.empty() || rows[0].empty()) {
        throw invalid_argument("Grid must have at least one row and one column");
    }
    size_t width = rows[0].size();
    if (rows.size() > static_cast<size_t>(INT_MAX) || width > static_cast<size_t>(INT_MAX)) {
        throw invalid_argument("Grid dimensions must not exceed INT_MAX");
    }
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw invalid_argument("Grid rows must all have the same length");
        }
        Cell cell;
        for (char symbol : row) {
            if (!classify_symbol(symbol, cell)) {
                throw invalid_argument(string("Invalid maze symbol '") + symbol + "'");
            }
        }
    }
    this->rows = rows;
    num_rows = static_cast<int>(rows.size());
    num_columns = static_cast<int>(width);
}

int Grid::get_rows() const {
    return num_rows;
}

int Grid::get_columns() const {
    return num_columns;
}

bool Grid::in_bounds(const Coordinate& position) const {
    return position.row >= 0 && position.row < num_rows &&
           position.column >= 0 && position.column < num_columns;
}

char Grid::get_symbol(const Coordinate& position) const {
    if (!in_bounds(position)) {
        throw out_of_range("Coordinate (" + to_string(position.row) + "," +
                           to_string(position.column) + ") is outside the grid");
    }
    return rows[position.row][position.column];
}

Cell Grid::get_cell(const Coordinate& position) const {
    Cell cell;
    char symbol = get_symbol(position);
    if (!classify_symbol(symbol, cell)) {
        throw invalid_argument(string("Invalid maze symbol '") + symbol + "'");
    }
    return cell;
}

bool Grid::is_traversable(const Coordinate& position) const {
    return in_bounds(position) && rows[position.row][position.column] != WALL_SYMBOL;
}

vector<Coordinate> Grid::get_neighbors(const Coordinate& position) const {
    // up, down, left, right
    static const int row_offsets[4] = {-1, 1, 0, 0};
    static const int column_offsets[4] = {0, 0, -1, 1};
    vector<Coordinate> neighbors;
    neighbors.reserve(4);
    for (int dir = 0; dir < 4; ++dir) {
        Coordinate next{position.row + row_offsets[dir], position.column + column_offsets[dir]};
        if (is_traversable(next)) {
            neighbors.push_back(next);
        }
    }
    return neighbors;
}

size_t Grid::get_cell_count() const {
    return static_cast<size_t>(num_rows) * static_cast<size_t>(num_columns);
}

size_t Grid::index_of(const Coordinate& position) const {
    return static_cast<size_t>(position.row) * static_cast<size_t>(num_columns) +
           static_cast<size_t>(position.column);
}

Coordinate Grid::coordinate_of(size_t index) const {
    size_t columns = static_cast<size_t>(num_columns);
    return Coordinate{static_cast<int>(index / columns), static_cast<int>(index % columns)};
}

const vector<string>& Grid::get_row_strings() const {
    return rows;
}

bool Grid::operator==(const Grid& rhs) const {
    return num_rows == rhs.num_rows && num_columns == rhs.num_columns && rows == rhs.rows;
}

bool Grid::operator!=(const Grid& rhs) const {
    return !(*this == rhs);
}
