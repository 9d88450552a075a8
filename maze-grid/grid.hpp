/**
 * @file grid.hpp
 * @brief Rectangular character maze grid and cell coordinates.
 *
 * This header declares the Grid class used by the parser, the BFS solver
 * and the renderer.
 */

#ifndef __GRID_HPP___
#define __GRID_HPP___

#include <cstddef>
#include <string>
#include <vector>

constexpr char WALL_SYMBOL = '#';
constexpr char FREE_SYMBOL = ' ';
constexpr char START_SYMBOL = 'S';
constexpr char END_SYMBOL = 'E';

/**
 * @brief Kind of a maze cell.
 */
enum class Cell { Wall, Free, Start, End };

/**
 * @brief Classify a maze symbol.
 *
 * @param symbol Character read from the maze.
 * @param cell Out-parameter receiving the cell kind on success.
 * @return true if `symbol` belongs to the maze alphabet.
 */
bool classify_symbol(char symbol, Cell& cell);

/**
 * @brief Zero-indexed (row, column) position in a grid.
 */
struct Coordinate {
    int row = 0;
    int column = 0;

    bool operator==(const Coordinate& rhs) const { return row == rhs.row && column == rhs.column; }
    bool operator!=(const Coordinate& rhs) const { return !(*this == rhs); }
    // Row-major ordering, for ordered containers.
    bool operator<(const Coordinate& rhs) const {
        return row != rhs.row ? row < rhs.row : column < rhs.column;
    }
};

/**
 * @brief Immutable rectangular grid of maze symbols.
 *
 * The grid keeps the original characters (including the S and E markers)
 * so it can be rendered back. Only valid symbols are accepted; start/end
 * bookkeeping is done by the parser.
 */
class Grid {

private:
    std::vector<std::string> rows;
    int num_rows = 0;
    int num_columns = 0;
public:
    Grid() = default;

    /**
     * @brief Construct a grid from its rows.
     *
     * @param rows Row strings, all of the same non-zero length.
     * @throws std::invalid_argument if the rows are empty, not rectangular,
     *         wider or taller than INT_MAX, or contain a symbol outside the
     *         maze alphabet.
     */
    explicit Grid(const std::vector<std::string>& rows);

    int get_rows() const;
    int get_columns() const;

    /**
     * @brief Number of cells (rows * columns), computed without int overflow.
     */
    size_t get_cell_count() const;

    /**
     * @brief Whether `position` lies inside the grid.
     */
    bool in_bounds(const Coordinate& position) const;

    /**
     * @brief Symbol stored at `position`.
     * @throws std::out_of_range if `position` is outside the grid.
     */
    char get_symbol(const Coordinate& position) const;

    /**
     * @brief Cell kind at `position`.
     * @throws std::out_of_range if `position` is outside the grid.
     */
    Cell get_cell(const Coordinate& position) const;

    /**
     * @brief True for every non-wall cell inside the grid.
     */
    bool is_traversable(const Coordinate& position) const;

    /**
     * @brief Traversable 4-neighbors of `position`.
     *
     * Neighbors are returned in the fixed order up, down, left, right;
     * out-of-bounds and wall cells are skipped.
     *
     * @param position Cell whose neighbors are requested.
     * @return Vector of neighbor coordinates.
     */
    std::vector<Coordinate> get_neighbors(const Coordinate& position) const;

    /**
     * @brief Row-major linear index of `position` (row * columns + column).
     */
    size_t index_of(const Coordinate& position) const;

    /**
     * @brief Inverse of index_of().
     */
    Coordinate coordinate_of(size_t index) const;

    const std::vector<std::string>& get_row_strings() const;

    bool operator==(const Grid& rhs) const;
    bool operator!=(const Grid& rhs) const;
};

#endif // __GRID_HPP___
