/**
 * @file maze_parser.hpp
 * @brief Validation and parsing of textual mazes into a Grid plus start/end.
 */

#ifndef __MAZE_PARSER_HPP___
#define __MAZE_PARSER_HPP___

#include <cstddef>
#include <stdexcept>
#include <string>

#include "grid.hpp"

/**
 * @brief Reason a maze string was rejected.
 */
enum class ParseErrorKind {
    EmptyInput,
    MalformedGrid,
    InvalidCharacter,
    MissingStart,
    MissingEnd
};

/**
 * @brief Stable name of a ParseErrorKind (e.g. "MalformedGrid").
 */
const char* parse_error_kind_name(ParseErrorKind kind);

/**
 * @brief Exception thrown by parse_maze().
 *
 * Besides the message it carries the context needed to diagnose the input
 * without parsing it again. Fields that do not apply to the kind are -1
 * (or '\0' for the character).
 *
 * | kind             | row | column | expected        | actual          | character |
 * |------------------|-----|--------|-----------------|-----------------|-----------|
 * | MalformedGrid    | yes |        | first row width | this row width  |           |
 * | (oversized)      |     |        | INT_MAX         |                 |           |
 * | InvalidCharacter | yes | yes    |                 |                 | yes       |
 * | MissingStart/End |     |        | 1               | markers found   |           |
 */
class MazeParseError : public std::invalid_argument {

private:
    ParseErrorKind kind;
    int row = -1;
    int column = -1;
    int expected = -1;
    int actual = -1;
    char character = '\0';

    MazeParseError(ParseErrorKind kind, const std::string& message);
public:
    static MazeParseError empty_input();
    static MazeParseError malformed_grid(int row, int expected_length, int actual_length);
    static MazeParseError oversized_grid(size_t rows, size_t columns);
    static MazeParseError invalid_character(int row, int column, char character);
    static MazeParseError missing_start(int found);
    static MazeParseError missing_end(int found);

    ParseErrorKind get_kind() const { return kind; }
    int get_row() const { return row; }
    int get_column() const { return column; }
    int get_expected() const { return expected; }
    int get_actual() const { return actual; }
    char get_character() const { return character; }
};

/**
 * @brief Result of a successful parse.
 */
struct ParsedMaze {
    Grid grid;
    Coordinate start;
    Coordinate end;
};

/**
 * @brief Parse a maze string.
 *
 * Rows are separated by '\n' (a trailing '\r' per row is dropped). Line
 * breaks before the first and after the last row are ignored; spaces are
 * kept since they are free cells. Rows are validated in order, the length
 * check of a row before its characters. Start and end must each occur
 * exactly once.
 *
 * @param maze Raw maze text.
 * @return Parsed grid with start and end coordinates.
 * @throws MazeParseError describing the first problem found.
 */
ParsedMaze parse_maze(const std::string& maze);

#endif // __MAZE_PARSER_HPP___
