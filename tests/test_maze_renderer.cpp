// Google Test for the maze renderer
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_parser.hpp"
#include "maze_renderer.hpp"
#include "maze-bfs-solver.hpp"

static const std::string kSampleMaze =
    "#######\n"
    "#S #  #\n"
    "#  #E #\n"
    "#     #\n"
    "#######";

TEST(MazeRenderer, MarksIntermediatePathCells) {
    ParsedMaze m = parse_maze(kSampleMaze);
    auto path = BFSMazeSolver(m.grid, m.start, m.end);
    std::string rendered = render_solution(m.grid, path, ".");
    EXPECT_EQ(rendered,
              "#######\n"
              "#S #  #\n"
              "#. #E #\n"
              "#.... #\n"
              "#######");
}

TEST(MazeRenderer, DefaultMarkerIsMiddleDot) {
    ParsedMaze m = parse_maze("#S E#");
    auto path = BFSMazeSolver(m.grid, m.start, m.end);
    EXPECT_EQ(render_solution(m.grid, path), "#S\xC2\xB7" "E#");
}

TEST(MazeRenderer, DoesNotModifyGrid) {
    ParsedMaze m = parse_maze(kSampleMaze);
    Grid before = m.grid;
    auto path = BFSMazeSolver(m.grid, m.start, m.end);
    render_solution(m.grid, path, "*");
    EXPECT_EQ(m.grid, before);
    EXPECT_EQ(grid_to_string(m.grid), kSampleMaze);
}

TEST(MazeRenderer, UnmarkedRenderParsesBackToSameGrid) {
    ParsedMaze m = parse_maze(kSampleMaze);
    ParsedMaze again = parse_maze(render_solution(m.grid, {}));
    EXPECT_EQ(again.grid, m.grid);
    EXPECT_EQ(again.start, m.start);
    EXPECT_EQ(again.end, m.end);
}

TEST(MazeRenderer, MarkedRenderDiffersOnlyOnPathCells) {
    ParsedMaze m = parse_maze(kSampleMaze);
    auto path = BFSMazeSolver(m.grid, m.start, m.end);
    // a single-character marker keeps the row layout
    std::string rendered = render_solution(m.grid, path, "+");
    std::string original = grid_to_string(m.grid);
    ASSERT_EQ(rendered.size(), original.size());
    int changed = 0;
    for (size_t i = 0; i < rendered.size(); ++i) {
        if (rendered[i] != original[i]) {
            EXPECT_EQ(rendered[i], '+');
            EXPECT_EQ(original[i], FREE_SYMBOL);
            ++changed;
        }
    }
    EXPECT_EQ(changed, static_cast<int>(path.size()) - 2);
}

TEST(MazeRenderer, PathOutsideGridThrows) {
    ParsedMaze m = parse_maze("#SE#");
    std::vector<Coordinate> bogus = {{0, 1}, {1, 1}};
    EXPECT_THROW(render_solution(m.grid, bogus), std::out_of_range);
}

TEST(MazeRenderer, NoPathDiagnostic) {
    std::string out = render_no_path("#S#E#", 1.25);
    EXPECT_EQ(out, "No path found in maze.\n(Processing time: 1.2500 ms)\n\n#S#E#");
}

TEST(MazeRenderer, ParseErrorDiagnostic) {
    MazeParseError e = MazeParseError::malformed_grid(1, 1, 2);
    std::string out = render_parse_error(e, 0.5, "#\n##");
    EXPECT_NE(out.find("MalformedGrid"), std::string::npos);
    EXPECT_NE(out.find(e.what()), std::string::npos);
    EXPECT_NE(out.find("Elapsed time until error: 0.5000 ms"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "#\n##");
}

TEST(MazeRenderer, FormatElapsed) {
    EXPECT_EQ(format_elapsed_ms(0.0), "0.0000");
    EXPECT_EQ(format_elapsed_ms(12.34567), "12.3457");
}
