// Google Test for Grid (construction, cell queries and neighbors)
#include <gtest/gtest.h>
#include <stdexcept>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "grid.hpp"

static Grid make_grid() {
    return Grid({
        "#####",
        "#S  #",
        "# # #",
        "#  E#",
        "#####",
    });
}

TEST(GridTest, ValidCreationAndDimensions) {
    Grid g = make_grid();
    EXPECT_EQ(g.get_rows(), 5);
    EXPECT_EQ(g.get_columns(), 5);
    EXPECT_EQ(g.get_symbol({1, 1}), 'S');
    EXPECT_EQ(g.get_cell({1, 1}), Cell::Start);
    EXPECT_EQ(g.get_cell({3, 3}), Cell::End);
    EXPECT_EQ(g.get_cell({0, 0}), Cell::Wall);
    EXPECT_EQ(g.get_cell({1, 2}), Cell::Free);
}

TEST(GridTest, RaggedRowsThrow) {
    EXPECT_THROW(Grid({"###", "##"}), std::invalid_argument);
}

TEST(GridTest, EmptyRowsThrow) {
    EXPECT_THROW(Grid(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(Grid({""}), std::invalid_argument);
}

TEST(GridTest, UnknownSymbolThrows) {
    EXPECT_THROW(Grid({"#x#"}), std::invalid_argument);
}

TEST(GridTest, OutOfBoundsSymbolThrows) {
    Grid g = make_grid();
    EXPECT_FALSE(g.in_bounds({-1, 0}));
    EXPECT_FALSE(g.in_bounds({0, 5}));
    EXPECT_THROW(g.get_symbol({5, 0}), std::out_of_range);
}

TEST(GridTest, StartAndEndAreTraversable) {
    Grid g = make_grid();
    EXPECT_TRUE(g.is_traversable({1, 1}));
    EXPECT_TRUE(g.is_traversable({3, 3}));
    EXPECT_TRUE(g.is_traversable({1, 2}));
    EXPECT_FALSE(g.is_traversable({2, 2}));
    EXPECT_FALSE(g.is_traversable({-1, 1}));
}

TEST(GridTest, NeighborsFollowUpDownLeftRight) {
    Grid g({
        "   ",
        "   ",
        "   ",
    });
    std::vector<Coordinate> expected = {{0, 1}, {2, 1}, {1, 0}, {1, 2}};
    EXPECT_EQ(g.get_neighbors({1, 1}), expected);
}

TEST(GridTest, NeighborsSkipWallsAndBorders) {
    Grid g = make_grid();
    // (1,1): up and left are walls, down (2,1) and right (1,2) are free
    std::vector<Coordinate> expected = {{2, 1}, {1, 2}};
    EXPECT_EQ(g.get_neighbors({1, 1}), expected);

    Grid open({"S E"});
    std::vector<Coordinate> corner = {{0, 1}};
    EXPECT_EQ(open.get_neighbors({0, 0}), corner);
}

TEST(GridTest, IndexRoundTrip) {
    Grid g = make_grid();
    EXPECT_EQ(g.index_of({2, 3}), 13u);
    EXPECT_EQ(g.coordinate_of(13), (Coordinate{2, 3}));
    EXPECT_EQ(g.get_cell_count(), 25u);
}

TEST(GridTest, IndicesAreUnsignedSizes) {
    // linear indices and cell counts do not go through int arithmetic
    static_assert(std::is_same<decltype(std::declval<Grid>().index_of(Coordinate{})), size_t>::value,
                  "index_of must return size_t");
    static_assert(std::is_same<decltype(std::declval<Grid>().get_cell_count()), size_t>::value,
                  "get_cell_count must return size_t");
    Grid wide({std::string(70000, FREE_SYMBOL), std::string(70000, FREE_SYMBOL)});
    EXPECT_EQ(wide.get_cell_count(), 140000u);
    EXPECT_EQ(wide.index_of({1, 69999}), 139999u);
    EXPECT_EQ(wide.coordinate_of(139999), (Coordinate{1, 69999}));
}

TEST(CoordinateTest, OrderingIsRowMajor) {
    EXPECT_TRUE((Coordinate{0, 4}) < (Coordinate{1, 0}));
    EXPECT_TRUE((Coordinate{1, 0}) < (Coordinate{1, 1}));
    EXPECT_FALSE((Coordinate{1, 1}) < (Coordinate{1, 1}));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
