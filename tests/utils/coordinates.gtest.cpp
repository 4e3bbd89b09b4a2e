#include "utils/coordinates.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

//! Write `content` to a fresh file in the temp directory and return its path.
std::filesystem::path writeCoordinates(const std::string &name, const std::string &content) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << content;
    return path;
}

std::optional<Region> parse(const std::string &content) {
    std::istringstream input(content);
    return coordinates::toRegion(coordinates::parseFile(input));
}

} // namespace

TEST(Coordinates, ValidFileGivesRegion) {
    auto path = writeCoordinates("autoclicker_coords_valid.txt",
                                 "start_x=100\nend_x=500\nstart_y=200\nend_y=800\n");

    std::optional<Region> region = coordinates::load(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->x, 100);
    EXPECT_EQ(region->y, 200);
    EXPECT_EQ(region->width, 400);
    EXPECT_EQ(region->height, 600);
}

TEST(Coordinates, CommentsQuotesAndSpacesTolerated) {
    std::optional<Region> region = parse(
        "# watched window\n"
        "\n"
        "start_x = 10\n"
        "end_x=\"60\"\n"
        "  start_y='5'  \n"
        "end_y=25\r\n");

    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->x, 10);
    EXPECT_EQ(region->y, 5);
    EXPECT_EQ(region->width, 50);
    EXPECT_EQ(region->height, 20);
}

TEST(Coordinates, MissingFileGivesNothing) {
    EXPECT_FALSE(coordinates::load("/nonexistent/autoclicker/window_coordinates.txt").has_value());
}

TEST(Coordinates, NonNumericValueGivesNothing) {
    EXPECT_FALSE(parse("start_x=10\nend_x=abc\nstart_y=0\nend_y=10\n").has_value());
    EXPECT_FALSE(parse("start_x=-10\nend_x=20\nstart_y=0\nend_y=10\n").has_value());
    EXPECT_FALSE(parse("start_x=\nend_x=20\nstart_y=0\nend_y=10\n").has_value());
}

TEST(Coordinates, MissingKeyGivesNothing) {
    EXPECT_FALSE(parse("start_x=10\nend_x=20\nstart_y=0\n").has_value());
}

TEST(Coordinates, EmptyAreaGivesNothing) {
    EXPECT_FALSE(parse("start_x=10\nend_x=10\nstart_y=0\nend_y=10\n").has_value());
    EXPECT_FALSE(parse("start_x=10\nend_x=20\nstart_y=30\nend_y=10\n").has_value());
}

TEST(Coordinates, HelpersBehave) {
    EXPECT_TRUE(coordinates::isNumber("0123"));
    EXPECT_FALSE(coordinates::isNumber(""));
    EXPECT_FALSE(coordinates::isNumber("1.5"));
    EXPECT_FALSE(coordinates::isNumber("+1"));

    EXPECT_EQ(coordinates::cleanValue("  \"abc\"  "), "abc");
    EXPECT_EQ(coordinates::cleanValue("'x\""), "'x\"");
}
