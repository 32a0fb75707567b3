// Google Test for Matrix and Graph
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "graph.hpp"

TEST(Matrix, StartsWithDefaultValue) {
	Matrix<double> m(3, 2.5);
	EXPECT_EQ(m.size(), 3u);
	EXPECT_EQ(m.data.size(), 9u);
	EXPECT_DOUBLE_EQ(m.at(2, 1), 2.5);
}

TEST(Matrix, RowMajorLayout) {
	Matrix<int> m(3);
	m.at(1, 2) = 7;
	EXPECT_EQ(m.data[1 * 3 + 2], 7);
	EXPECT_EQ(m.linear_index(2, 0), 6u);
}

TEST(Matrix, OutOfBoundsThrows) {
	Matrix<int> m(2);
	EXPECT_THROW(m.at(2, 0), std::out_of_range);
	EXPECT_THROW(m.at(0, 2), std::out_of_range);
}

TEST(Matrix, Fill) {
	Matrix<double> m(2, 1.0);
	m.fill(4.0);
	for (double v : m.data) {
		EXPECT_DOUBLE_EQ(v, 4.0);
	}
}

TEST(Graph, RouteLengthSumsConsecutiveEdges) {
	Graph<double> g(3, 0.0);
	g.edge(0, 1) = 2.0;
	g.edge(1, 2) = 3.5;
	g.edge(2, 0) = 100.0;

	std::vector<size_t> route = {0, 1, 2};
	EXPECT_DOUBLE_EQ(g.route_length(route.begin(), route.end()), 5.5);
}

TEST(Graph, RouteLengthOfShortRoutesIsZero) {
	Graph<double> g(2, 9.0);
	std::vector<size_t> empty;
	std::vector<size_t> single = {1};
	EXPECT_DOUBLE_EQ(g.route_length(empty.begin(), empty.end()), 0.0);
	EXPECT_DOUBLE_EQ(g.route_length(single.begin(), single.end()), 0.0);
}
