// Google Test for the trail matrix updates
#include <gtest/gtest.h>
#include <vector>

#include "trail.hpp"

TEST(TrailMatrix, StartsAtInitialValue) {
	TrailMatrix trail(4, 1.5);
	EXPECT_EQ(trail.size(), 4u);
	for (double v : trail.trails.adjacency_matrix.data) {
		EXPECT_DOUBLE_EQ(v, 1.5);
	}
}

TEST(TrailMatrix, EvaporationNeverIncreases) {
	TrailMatrix trail(3, 2.0);
	trail.trails.edge(0, 1) = 8.0;
	std::vector<double> before = trail.trails.adjacency_matrix.data;

	trail.evaporate(0.5);
	for (size_t i = 0; i < before.size(); i++) {
		EXPECT_LE(trail.trails.adjacency_matrix.data[i], before[i]);
		EXPECT_GE(trail.trails.adjacency_matrix.data[i], 0.0);
	}
	EXPECT_DOUBLE_EQ(trail.at(0, 1), 4.0);
}

TEST(TrailMatrix, UnusedEdgesDecayTowardZero) {
	TrailMatrix trail(2, 1.0);
	for (int i = 0; i < 200; i++) {
		trail.evaporate(0.9);
	}
	EXPECT_LT(trail.at(0, 1), 1e-8);
	EXPECT_GE(trail.at(0, 1), 0.0);
}

TEST(TrailMatrix, FullEvaporationKeepsEverything) {
	TrailMatrix trail(2, 3.0);
	trail.evaporate(1.0);
	EXPECT_DOUBLE_EQ(trail.at(1, 0), 3.0);
}

TEST(TrailMatrix, DepositFollowsTheRoute) {
	TrailMatrix trail(4, 1.0);
	std::vector<size_t> route = {0, 1, 3};
	trail.deposit(route.begin(), route.end(), 2.5);

	EXPECT_DOUBLE_EQ(trail.at(0, 1), 3.5);
	EXPECT_DOUBLE_EQ(trail.at(1, 3), 3.5);
	// Edges are directed
	EXPECT_DOUBLE_EQ(trail.at(1, 0), 1.0);
	EXPECT_DOUBLE_EQ(trail.at(0, 3), 1.0);
}

TEST(TrailMatrix, ResetRouteRestoresInitialValue) {
	TrailMatrix trail(4, 1.0);
	std::vector<size_t> route = {2, 0, 1};
	trail.deposit(route.begin(), route.end(), 10.0);
	trail.trails.edge(3, 2) = 7.0;

	trail.reset_route(route.begin(), route.end());
	EXPECT_DOUBLE_EQ(trail.at(2, 0), 1.0);
	EXPECT_DOUBLE_EQ(trail.at(0, 1), 1.0);
	EXPECT_DOUBLE_EQ(trail.at(3, 2), 7.0);
}

TEST(TrailMatrix, ResetOfSingleNodeRouteIsNoop) {
	TrailMatrix trail(2, 1.0);
	trail.trails.edge(0, 1) = 5.0;
	std::vector<size_t> route = {0};
	trail.reset_route(route.begin(), route.end());
	EXPECT_DOUBLE_EQ(trail.at(0, 1), 5.0);
}

TEST(TrailMatrix, ResetAll) {
	TrailMatrix trail(2, 1.0);
	trail.evaporate(0.25);
	trail.reset();
	EXPECT_DOUBLE_EQ(trail.at(0, 0), 1.0);
	EXPECT_DOUBLE_EQ(trail.at(1, 1), 1.0);
}
