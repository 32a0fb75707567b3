// Google Test for the next-node decision of a single ant
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <optional>

#include "variants/sequential.hpp"

static Problem flat_problem(size_t size) {
	return Problem(std::vector<std::vector<double>>(size, std::vector<double>(size, 0.0)));
}

// One ant in the middle of a 3-node row: it can only go left (0) or right (2)
static AntParams row_params() {
	AntParams params;
	params.grid_width = 3;
	params.start_node = 1;
	params.goal_node = 2;
	params.ant_factor = 0.34;
	params.random_jump = 0.0;
	params.alpha = 1.0;
	params.beta = 0.0;
	params.variant_args = "exact";
	params.random_seed = 7;
	return params;
}

TEST(DecisionRule, NoMoveWhenEveryNeighborIsVisited) {
	SequentialOptimizer colony(flat_problem(3), row_params());
	colony.prepare();
	colony.reset_ants();

	Ant& ant = colony.ants.at(0);
	ant.visited[0] = true;
	ant.visited[2] = true;
	EXPECT_FALSE(colony.select_next_node(ant));
}

TEST(DecisionRule, FollowsOverwhelmingTrail) {
	SequentialOptimizer colony(flat_problem(3), row_params());
	colony.prepare();
	colony.reset_ants();
	colony.trail.trails.edge(1, 0) = 1e12;
	colony.trail.trails.edge(1, 2) = 1e-12;

	Ant& ant = colony.ants.at(0);
	for (int i = 0; i < 1000; i++) {
		EXPECT_EQ(colony.select_next_node(ant), std::optional<size_t>(0));
	}
}

TEST(DecisionRule, ChoosesProportionallyToDesirability) {
	SequentialOptimizer colony(flat_problem(3), row_params());
	colony.prepare();
	colony.reset_ants();
	colony.trail.trails.edge(1, 0) = 3.0;
	colony.trail.trails.edge(1, 2) = 1.0;

	Ant& ant = colony.ants.at(0);
	const int draws = 4000;
	int left = 0;
	for (int i = 0; i < draws; i++) {
		auto next = colony.select_next_node(ant);
		ASSERT_TRUE(next);
		if (*next == 0) { left++; }
	}
	EXPECT_NEAR(static_cast<double>(left) / draws, 0.75, 0.05);
}

TEST(DecisionRule, ShorterEdgesArePreferred) {
	AntParams params = row_params();
	params.beta = 2.0;
	// Going left costs 10, going right costs 1 (before the load bias)
	Problem problem({{0, 0, 0}, {9, 0, 0}, {0, 0, 0}});
	SequentialOptimizer colony(problem, params);
	colony.prepare();
	colony.reset_ants();

	Ant& ant = colony.ants.at(0);
	int right = 0;
	for (int i = 0; i < 1000; i++) {
		if (colony.select_next_node(ant) == std::optional<size_t>(2)) { right++; }
	}
	// (1/1)^2 against (1/10)^2
	EXPECT_GT(right, 950);
}

TEST(DecisionRule, RandomJumpStaysOnFreeNeighbors) {
	AntParams params;
	params.random_jump = 1.0;
	params.start_node = 55;
	params.goal_node = 0;
	params.random_seed = 3;
	SequentialOptimizer colony(flat_problem(100), params);
	colony.prepare();
	colony.reset_ants();

	Ant& ant = colony.ants.at(0);
	ant.visited[54] = true;

	std::map<size_t, int> seen;
	for (int i = 0; i < 600; i++) {
		auto next = colony.select_next_node(ant);
		ASSERT_TRUE(next);
		seen[*next]++;
	}
	EXPECT_EQ(seen.size(), 3u);
	EXPECT_EQ(seen.count(54), 0u);
	EXPECT_GT(seen[45], 0);
	EXPECT_GT(seen[56], 0);
	EXPECT_GT(seen[65], 0);
}

TEST(DecisionRule, ZeroDesirabilityMeansNoMove) {
	SequentialOptimizer colony(flat_problem(3), row_params());
	colony.prepare();
	colony.reset_ants();
	colony.trail.trails.edge(1, 0) = 0.0;
	colony.trail.trails.edge(1, 2) = 0.0;

	EXPECT_FALSE(colony.select_next_node(colony.ants.at(0)));
}

TEST(DecisionRule, UnboundedDesirabilityFallsBackToDirectionOrder) {
	SequentialOptimizer colony(flat_problem(3), row_params());
	colony.prepare();
	colony.reset_ants();
	colony.trail.trails.edge(1, 2) = std::numeric_limits<double>::infinity();

	// Left comes first in scan order
	EXPECT_EQ(colony.select_next_node(colony.ants.at(0)), std::optional<size_t>(0));
}

TEST(DecisionRule, FastPowerGivesSameRanking) {
	AntParams params = row_params();
	params.variant_args = "fast";
	SequentialOptimizer colony(flat_problem(3), params);
	colony.prepare();
	colony.reset_ants();
	colony.trail.trails.edge(1, 0) = 1e9;
	colony.trail.trails.edge(1, 2) = 1e-9;

	EXPECT_STREQ(colony.power->name(), "fast");
	EXPECT_EQ(colony.select_next_node(colony.ants.at(0)), std::optional<size_t>(0));
}
