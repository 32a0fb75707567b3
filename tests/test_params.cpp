// Google Test for run parameter validation
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

#include "params.hpp"

TEST(AntParams, DefaultsAreValid) {
	AntParams params;
	EXPECT_NO_THROW(params.validate(100));
	EXPECT_EQ(params.ant_count(100), 80u);
}

TEST(AntParams, SmallPopulationDefaultsToOneAnt) {
	AntParams params;
	params.ant_factor = 0.1;
	EXPECT_EQ(params.ant_count(4), 1u);
	EXPECT_NO_THROW(params.validate(4));
}

TEST(AntParams, RejectsEmptyPopulation) {
	AntParams params;
	params.ant_factor = 0.0;
	EXPECT_THROW(params.validate(100), std::invalid_argument);
	params.ant_factor = -1.0;
	EXPECT_THROW(params.validate(100), std::invalid_argument);
}

TEST(AntParams, RejectsNodesOutsideTheProblem) {
	AntParams params;
	params.start_node = 4;
	EXPECT_THROW(params.validate(4), std::invalid_argument);
	params.start_node = 0;
	params.goal_node = 7;
	EXPECT_THROW(params.validate(4), std::invalid_argument);
}

TEST(AntParams, RejectsProbabilitiesOutsideUnitInterval) {
	AntParams params;
	params.evaporation = 1.5;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
	params.evaporation = 0.5;
	params.random_jump = -0.1;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
}

TEST(AntParams, RejectsNonPositiveDeposit) {
	AntParams params;
	params.q = 0.0;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
}

TEST(AntParams, RejectsNonPositiveInitialTrail) {
	AntParams params;
	params.initial_trail = 0.0;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
}

TEST(AntParams, RejectsGridTooSmall) {
	AntParams params;
	params.grid_width = 0;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
	params.grid_width = 3;
	params.grid_height = 3;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
	params.grid_height = 4;
	EXPECT_NO_THROW(params.validate(10));
}

TEST(AntParams, RejectsEmptyProblem) {
	AntParams params;
	EXPECT_THROW(params.validate(0), std::invalid_argument);
}

TEST(AntParams, RejectsOversizedPopulation) {
	AntParams params;
	params.ant_factor = 1e30;
	EXPECT_THROW(params.validate(100), std::invalid_argument);
	EXPECT_EQ(params.ant_count(100), AntParams::max_ants);
	params.ant_factor = static_cast<double>(AntParams::max_ants) / 100.0;
	EXPECT_NO_THROW(params.validate(100));
}

TEST(AntParams, RoundCountMustFitTheLoop) {
	AntParams params;
	params.rounds = 0;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
	params.rounds = static_cast<size_t>(std::numeric_limits<unsigned int>::max()) + 1;
	EXPECT_THROW(params.validate(10), std::invalid_argument);
	params.rounds = std::numeric_limits<unsigned int>::max();
	EXPECT_NO_THROW(params.validate(10));
	params.rounds = 1;
	EXPECT_NO_THROW(params.validate(10));
}
