#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

struct AntParams {
	// Trail value every edge starts with, and the value a dead ant's route is reset to
	double initial_trail = 1.0;
	double alpha = 1.0;
	double beta = 5.0;
	// Fraction of the trail kept each iteration
	double evaporation = 0.5;
	double q = 500.0;
	// ants = ant_factor * node count
	double ant_factor = 0.8;
	// Probability of a uniformly random move to a free neighbour
	double random_jump = 0.3;

	size_t grid_width = 10;
	size_t grid_height = 0;

	// Iterations of the colony
	size_t rounds = 80000;

	size_t start_node = 0;
	size_t goal_node = 1;

	uint32_t random_seed = 0;
	bool verbose = false;

	std::string variant_args;

	// Upper bound on the population; every ant owns a route and a visited set of node_count entries
	static constexpr size_t max_ants = size_t(1) << 20;

	size_t ant_count(size_t node_count) const {
		double wanted = node_count * ant_factor;
		if (!(wanted < static_cast<double>(max_ants))) { return max_ants; }
		size_t count = static_cast<size_t>(wanted);
		return count == 0 ? 1 : count;
	}

	void validate(size_t node_count) const {
		if (node_count == 0) {
			throw std::invalid_argument("Problem has no nodes");
		}
		if (start_node >= node_count) {
			throw std::invalid_argument("Start node " + std::to_string(start_node) + " is not in [0, " + std::to_string(node_count) + ")");
		}
		if (goal_node >= node_count) {
			throw std::invalid_argument("Goal node " + std::to_string(goal_node) + " is not in [0, " + std::to_string(node_count) + ")");
		}
		if (!(evaporation >= 0.0 && evaporation <= 1.0)) {
			throw std::invalid_argument("Evaporation must be in [0, 1]");
		}
		if (!(random_jump >= 0.0 && random_jump <= 1.0)) {
			throw std::invalid_argument("Random jump probability must be in [0, 1]");
		}
		if (!(q > 0.0) || !std::isfinite(q)) {
			throw std::invalid_argument("Deposit scale q must be positive");
		}
		if (!(initial_trail > 0.0) || !std::isfinite(initial_trail)) {
			throw std::invalid_argument("Initial trail must be positive");
		}
		if (!(ant_factor > 0.0) || !std::isfinite(ant_factor)) {
			throw std::invalid_argument("Ant factor must be positive, got " + std::to_string(ant_factor));
		}
		if (node_count * ant_factor > static_cast<double>(max_ants)) {
			throw std::invalid_argument(
				"Ant factor " + std::to_string(ant_factor) + " asks for more than "
				+ std::to_string(max_ants) + " ants on " + std::to_string(node_count) + " nodes");
		}
		if (rounds == 0 || rounds > std::numeric_limits<unsigned int>::max()) {
			throw std::invalid_argument(
				"Round count must be in [1, " + std::to_string(std::numeric_limits<unsigned int>::max())
				+ "], got " + std::to_string(rounds));
		}
		if (!std::isfinite(alpha) || !std::isfinite(beta)) {
			throw std::invalid_argument("Alpha and beta must be finite");
		}
		if (grid_width == 0) {
			throw std::invalid_argument("Grid width must be positive");
		}
		if (grid_height != 0 && grid_width * grid_height < node_count) {
			throw std::invalid_argument(
				"Grid " + std::to_string(grid_width) + "x" + std::to_string(grid_height)
				+ " cannot hold " + std::to_string(node_count) + " nodes");
		}
	}
};
