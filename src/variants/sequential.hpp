#pragma once

#include <array>
#include <cmath>
#include <memory>
#include <optional>
#include <random>

#include "../grid.hpp"
#include "../optimizer.hpp"
#include "../power.hpp"
#include "../profiler.hpp"

/*
Reference colony: all ants advance in lock-step on the CPU, one node per step.
A dead ant resets the trail along its route immediately, so ants moving later
in the same iteration already see the reset.
*/
class SequentialOptimizer: public AntOptimizer {
public:
	static constexpr const char* static_name = "sequential";
	static constexpr const char* static_params = "[fast|exact]";

	Grid grid;
	Graph<double> visibility;
	std::vector<Ant> ants;

	std::unique_ptr<PowerFunction> power;
	std::minstd_rand0 random_generator;

	SequentialOptimizer(const Problem& problem, AntParams params)
	:	AntOptimizer::AntOptimizer(problem, params),
		grid(problem.size(), params.grid_width, params.grid_height),
		visibility(problem.size()),
		power(make_power_function(params.variant_args)) {}

	void prepare() override {
		trail.reset();
		best_route_nodes.clear();
		best_length = std::numeric_limits<double>::infinity();
		iteration = 0;

		// Precompute (1 / weight)^(beta) because neither can change during the optimization
		auto it1 = problem.weights.adjacency_matrix.data.begin();
		auto it1end = problem.weights.adjacency_matrix.data.end();
		auto it2 = visibility.adjacency_matrix.data.begin();
		for (; it1 != it1end; it1++, it2++) {
			*it2 = (*power)(1.0 / *it1, params.beta);
		}

		ants.assign(params.ant_count(problem.size()), Ant());
		random_generator.seed(params.random_seed);
		for (Ant& ant : ants) {
			ant.random_generator.seed(random_generator());
		}
	}

	void optimize(unsigned int rounds) override {
		while (rounds-- > 0) {
			Profiler::start("opts");

			reset_ants();

			Profiler::start("adva");
			move_ants();
			Profiler::stop("adva");

			Profiler::start("upda");
			update_trails(ants);
			Profiler::stop("upda");

			Profiler::start("eval");
			update_best(ants);
			Profiler::stop("eval");

			iteration++;
			Profiler::stop("opts");
		}
	}

	void reset_ants() {
		for (Ant& ant : ants) {
			ant.reset(problem.size(), params.start_node, params.goal_node);
		}
	}

	// At most n - 1 steps; stops as soon as no ant is left moving
	void move_ants() {
		for (size_t i = 0; i + 1 < problem.size(); i++) {
			if (step() == 0) { break; }
		}
	}

	// Advances every active ant by one node and returns how many are still active
	size_t step() {
		size_t active = 0;
		for (size_t k = 0; k < ants.size(); k++) {
			Ant& ant = ants[k];
			if (!ant.active()) { continue; }

			std::optional<size_t> next = select_next_node(ant);
			if (!next) {
				kill_ant(k);
				continue;
			}

			ant.visit(*next);
			if (*next == params.goal_node) {
				ant.complete = true;
				continue;
			}
			active++;
		}
		return active;
	}

	double edge_value(size_t from, size_t to) const {
		return (*power)(trail.at(from, to), params.alpha) * visibility.edge(from, to);
	}

	std::optional<size_t> select_next_node(Ant& ant) const {
		size_t current = ant.current_node();

		std::array<size_t, 4> free_nodes;
		size_t free_count = 0;
		for (Direction direction : all_directions) {
			auto next = grid.neighbor(current, direction);
			if (next && !ant.is_visited(*next)) {
				free_nodes[free_count++] = *next;
			}
		}
		if (free_count == 0) { return std::nullopt; }

		if (ant.uniform() < params.random_jump) {
			return free_nodes[ant.pick(free_count)];
		}

		std::array<double, 4> values;
		double sum = 0.0;
		for (size_t i = 0; i < free_count; i++) {
			values[i] = edge_value(current, free_nodes[i]);
			sum += values[i];
		}
		if (!(sum > 0.0)) { return std::nullopt; }

		if (std::isfinite(sum)) {
			double r = ant.uniform();
			double cumulative = 0.0;
			for (size_t i = 0; i < free_count; i++) {
				cumulative += values[i] / sum;
				if (cumulative >= r) {
					return free_nodes[i];
				}
			}
		}

		// Rounding left r uncovered
		return free_nodes[0];
	}

private:
	void kill_ant(size_t index) {
		Ant& ant = ants[index];
		ant.dead = true;
		trail.reset_route(ant.route.begin(), ant.route.end());
		ant.complete = true;
		if (params.verbose) {
			std::cout << "[Colony] ant " << index << " died at node " << ant.current_node() << "\n";
		}
	}
};
