#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "graph.hpp"

struct Ant {
	// Park-Miller "minimal standard" generator, same stream as the OpenCL kernels
	struct minstd0_engine {
		uint32_t state = 1;

		uint32_t operator()() {
			const uint64_t a = 16807;
			const uint64_t m = 2147483647;

			state = static_cast<uint32_t>((a * state) % m);

			return state;
		}

		void seed(uint32_t seed) {
			state = seed % 2147483647u;
			if (state == 0) { state = 1; }
		}

		static constexpr uint32_t max() { return 2147483646u; }
	};

	// route[k] is the node reached at step k, route[0] the start node
	std::vector<size_t> route;
	std::vector<bool> visited;
	bool dead = false;
	bool complete = false;

	minstd0_engine random_generator;

	// Clears the previous route and places the ant on the start node
	void reset(size_t node_count, size_t start, size_t goal) {
		route.clear();
		route.reserve(node_count);
		visited.assign(node_count, false);
		dead = false;
		complete = false;
		visit(start);
		if (start == goal) {
			complete = true;
		}
	}

	void visit(size_t node) {
		route.push_back(node);
		visited.at(node) = true;
	}

	bool is_visited(size_t node) const {
		return visited.at(node);
	}

	bool active() const {
		return !dead && !complete;
	}

	size_t current_node() const {
		return route.back();
	}

	std::optional<size_t> node_at(size_t step) const {
		if (step >= route.size()) { return std::nullopt; }
		return route[step];
	}

	// Uniform in [0, 1)
	double uniform() {
		return static_cast<double>(random_generator() - 1) / minstd0_engine::max();
	}

	// Uniform in [0, count)
	size_t pick(size_t count) {
		return static_cast<size_t>(random_generator() - 1) % count;
	}

	// 1 + sum of the (biased) weights along the route
	double route_length(const Graph<double>& weights) const {
		return 1.0 + weights.route_length(route.begin(), route.end());
	}
};
