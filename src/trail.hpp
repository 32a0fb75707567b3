#pragma once

#include "graph.hpp"

/*
Pheromone on every directed edge. Ants only read it while they move; it is
written between step phases by the colony (evaporate, deposit) and, in the
sequential colony, when an ant dies (reset_route).
*/
struct TrailMatrix {
	Graph<double> trails;
	double initial_value;

	TrailMatrix(size_t size, double initial_value)
	: trails(size, initial_value), initial_value(initial_value) {}

	double at(size_t from, size_t to) const {
		return trails.edge(from, to);
	}

	size_t size() const {
		return trails.size();
	}

	void reset() {
		trails.adjacency_matrix.fill(initial_value);
	}

	void evaporate(double factor) {
		for (auto& value : trails.adjacency_matrix.data) {
			value *= factor;
		}
	}

	// Sets every edge along the route back to the initial value
	template<class ForwardIterator>
	void reset_route(ForwardIterator start, ForwardIterator end) {
		for_each_edge(start, end, [this](size_t from, size_t to) {
			trails.edge(from, to) = initial_value;
		});
	}

	template<class ForwardIterator>
	void deposit(ForwardIterator start, ForwardIterator end, double amount) {
		for_each_edge(start, end, [this, amount](size_t from, size_t to) {
			trails.edge(from, to) += amount;
		});
	}

private:
	template<class ForwardIterator, class Fn>
	static void for_each_edge(ForwardIterator start, ForwardIterator end, Fn fn) {
		if (start == end) { return; }
		ForwardIterator prev = start;
		for (std::advance(start, 1); start != end; prev = start, start++) {
			fn(*prev, *start);
		}
	}
};
