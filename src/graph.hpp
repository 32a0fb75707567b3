#pragma once

#include <iterator>

#include "matrix.hpp"

template<typename T>
struct Graph {
public:
	Matrix<T> adjacency_matrix;

	Graph()
	: adjacency_matrix(0) {}

	Graph(size_t size, T initial_weight = T())
	: adjacency_matrix(size, initial_weight) {}

	typename Matrix<T>::reference edge(size_t from, size_t to) {
		return adjacency_matrix.at(from, to);
	}

	typename Matrix<T>::const_reference edge(size_t from, size_t to) const {
		return adjacency_matrix.at(from, to);
	}

	size_t size() const {
		return adjacency_matrix.dimension;
	}

	// Sum of the edges between consecutive nodes of [start, end)
	template<class ForwardIterator>
	T route_length(ForwardIterator start, ForwardIterator end) const {
		if (start == end) { return T(); }

		T acc = T();
		ForwardIterator prev = start;
		std::advance(start, 1);
		for (; start != end; prev = start, start++) {
			acc += edge(*prev, *start);
		}
		return acc;
	}
};
