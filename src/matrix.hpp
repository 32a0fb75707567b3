#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include <stdexcept>

template<typename T>
struct Matrix {
public:
	using reference = typename std::vector<T>::reference;
	using const_reference = typename std::vector<T>::const_reference;

	size_t dimension;
	std::vector<T> data;

	size_t linear_index(size_t row, size_t column) const {
		if (row >= dimension) {
			throw std::out_of_range("row index out of bounds (" + std::to_string(row) + " >= " + std::to_string(dimension) + ")");
		}
		if (column >= dimension) {
			throw std::out_of_range("column index out of bounds (" + std::to_string(column) + " >= " + std::to_string(dimension) + ")");
		}

		return row * dimension + column;
	}

	Matrix(size_t dimension, T default_value = T())
	: dimension(dimension) {
		data.resize(dimension * dimension, default_value);
	}

	reference at(size_t row, size_t column) {
		return data.at(linear_index(row, column));
	}

	const_reference at(size_t row, size_t column) const {
		return data.at(linear_index(row, column));
	}

	void fill(const T& value) {
		std::fill(data.begin(), data.end(), value);
	}

	size_t size() const {
		return dimension;
	}
};
