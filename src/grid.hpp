#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class Direction { left, up, right, down };

// Order in which neighbours are scanned by the ants
constexpr std::array<Direction, 4> all_directions = {
	Direction::left, Direction::up, Direction::right, Direction::down
};

/*
Rectangular 4-connected grid over the linear node indices [0, node_count).
Node i sits at row i / width, column i % width. If node_count does not fill
the last row, the missing cells simply have no neighbours.
*/
struct Grid {
	size_t node_count;
	size_t width;
	size_t height;

	Grid(size_t node_count, size_t width, size_t height = 0)
	: node_count(node_count), width(width), height(height) {
		if (width == 0) {
			throw std::invalid_argument("Grid width must be positive");
		}
		if (this->height == 0) {
			this->height = node_count / width + (node_count % width != 0 ? 1 : 0);
		}
		if (this->height * width < node_count) {
			throw std::invalid_argument(
				"Grid " + std::to_string(width) + "x" + std::to_string(this->height)
				+ " cannot hold " + std::to_string(node_count) + " nodes");
		}
	}

	size_t cell_count() const {
		return width * height;
	}

	std::optional<size_t> neighbor(size_t node, Direction direction) const {
		if (node >= node_count) {
			throw std::out_of_range("node index out of bounds (" + std::to_string(node) + " >= " + std::to_string(node_count) + ")");
		}

		size_t result = 0;
		switch (direction) {
			case Direction::left:
				if (node % width == 0) { return std::nullopt; }
				result = node - 1;
				break;
			case Direction::up:
				if (node < width) { return std::nullopt; }
				result = node - width;
				break;
			case Direction::right:
				if ((node + 1) % width == 0) { return std::nullopt; }
				result = node + 1;
				break;
			case Direction::down:
				if (node + width >= cell_count()) { return std::nullopt; }
				result = node + width;
				break;
		}

		if (result >= node_count) { return std::nullopt; }
		return result;
	}

	std::vector<size_t> neighbors(size_t node) const {
		std::vector<size_t> result;
		for (Direction direction : all_directions) {
			if (auto next = neighbor(node, direction)) {
				result.push_back(*next);
			}
		}
		return result;
	}
};
