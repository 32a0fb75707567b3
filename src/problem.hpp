#pragma once

#include <cmath>
#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "graph.hpp"

/*
Weighted grid graph read from a text matrix: one row per line, columns
separated by whitespace. Optional "NAME:" and "COMMENT:" lines may precede
the matrix. Every weight is incremented by 1 on load so that no edge is free.
*/
struct Problem {
private:
	bool try_read_key(std::string key, std::string input, std::string& output) {
		if (input.find(key) != 0) { return false; }
		if (output.empty()) {
			auto pos = input.find_first_not_of(": \t", key.size());
			output = pos == std::string::npos ? "" : input.substr(pos);
		}
		return true;
	}

	static std::runtime_error input_error(size_t line_no, const std::string& message) {
		return std::runtime_error("line " + std::to_string(line_no) + ": " + message);
	}

	void assign(const std::vector<std::vector<double>>& rows) {
		if (rows.empty()) {
			throw std::runtime_error("weight matrix is empty");
		}
		weights = Graph<double>(rows.size());
		for (size_t row = 0; row < rows.size(); row++) {
			if (rows[row].size() != rows.size()) {
				throw std::runtime_error(
					"weight matrix is not square: row " + std::to_string(row)
					+ " has " + std::to_string(rows[row].size())
					+ " columns, expected " + std::to_string(rows.size()));
			}
			for (size_t column = 0; column < rows.size(); column++) {
				double w = rows[row][column];
				if (!std::isfinite(w) || w < 0.0) {
					throw std::runtime_error(
						"invalid weight " + std::to_string(w) + " at ("
						+ std::to_string(row) + ", " + std::to_string(column) + ")");
				}
				weights.edge(row, column) = w + edge_bias;
			}
		}
	}

	void read(std::istream& input) {
		std::vector<std::vector<double>> rows;
		size_t line_no = 0;
		for (std::string line; std::getline(input, line);) {
			line_no++;
			if (try_read_key("NAME", line, name)) { continue; }
			if (try_read_key("COMMENT", line, comment)) { continue; }
			if (line.find_first_not_of(" \t\r") == std::string::npos) { continue; }

			std::vector<double> row;
			std::istringstream columns(line);
			for (std::string token; columns >> token;) {
				size_t used = 0;
				double value;
				try {
					value = std::stod(token, &used);
				}
				catch (const std::logic_error&) {
					throw input_error(line_no, "not a number: \"" + token + "\"");
				}
				if (used != token.size()) {
					throw input_error(line_no, "not a number: \"" + token + "\"");
				}
				if (!std::isfinite(value) || value < 0.0) {
					throw input_error(line_no, "weights must be finite and non-negative: \"" + token + "\"");
				}
				row.push_back(value);
			}

			if (!rows.empty() && row.size() != rows.front().size()) {
				throw input_error(line_no,
					"expected " + std::to_string(rows.front().size())
					+ " columns, found " + std::to_string(row.size()));
			}
			rows.push_back(std::move(row));
		}
		assign(rows);
	}

public:
	static constexpr double edge_bias = 1.0;

	std::string name;
	std::string comment;

	Graph<double> weights;

	Problem(std::filesystem::path path)
	: name(""), comment("") {
		std::ifstream file(path);
		if (!file) {
			throw std::runtime_error("cannot open weight matrix \"" + path.string() + "\"");
		}
		read(file);
		if (name.empty()) {
			name = path.stem().string();
		}
	}

	Problem(std::istream& input, std::string name = "")
	: name(name), comment("") {
		read(input);
	}

	Problem(const std::vector<std::vector<double>>& rows, std::string name = "")
	: name(name), comment("") {
		assign(rows);
	}

	size_t size() const {
		return weights.size();
	}

	size_t sizeSqr() const {
		return size() * size();
	}
};
