#ifndef SUDOKU_IO_H
#define SUDOKU_IO_H

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "sudoku_common.h"
#include "sudoku_topology.h"

struct Puzzle {
    int grid[N][N];
};

// '1'..'9' are clues, '0' and '.' blanks, -1 for anything else.
inline int cell_value(char ch) {
    if (ch >= '1' && ch <= '9') return ch - '0';
    if (ch == '0' || ch == '.') return 0;
    return -1;
}

// Reads 81 cells from text, skipping separators. False unless exactly 81.
inline bool parse_grid(const std::string& text, int grid[N][N]) {
    int count = 0;
    for (char ch : text) {
        int v = cell_value(ch);
        if (v < 0) continue;
        if (count == NUM_CELLS) return false;
        grid[count / N][count % N] = v;
        count++;
    }
    return count == NUM_CELLS;
}

// Accepts "Grid NN" blocks of nine rows, one 81-character line per puzzle,
// or whitespace separated integers. Lines starting with "Grid" are headers.
// Returns false when the input ends in the middle of a puzzle.
inline bool read_puzzles(std::istream& in, std::vector<Puzzle>& puzzles) {
    Puzzle current;
    int count = 0;
    std::string line;

    while (std::getline(in, line)) {
        if (line.compare(0, 4, "Grid") == 0) continue;
        for (char ch : line) {
            int v = cell_value(ch);
            if (v < 0) continue;
            current.grid[count / N][count % N] = v;
            if (++count == NUM_CELLS) {
                puzzles.push_back(current);
                count = 0;
            }
        }
    }
    return count == 0;
}

inline std::string format_grid(const int grid[N][N]) {
    std::string s;
    for (int i = 0; i < N; i++) {
        for (int j = 0; j < N; j++) {
            int v = grid[i][j];
            s += (char)('0' + ((v >= 1 && v <= N) ? v : 0));
        }
    }
    return s;
}

inline void write_grid_header(std::ostream& out, int index) {
    out << "Grid " << std::setw(2) << std::setfill('0') << index << std::setfill(' ') << "\n";
}

inline void write_solution(std::ostream& out, int index, const int grid[N][N]) {
    write_grid_header(out, index);
    std::string s = format_grid(grid);
    for (int i = 0; i < N; i++) {
        out << s.substr(i * N, N) << "\n";
    }
    out << "\n";
}

inline void write_failure(std::ostream& out, int index) {
    write_grid_header(out, index);
    out << "No solution found.\n\n";
}

// Boxed grid with A-I row and 1-9 column labels, blanks as dots.
inline void print_grid(std::ostream& out, const int grid[N][N]) {
    const std::string div = "  +-------+-------+-------+";
    out << "  ";
    for (int j = 0; j < N; j++) {
        if (j % SQRT_N == 0) out << "  ";
        out << cell_name(j)[1] << " ";
    }
    out << "\n";
    for (int i = 0; i < N; i++) {
        if (i % SQRT_N == 0) out << div << "\n";
        out << cell_name(i * N)[0] << " ";
        for (int j = 0; j < N; j++) {
            if (j % SQRT_N == 0) out << "| ";
            int v = grid[i][j];
            if (v >= 1 && v <= N) out << v << " ";
            else out << ". ";
        }
        out << "|\n";
    }
    out << div << "\n";
}

#endif
