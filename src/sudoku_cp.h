#ifndef SUDOKU_CP_H
#define SUDOKU_CP_H

#include "sudoku_common.h"
#include "sudoku_topology.h"

// Candidate sets for all 81 cells. Copying the struct is the only rollback
// mechanism the search needs.
struct Board {
    unsigned short cand[NUM_CELLS];
};

inline Board make_board() {
    Board b;
    for (int i = 0; i < NUM_CELLS; i++) b.cand[i] = ALL_DIGITS;
    return b;
}

inline bool is_solved(const Board& b) {
    for (int i = 0; i < NUM_CELLS; i++) {
        if (!is_single(b.cand[i])) return false;
    }
    return true;
}

inline void board_to_grid(const Board& b, int grid[N][N]) {
    for (int i = 0; i < NUM_CELLS; i++) {
        grid[i / N][i % N] = is_single(b.cand[i]) ? mask_to_digit(b.cand[i]) : 0;
    }
}

inline bool assign_value(Board& b, int cell, int digit, SolveStats& stats);

// Drop digit from cell and cascade the consequences:
//  1. a cell left with one candidate removes it from its peers
//  2. a unit with one place left for digit assigns it there
inline bool remove_value(Board& b, int cell, int digit, SolveStats& stats) {
    const Topology& topo = topology();
    unsigned short bit = digit_bit(digit);

    if (!(b.cand[cell] & bit)) return true;
    b.cand[cell] &= (unsigned short)~bit;

    unsigned short left = b.cand[cell];
    if (left == 0) {
        stats.contradictions++;
        return false;
    }

    if (is_single(left)) {
        int last = mask_to_digit(left);
        for (int p = 0; p < NUM_PEERS; p++) {
            if (!remove_value(b, topo.peers[cell][p], last, stats)) return false;
        }
    }

    for (int u = 0; u < 3; u++) {
        const int* unit = topo.units[cell][u];
        int places = 0;
        int place = -1;
        for (int k = 0; k < N; k++) {
            if (b.cand[unit[k]] & bit) {
                places++;
                place = unit[k];
            }
        }
        if (places == 0) {
            stats.contradictions++;
            return false;
        }
        if (places == 1 && !is_single(b.cand[place])) {
            if (!assign_value(b, place, digit, stats)) return false;
        }
    }
    return true;
}

// Commit digit to cell by eliminating every other candidate.
inline bool assign_value(Board& b, int cell, int digit, SolveStats& stats) {
    stats.assignments++;
    unsigned short others = b.cand[cell] & (unsigned short)~digit_bit(digit);
    for (int d = 1; d <= N; d++) {
        if (others & digit_bit(d)) {
            if (!remove_value(b, cell, d, stats)) return false;
        }
    }
    return true;
}

// Assign every clue of the puzzle. Fails when two clues contradict.
inline bool propagate_constraints(const int puzzle[N][N], Board& b, SolveStats& stats) {
    for (int i = 0; i < N; i++) {
        for (int j = 0; j < N; j++) {
            int val = puzzle[i][j];
            if (val < 1 || val > N) continue;
            if (!assign_value(b, i * N + j, val, stats)) return false;
        }
    }
    return true;
}

#endif
