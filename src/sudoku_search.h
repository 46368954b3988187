#ifndef SUDOKU_SEARCH_H
#define SUDOKU_SEARCH_H

#include "sudoku_cp.h"

// Unsolved cell with the fewest candidates, first in index order on ties.
// -1 when every cell is solved.
inline int select_mrv_cell(const Board& b) {
    int best = -1;
    int min_candidates = N + 1;
    for (int i = 0; i < NUM_CELLS; i++) {
        int count = bit_count(b.cand[i]);
        if (count > 1 && count < min_candidates) {
            min_candidates = count;
            best = i;
        }
    }
    return best;
}

// Depth-first search over a board that propagation has left consistent.
// Each guess works on its own copy, so a dead branch is simply dropped.
// A backtrack is counted once per candidate that fails.
inline bool depth_first_search(const Board& b, SolveStats& stats, Board& solution) {
    int cell = select_mrv_cell(b);
    if (cell == -1) {
        solution = b;
        return true;
    }

    for (int val = 1; val <= N; val++) {
        if (!(b.cand[cell] & digit_bit(val))) continue;

        Board trial = b;
        if (assign_value(trial, cell, val, stats) &&
            depth_first_search(trial, stats, solution)) {
            return true;
        }
        stats.backtracks++;
    }
    return false;
}

inline void solve_cp(const int grid[N][N], SolveResult& result) {
    result.solved = false;
    result.stats = SolveStats();

    Board board = make_board();
    if (!propagate_constraints(grid, board, result.stats)) return;

    Board solution;
    if (!depth_first_search(board, result.stats, solution)) return;

    board_to_grid(solution, result.grid);
    result.solved = true;
}

#endif
