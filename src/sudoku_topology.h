#ifndef SUDOKU_TOPOLOGY_H
#define SUDOKU_TOPOLOGY_H

#include <string>
#include "sudoku_common.h"

// Static structure of the 9x9 board. Cell index is row * N + col.
//
//   A1 A2 A3 | A4 A5 A6 | A7 A8 A9
//   B1 ...
//   I1 ...                     I9
struct Topology {
    // 9 rows, then 9 columns, then 9 boxes
    int unit_list[NUM_UNITS][N];
    // per cell: [row, column, box]
    int units[NUM_CELLS][3][N];
    // per cell, ascending cell index
    int peers[NUM_CELLS][NUM_PEERS];
};

inline int row_of(int cell) { return cell / N; }
inline int col_of(int cell) { return cell % N; }
inline int box_of(int cell) {
    return (row_of(cell) / SQRT_N) * SQRT_N + col_of(cell) / SQRT_N;
}

inline Topology build_topology() {
    Topology t;

    for (int u = 0; u < N; u++) {
        for (int k = 0; k < N; k++) {
            t.unit_list[u][k] = u * N + k;
            t.unit_list[N + u][k] = k * N + u;
        }
        int br = (u / SQRT_N) * SQRT_N;
        int bc = (u % SQRT_N) * SQRT_N;
        for (int k = 0; k < N; k++) {
            t.unit_list[2 * N + u][k] = (br + k / SQRT_N) * N + bc + k % SQRT_N;
        }
    }

    for (int cell = 0; cell < NUM_CELLS; cell++) {
        const int owners[3] = { row_of(cell), N + col_of(cell), 2 * N + box_of(cell) };
        bool member[NUM_CELLS] = {};
        for (int u = 0; u < 3; u++) {
            for (int k = 0; k < N; k++) {
                int other = t.unit_list[owners[u]][k];
                t.units[cell][u][k] = other;
                member[other] = true;
            }
        }
        member[cell] = false;

        int n = 0;
        for (int other = 0; other < NUM_CELLS; other++) {
            if (member[other]) t.peers[cell][n++] = other;
        }
    }
    return t;
}

// Built on first use and shared read-only afterwards.
inline const Topology& topology() {
    static const Topology t = build_topology();
    return t;
}

inline std::string cell_name(int cell) {
    std::string name;
    name += (char)('A' + row_of(cell));
    name += (char)('1' + col_of(cell));
    return name;
}

#endif
