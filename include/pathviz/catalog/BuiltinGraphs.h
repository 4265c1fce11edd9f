#pragma once

#include "../core/Graph.h"

namespace pathviz {
namespace builtin {

/// 6x6 street grid of (row, col) cells at (col, row), with two blocked
/// streets and one diagonal shortcut
Graph urbanGrid6x6();

/// Two rails L0..L4 / R0..R4 joined by rungs
Graph ladder10();

/// Complete binary tree over integer nodes 1..15
Graph binaryTree15();

/// Outer and inner hexagon (O0..O5, I0..I5) with spokes and two chords
Graph hexRing12();

/// Ten named campus places joined by footpaths
Graph campusMap();

}  // namespace builtin
}  // namespace pathviz
