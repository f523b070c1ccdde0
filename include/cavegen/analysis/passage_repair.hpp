// CaveGen Analysis
// passage_repair.hpp - Opens diagonal-only links and one-tile passages after carving

#pragma once

#include <cavegen/level/grid.hpp>

#include <cstddef>
#include <vector>

namespace cavegen::analysis {

// Two floor cells touching only at a corner, with both cells between them walled
struct DiagonalIssue {
    level::Point position{0, 0};
    level::Point diagonal{0, 0};
    level::Point between[2] = {{0, 0}, {0, 0}};
};

struct DiagonalFixResult {
    level::Grid grid;
    size_t issues_found = 0;
    size_t fixes_applied = 0;
};

class PassageRepair {
public:
    /// Column-major scan, at most one issue per floor cell
    [[nodiscard]] static std::vector<DiagonalIssue> detect_diagonal_corridors(const level::Grid& grid);

    /// Opens the between-cells of every issue; border cells stay walls
    [[nodiscard]] static DiagonalFixResult fix_diagonal_corridors(const level::Grid& grid);

    /// Opens one neighbour of every floor cell pinched between two walls until nothing changes
    [[nodiscard]] static level::Grid widen_narrow_passages(const level::Grid& grid, int max_passes = 8);

private:
    [[nodiscard]] static bool is_border(const level::Grid& grid, int32_t x, int32_t y);
};

}  // namespace cavegen::analysis
