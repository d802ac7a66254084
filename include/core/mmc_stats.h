//! @file mmc_stats.h
//! @brief Per-frame statistics and the summary report.

#ifndef MMC_STATS_H
#define MMC_STATS_H

#include "core/mmc_type.h"
#include "grid/mmc_grid.h"
#include <cstddef>
#include <vector>

//! @brief Counts and sample range of one computed frame.
/*!
 * The counters up to `max_cell_triangles` are filled by the frame driver
 * while it polygonizes. The remaining fields need another pass over the grid
 * and the triangles and are only valid when `has_field_stats` is set.
 */
struct FrameStats
{
    std::size_t frame = 0;
    std::size_t num_metaballs = 0;
    std::size_t cells = 0;
    std::size_t active_cells = 0;
    std::size_t iso_triangles = 0;
    std::size_t max_cell_triangles = 0;

    bool has_field_stats = false;
    std::size_t visible_cells = 0;
    std::size_t field_evaluations = 0;
    double min_sample = 0.0;
    double max_sample = 0.0;
    bool has_surface = false;
    Point surface_centroid = Point(0, 0, 0);
};

//! @brief Fills the sample range, visibility and surface centroid of a frame.
/*!
 * Sets `has_field_stats`. The polygonization counters of @p stats are left
 * as they are.
 */
void collect_field_stats(FrameStats &stats,
                         const SampleGrid &grid,
                         const MetaballField &field,
                         const TriangleList &triangles,
                         double isolevel);

void print_summary_report(const FrameStats &stats, std::ostream &out);

#endif // MMC_STATS_H
