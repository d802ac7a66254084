#include "core/mmc_stats.h"
#include "core/mmc_utilities.h"
#include "processing/mmc_tables.h"

void collect_field_stats(FrameStats &stats,
                         const SampleGrid &grid,
                         const MetaballField &field,
                         const TriangleList &triangles,
                         double isolevel)
{
    stats.has_field_stats = true;
    stats.field_evaluations = grid.cells().size() * (NUM_CUBE_CORNERS + 1) * field.size();
    stats.visible_cells = 0;
    stats.min_sample = std::numeric_limits<double>::infinity();
    stats.max_sample = -std::numeric_limits<double>::infinity();

    for (const GridCell &cell : grid.cells())
    {
        for (double s : cell.samples)
        {
            stats.min_sample = std::min(stats.min_sample, s);
            stats.max_sample = std::max(stats.max_sample, s);
        }

        if (is_above_isolevel(cell.center_sample, isolevel))
            ++stats.visible_cells;
    }

    stats.has_surface = !triangles.empty();
    stats.surface_centroid = Point(0, 0, 0);
    if (stats.has_surface)
    {
        std::vector<Point> vertices;
        vertices.reserve(3 * triangles.size());
        for (const IsoTriangle &tri : triangles)
        {
            vertices.push_back(tri.vertex1);
            vertices.push_back(tri.vertex2);
            vertices.push_back(tri.vertex3);
        }
        stats.surface_centroid = compute_centroid(vertices);
    }
}

void print_summary_report(const FrameStats &stats, std::ostream &out)
{
    out << "\n====Summary Stats (frame " << stats.frame << ")====\n";
    out << "  Metaballs: " << stats.num_metaballs << "\n";
    out << "  Grid cells: " << stats.cells
        << " (active: " << stats.active_cells;
    if (stats.has_field_stats)
        out << ", visible: " << stats.visible_cells;
    out << ")\n";
    out << "  Iso-surface triangles: " << stats.iso_triangles
        << " (max per cell: " << stats.max_cell_triangles << ")\n";

    if (stats.has_field_stats)
    {
        out << "  Field evaluations per frame: " << stats.field_evaluations << "\n";
        if (stats.cells > 0)
        {
            out << "  Corner samples (min / max): "
                << std::scientific << std::setprecision(3) << stats.min_sample
                << " / " << stats.max_sample << std::defaultfloat << "\n";
        }
        if (stats.has_surface)
        {
            out << "  Iso-surface centroid: (" << std::fixed << std::setprecision(4)
                << stats.surface_centroid.x() << ", "
                << stats.surface_centroid.y() << ", "
                << stats.surface_centroid.z() << ")" << std::defaultfloat << "\n";
        }
    }
    out << std::defaultfloat << std::setprecision(6);
}
