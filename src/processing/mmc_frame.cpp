//! @file mmc_frame.cpp
//! @brief Implementation of the per-frame driver.

#include "processing/mmc_frame.h"
#include "core/mmc_timing.h"

namespace
{

//! Validates @p mp and returns it, so members can be initialized from it.
const MMC_PARAM &validated(const MMC_PARAM &mp)
{
    validate_parameters(mp);
    return mp;
}

//! Checks that a field covers the grid domain of a configuration.
const MetaballField &matching_field(const MetaballField &field, const MMC_PARAM &mp)
{
    const PointApproxEqual same_point{1e-9};
    if (!same_point(field.domain_min(), grid_origin()) ||
        !nearly_equal(field.domain_width(), mp.grid_width, GRID_WIDTH_REL_TOLERANCE))
    {
        throw std::invalid_argument("FrameDriver: metaball domain does not match the grid domain.");
    }
    return field;
}

} // namespace

Point grid_origin()
{
    return Point(0, 0, 0);
}

FrameDriver::FrameDriver(const MMC_PARAM &mp, VisualizationHooks *hooks)
    : param_(validated(mp)),
      field_(MetaballField::setup_random(param_, grid_origin())),
      grid_(grid_origin(), param_.grid_cell_width, param_.grid_res),
      hooks_(hooks)
{
}

FrameDriver::FrameDriver(const MMC_PARAM &mp, const MetaballField &field, VisualizationHooks *hooks)
    : param_(validated(mp)),
      field_(matching_field(field, param_)),
      grid_(grid_origin(), param_.grid_cell_width, param_.grid_res),
      hooks_(hooks)
{
}

TriangleList FrameDriver::step(double dt)
{
    TriangleList triangles;
    if (paused_)
        return triangles;

    ScopedTimer frame_timer("Frame step", "Frames");

    {
        ScopedTimer timer("1. Advance metaballs", "Frame step");
        field_.step(dt);
    }

    {
        ScopedTimer timer("2. Resample grid", "Frame step");
        grid_.resample(field_);
    }

    ++frame_count_;
    frame_stats_ = FrameStats();
    frame_stats_.frame = frame_count_;
    frame_stats_.num_metaballs = field_.size();
    frame_stats_.cells = grid_.cells().size();

    {
        ScopedTimer timer("3. Polygonize cells", "Frame step");
        for (const GridCell &cell : grid_.cells())
        {
            CELL_POLYGON polygon = polygonize_cell(cell, param_.isolevel);
            if (polygon.triangles.empty())
                continue;

            ++frame_stats_.active_cells;
            frame_stats_.max_cell_triangles = std::max(frame_stats_.max_cell_triangles, polygon.triangles.size());
            if (param_.debug)
            {
                std::cout << "[DEBUG] ";
                cell.Print(std::cout);
                polygon.Print(std::cout);
            }
            triangles.insert(triangles.end(), polygon.triangles.begin(), polygon.triangles.end());
        }
    }
    frame_stats_.iso_triangles = triangles.size();

    if (param_.summary_stats || param_.debug || param_.visual_debug)
    {
        collect_field_stats(frame_stats_, grid_, field_, triangles, param_.isolevel);
    }

    if (param_.debug)
    {
        std::cout << "[DEBUG] Frame " << frame_count_ << ": "
                  << frame_stats_.active_cells << " active cells, "
                  << triangles.size() << " triangles" << std::endl;
    }

    if (param_.visual_debug && grid_shown_ && hooks_ != nullptr)
    {
        report_visibility();
    }

    return triangles;
}

void FrameDriver::show()
{
    grid_shown_ = true;
    if (hooks_ != nullptr)
        hooks_->set_grid_visible(true);
}

void FrameDriver::hide()
{
    grid_shown_ = false;
    if (hooks_ != nullptr)
        hooks_->set_grid_visible(false);
}

void FrameDriver::report_visibility()
{
    for (int c = 0; c < grid_.num_cells(); ++c)
    {
        hooks_->set_cell_visible(c, is_above_isolevel(grid_.cell(c).center_sample, param_.isolevel));
    }
    hooks_->frame_done(frame_stats_);
}
