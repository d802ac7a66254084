//! @file mmc_frame.h
//! @brief Per-frame driver: advance the metaballs, resample the grid, polygonize every cell.

#ifndef MMC_FRAME_H
#define MMC_FRAME_H

#include "core/mmc_commandline.h"
#include "core/mmc_stats.h"
#include "field/mmc_metaball.h"
#include "grid/mmc_grid.h"
#include "processing/mmc_polygonize.h"

//! @brief Receiver of the visualization side channel of the frame driver.
/*!
 * Implementations draw cell wireframes, labels and similar debug output.
 * None of it feeds back into the surface extraction.
 */
class VisualizationHooks
{
public:
    virtual ~VisualizationHooks() = default;

    //! @brief Called by show() and hide().
    virtual void set_grid_visible(bool visible) = 0;

    //! @brief Called once per cell and frame while visual debugging is on and the grid is shown.
    /*!
     * @param flat_index Flat index of the cell.
     * @param visible `true` iff the cell's center sample is above the isolevel.
     */
    virtual void set_cell_visible(int flat_index, bool visible) = 0;

    //! @brief Called after the cell visibility of a frame has been reported.
    virtual void frame_done(const FrameStats &stats) = 0;
};

//! @brief Orchestrates one simulation step of the metaball surface.
/*!
 * Owns the metaball field and the sample grid for its whole lifetime. Each
 * `step` is a full recomputation; nothing carries over between frames
 * except ball positions and velocities.
 */
class FrameDriver
{
public:
    //! @brief Creates the driver with a randomized metaball population.
    /*!
     * @param mp Run configuration; validated here.
     * @param hooks Optional visualization receiver, not owned.
     * @throws std::invalid_argument if @p mp violates a constraint.
     */
    explicit FrameDriver(const MMC_PARAM &mp, VisualizationHooks *hooks = nullptr);

    //! @brief Creates the driver around an existing field.
    /*!
     * The field's domain must coincide with the grid domain of @p mp.
     *
     * @throws std::invalid_argument if @p mp is invalid or the domains differ.
     */
    FrameDriver(const MMC_PARAM &mp, const MetaballField &field, VisualizationHooks *hooks = nullptr);

    //! @brief Runs one frame.
    /*!
     * If paused, does nothing and returns an empty list. Otherwise advances
     * the field by @p dt, resamples the grid and polygonizes every cell in
     * flat-index order.
     *
     * @param dt Time step.
     * @return The triangles of the frame.
     */
    TriangleList step(double dt);

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    bool is_paused() const { return paused_; }

    //! @brief Shows the grid in the visualization collaborator.
    void show();

    //! @brief Hides the grid in the visualization collaborator.
    void hide();

    bool is_grid_shown() const { return grid_shown_; }

    const MMC_PARAM &param() const { return param_; }
    const MetaballField &field() const { return field_; }
    const SampleGrid &grid() const { return grid_; }

    //! @brief Number of frames computed so far (paused steps excluded).
    std::size_t frame_count() const { return frame_count_; }

    //! @brief Statistics of the last computed frame.
    const FrameStats &frame_stats() const { return frame_stats_; }

private:
    MMC_PARAM param_;
    MetaballField field_;
    SampleGrid grid_;
    VisualizationHooks *hooks_;
    bool paused_ = false;
    bool grid_shown_ = true;
    std::size_t frame_count_ = 0;
    FrameStats frame_stats_;

    void report_visibility();
};

//! @brief Origin of the grid domain used by the frame driver.
Point grid_origin();

#endif // MMC_FRAME_H
