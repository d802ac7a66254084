//! @file mmc_debug.h
//! @brief Console stand-in for the visual-debug collaborator.

#ifndef MMC_DEBUG_H
#define MMC_DEBUG_H

#include "core/mmc_type.h"
#include "processing/mmc_frame.h"

//! @brief Prints cell visibility of each frame to a stream.
/*!
 * Each frame ends with one `[VISUAL]` summary line. With `print_slices`
 * set, the visibility map follows, one z-slice at a time, `#` for a visible
 * cell and `.` for a hidden one.
 */
class ConsoleVisualizer : public VisualizationHooks
{
public:
    //! @param resolution Cells per axis of the grid being reported; must match the driver's grid.
    ConsoleVisualizer(std::ostream &out, int resolution, bool print_slices);

    void set_grid_visible(bool visible) override;

    //! @throws std::out_of_range if @p flat_index is not a cell of a `resolution³` grid.
    void set_cell_visible(int flat_index, bool visible) override;
    void frame_done(const FrameStats &stats) override;

    bool grid_visible() const { return grid_visible_; }
    bool cell_visible(int flat_index) const { return visible_.at(flat_index); }
    std::size_t num_visible() const;

private:
    std::ostream &out_;
    int res_;
    bool print_slices_;
    bool grid_visible_ = true;
    std::vector<bool> visible_;
};

#endif // MMC_DEBUG_H
