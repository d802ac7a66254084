#include "core/mmc_debug.h"

#include <sstream>

ConsoleVisualizer::ConsoleVisualizer(std::ostream &out, int resolution, bool print_slices)
    : out_(out), res_(resolution), print_slices_(print_slices),
      visible_(static_cast<std::size_t>(resolution) * resolution * resolution, false)
{
}

void ConsoleVisualizer::set_grid_visible(bool visible)
{
    grid_visible_ = visible;
    if (!visible)
        std::fill(visible_.begin(), visible_.end(), false);
    out_ << "[VISUAL] Grid " << (visible ? "shown" : "hidden") << "\n";
}

void ConsoleVisualizer::set_cell_visible(int flat_index, bool visible)
{
    if (flat_index < 0 || static_cast<std::size_t>(flat_index) >= visible_.size())
    {
        std::ostringstream msg;
        msg << "ConsoleVisualizer: cell " << flat_index << " outside a "
            << res_ << "^3 grid.";
        throw std::out_of_range(msg.str());
    }
    visible_[flat_index] = visible;
}

std::size_t ConsoleVisualizer::num_visible() const
{
    return static_cast<std::size_t>(std::count(visible_.begin(), visible_.end(), true));
}

void ConsoleVisualizer::frame_done(const FrameStats &stats)
{
    out_ << "[VISUAL] Frame " << stats.frame << ": " << num_visible() << "/" << visible_.size()
         << " cells above isolevel\n";

    if (!print_slices_)
        return;

    for (int z = 0; z < res_; ++z)
    {
        out_ << "  z = " << z << "\n";
        for (int y = res_ - 1; y >= 0; --y)
        {
            out_ << "    ";
            for (int x = 0; x < res_; ++x)
                out_ << (visible_[x + y * res_ + z * res_ * res_] ? '#' : '.');
            out_ << "\n";
        }
    }
}
