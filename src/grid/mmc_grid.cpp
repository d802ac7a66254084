#include "grid/mmc_grid.h"

#include <sstream>

//! Constructor for SampleGrid
SampleGrid::SampleGrid(const Point &origin, double cell_width, int resolution)
    : origin_(origin), cell_width_(cell_width), res_(resolution)
{
    if (resolution <= 0)
    {
        throw std::invalid_argument("SampleGrid: resolution must be > 0.");
    }
    if (!(cell_width > 0.0))
    {
        throw std::invalid_argument("SampleGrid: cell width must be > 0.");
    }

    const std::size_t num_cells = static_cast<std::size_t>(res_) * res_ * res_;
    if (num_cells > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("SampleGrid: resolution^3 cells do not fit in an int index.");
    }
    res2_ = res_ * res_;
    res3_ = static_cast<int>(num_cells);

    cells_.resize(res3_);
    for (int c = 0; c < res3_; ++c)
    {
        GridCell &cell = cells_[c];
        std::tie(cell.i, cell.j, cell.k) = index_to_coords(c);
        cell.center = coords_to_center(cell.i, cell.j, cell.k);

        // Corners come from the lattice so neighboring cells share bit-identical positions.
        const int base[DIM3] = {cell.i, cell.j, cell.k};
        const double lo[DIM3] = {origin_.x(), origin_.y(), origin_.z()};
        for (int v = 0; v < NUM_CUBE_CORNERS; ++v)
        {
            double p[DIM3];
            for (int d = 0; d < DIM3; ++d)
                p[d] = lo[d] + (base[d] + CUBE_CORNER_OFFSET[v][d]) * cell_width_;
            cell.corners[v] = Point(p[0], p[1], p[2]);
        }
    }
}

// Convert flat index to 3D index
std::tuple<int, int, int> SampleGrid::index_to_coords(int flat_index) const
{
    if (flat_index < 0 || flat_index >= res3_)
    {
        std::ostringstream msg;
        msg << "SampleGrid: flat index " << flat_index << " outside [0, " << res3_ << ").";
        throw std::out_of_range(msg.str());
    }
    return {flat_index % res_, (flat_index % res2_) / res_, flat_index / res2_};
}

// Convert 3D index to flat index
int SampleGrid::coords_to_index(int ix, int iy, int iz) const
{
    if (ix < 0 || ix >= res_ || iy < 0 || iy >= res_ || iz < 0 || iz >= res_)
    {
        std::ostringstream msg;
        msg << "SampleGrid: cell (" << ix << ", " << iy << ", " << iz << ") outside a "
            << res_ << "^3 grid.";
        throw std::out_of_range(msg.str());
    }
    return ix + iy * res_ + iz * res2_;
}

// Convert 3D index to cell center
Point SampleGrid::coords_to_center(int ix, int iy, int iz) const
{
    return Point(origin_.x() + (ix + 0.5) * cell_width_,
                 origin_.y() + (iy + 0.5) * cell_width_,
                 origin_.z() + (iz + 0.5) * cell_width_);
}

// Convert cell center to 3D index
std::tuple<int, int, int> SampleGrid::center_to_coords(const Point &center) const
{
    auto axis_index = [this](double coord, double lo) {
        return static_cast<int>(std::lround((coord - lo) / cell_width_ - 0.5));
    };
    const int ix = axis_index(center.x(), origin_.x());
    const int iy = axis_index(center.y(), origin_.y());
    const int iz = axis_index(center.z(), origin_.z());
    // Range check
    coords_to_index(ix, iy, iz);
    return {ix, iy, iz};
}

//! Overwrites every corner and center sample from the field.
void SampleGrid::resample(const MetaballField &field)
{
    for (GridCell &cell : cells_)
    {
        cell.center_sample = field.evaluate(cell.center);
        for (int v = 0; v < NUM_CUBE_CORNERS; ++v)
        {
            cell.samples[v] = field.evaluate(cell.corners[v]);
        }
    }
}

//! Center samples as a flat array, x fastest.
std::vector<float> SampleGrid::center_samples() const
{
    // Flat cell order is already x fastest.
    std::vector<float> values(res3_);
    for (int c = 0; c < res3_; ++c)
    {
        values[c] = static_cast<float>(cells_[c].center_sample);
    }
    return values;
}

// Print grid metadata and data
void SampleGrid::print_grid(std::ostream &out) const
{
    out << "Sample Grid Information:\n";
    out << "Dimensions: " << res_ << "x" << res_ << "x" << res_ << "\n";
    out << "Cell width: " << cell_width_ << "\n";
    out << "Bounds: [" << origin_ << "] to [" << origin_.x() + width() << " "
        << origin_.y() + width() << " " << origin_.z() + width() << "]\n\n";
    out << "Center samples:\n";
    for (int z = 0; z < res_; ++z)
    {
        out << "Slice z = " << z << ":\n";
        for (int y = 0; y < res_; ++y)
        {
            for (int x = 0; x < res_; ++x)
                out << std::setw(10) << cells_[x + y * res_ + z * res2_].center_sample << " ";
            out << "\n";
        }
        out << "\n";
    }
}
