//! @file mmc_grid.h
//! @brief Header file for the sample grid and its cells.
#ifndef MMC_GRID_H
#define MMC_GRID_H

#include "core/mmc_type.h"
#include "field/mmc_metaball.h"
#include "processing/mmc_tables.h"

#include <tuple>

// DIM = 3 for a 3D grid
static const int DIM3 = 3;

//! @brief Represents one cubic cell of the sample grid.
/*!
 * Geometry (center, corners) is fixed at construction. Samples are
 * overwritten on every resample. Corners follow the order of
 * processing/mmc_tables.h.
 */
struct GridCell {
    Point center;                                //!< Cell center (world coordinates).
    std::array<Point, NUM_CUBE_CORNERS> corners; //!< Corner positions, table order.
    std::array<double, NUM_CUBE_CORNERS> samples; //!< Field value at each corner.
    double center_sample;                        //!< Field value at the center, used for visibility only.
    int i, j, k;                                 //!< Grid indices of the cell.

    GridCell() : center(0, 0, 0), center_sample(0.0), i(0), j(0), k(0)
    {
        samples.fill(0.0);
    }

    //! @brief Print cell for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE &out) const
    {
        out << "GridCell (" << i << ", " << j << ", " << k << "):\n";
        out << "  Center: (" << center << ") sample " << center_sample << "\n";
        for (int c = 0; c < NUM_CUBE_CORNERS; ++c)
        {
            out << "  Corner " << c << ": (" << corners[c] << ") sample " << samples[c] << "\n";
        }
    }
};

//! @brief A uniform lattice of `resolution³` cubic cells.
/*!
 * The grid covers `[origin, origin + resolution * cell_width]³`. The flat
 * index of cell `(ix, iy, iz)` is `ix + iy * res + iz * res²`, and its center
 * is `origin + (index + 0.5) * cell_width` per axis.
 */
class SampleGrid
{
public:
    //! @brief Constructs the grid and precomputes all cell geometry.
    /*!
     * @param origin Lower corner of the grid.
     * @param cell_width Side length of a cell.
     * @param resolution Number of cells per axis.
     * @throws std::invalid_argument if `resolution <= 0`, `cell_width <= 0`,
     *         or `resolution³` exceeds `INT_MAX`.
     */
    SampleGrid(const Point &origin, double cell_width, int resolution);

    //! @brief Convert a flat cell index to its 3D index.
    /*!
     * @throws std::out_of_range if @p flat_index is not in `[0, resolution³)`.
     */
    std::tuple<int, int, int> index_to_coords(int flat_index) const;

    //! @brief Convert a 3D cell index to its flat index.
    /*!
     * @throws std::out_of_range if a component is not in `[0, resolution)`.
     */
    int coords_to_index(int ix, int iy, int iz) const;

    //! @brief World-space center of cell `(ix, iy, iz)`.
    Point coords_to_center(int ix, int iy, int iz) const;

    //! @brief 3D index of the cell whose center is @p center.
    /*!
     * Inverse of `coords_to_center`. For an arbitrary point, returns the cell
     * with the nearest center.
     *
     * @throws std::out_of_range if the resulting index is outside the grid.
     */
    std::tuple<int, int, int> center_to_coords(const Point &center) const;

    //! @brief Overwrite all corner and center samples from @p field.
    void resample(const MetaballField &field);

    int resolution() const { return res_; }
    double cell_width() const { return cell_width_; }
    double width() const { return cell_width_ * res_; }
    const Point &origin() const { return origin_; }
    int num_cells() const { return static_cast<int>(cells_.size()); }

    const GridCell &cell(int flat_index) const { return cells_[flat_index]; }
    const std::vector<GridCell> &cells() const { return cells_; }

    //! @brief Center samples as a flat array, x fastest (NRRD ordering).
    std::vector<float> center_samples() const;

    //! @brief Print the grid's metadata and center samples.
    void print_grid(std::ostream &out) const;

private:
    Point origin_;
    double cell_width_;
    int res_;
    int res2_;
    int res3_;
    std::vector<GridCell> cells_;
};

#endif // MMC_GRID_H
