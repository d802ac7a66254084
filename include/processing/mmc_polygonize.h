//! @file mmc_polygonize.h
//! @brief Marching-cubes polygonization of a single grid cell.

#ifndef MMC_POLYGONIZE_H
#define MMC_POLYGONIZE_H

#include "core/mmc_type.h"
#include "core/mmc_utilities.h"
#include "grid/mmc_grid.h"
#include "processing/mmc_tables.h"

//! @brief Result of polygonizing one cell.
/*!
 * `normals` is always empty: vertex normals are left to the consumer.
 */
struct CELL_POLYGON
{
    int cube_index = 0;            //!< Cube index the cell classified to.
    std::vector<IsoTriangle> triangles; //!< Triangles in table order.
    std::vector<Vector3> normals;  //!< Always empty.

    //! @brief Print polygonization result for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE &out) const
    {
        out << "CELL_POLYGON: cube index " << cube_index << ", "
            << triangles.size() << " triangle(s)\n";
        for (const IsoTriangle &tri : triangles)
        {
            out << "  ";
            tri.Print(out);
        }
    }
};

//! @brief Per-corner classification of a cell against the isolevel.
typedef std::array<bool, NUM_CUBE_CORNERS> CORNER_SIGNS;

//! @brief Classifies every corner sample of a cell.
/*!
 * @param samples Corner samples in table order.
 * @param isolevel The isolevel.
 * @return `signs[i] == (samples[i] > isolevel)`.
 */
CORNER_SIGNS classify_corners(const std::array<double, NUM_CUBE_CORNERS> &samples, double isolevel);

//! @brief Assembles the cube index from corner signs.
/*!
 * The cube index is `Σ signs[i] * 2^i`: corner 0 is the least significant
 * bit and corner 7 the most significant, the weighting of the topology tables.
 *
 * @param signs Corner classification.
 * @return Cube index in [0, 256).
 */
int compute_cube_index(const CORNER_SIGNS &signs);

//! @brief Computes the isosurface crossing on an edge by linear interpolation.
/*!
 * Returns `p0 + t * (p1 - p0)` with `t = (isolevel - s0) / (s1 - s0)`.
 * If `isolevel == s0` the result is exactly @p p0 and if `isolevel == s1`
 * it is exactly @p p1. When `s0 == s1` there is no crossing to locate and
 * @p p0 is returned.
 *
 * @param isolevel The isolevel.
 * @param p0 First edge endpoint.
 * @param p1 Second edge endpoint.
 * @param s0 Sample at @p p0.
 * @param s1 Sample at @p p1.
 * @return The interpolated point.
 */
Point interpolate_crossing(double isolevel, const Point &p0, const Point &p1, double s0, double s1);

//! @brief Runs marching cubes on one cell.
/*!
 * Classifies the corners, interpolates the crossing point of every edge set
 * in the edge table, and emits the triangles of the case row in table order.
 * Cube indices 0 and 255 produce no triangles.
 *
 * @param corners Corner positions in table order.
 * @param samples Corner samples in table order.
 * @param isolevel The isolevel.
 * @return The cell's triangles (at most 5) and an empty normal list.
 */
CELL_POLYGON polygonize_cell(const std::array<Point, NUM_CUBE_CORNERS> &corners,
                             const std::array<double, NUM_CUBE_CORNERS> &samples,
                             double isolevel);

//! @brief Runs marching cubes on a grid cell using its cached samples.
CELL_POLYGON polygonize_cell(const GridCell &cell, double isolevel);

#endif // MMC_POLYGONIZE_H
