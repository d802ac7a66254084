//! @file mmc_tables.h
//! @brief Topology tables of the marching-cubes algorithm.
//! @details
//! Corner order of a cell (x = left/right, y = bottom/top, z = back/front):
//!
//!         3 -------- 2          y
//!        /|         /|          |
//!       7 -------- 6 |          o--- x
//!       | |        | |         /
//!       | 0 -------|-1        z
//!       |/         |/
//!       4 -------- 5
//!
//!   corner 0 (-,-,-)  1 (+,-,-)  2 (+,+,-)  3 (-,+,-)
//!   corner 4 (-,-,+)  5 (+,-,+)  6 (+,+,+)  7 (-,+,+)
//!
//! Edge numbering: e0=(0,1) e1=(1,2) e2=(2,3) e3=(3,0) e4=(4,5) e5=(5,6)
//! e6=(6,7) e7=(7,4) e8=(0,4) e9=(1,5) e10=(2,6) e11=(3,7).
//! Corner i contributes bit i of the cube index.

#ifndef MMC_TABLES_H
#define MMC_TABLES_H

#include <array>
#include <cstdint>

//! @brief Number of corners of a grid cell.
static const int NUM_CUBE_CORNERS = 8;

//! @brief Number of edges of a grid cell.
static const int NUM_CUBE_EDGES = 12;

//! @brief Number of distinct cube indices (2^8).
static const int NUM_CUBE_CASES = 256;

//! @brief Largest number of triangles any case produces.
static const int MAX_CASE_TRIANGLES = 5;

//! @brief Lattice offset (0 = low side, 1 = high side) of every cell corner.
static const int CUBE_CORNER_OFFSET[NUM_CUBE_CORNERS][3] = {
    {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0},
    {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1}};

//! @brief Corner pair of every cell edge, in edge-number order.
static const int CUBE_EDGE_CORNERS[NUM_CUBE_EDGES][2] = {
    {0, 1}, {1, 2}, {2, 3}, {3, 0},
    {4, 5}, {5, 6}, {6, 7}, {7, 4},
    {0, 4}, {1, 5}, {2, 6}, {3, 7}};

//! @brief Three cell-edge numbers forming one triangle.
struct EDGE_TRIPLE
{
    int edge[3];
};

//! @brief Ordered triangle row of one cube index.
/*!
 * A read-only view into the static triangle list. The order of the
 * triples and of the edges within a triple sets the triangle winding.
 */
struct TRIANGLE_CASE
{
    const EDGE_TRIPLE *first; //!< First triple of the row.
    int num_triangles;        //!< Number of triples in the row (0 to 5).

    const EDGE_TRIPLE *begin() const { return first; }
    const EDGE_TRIPLE *end() const { return first + num_triangles; }
    bool empty() const { return num_triangles == 0; }
    int size() const { return num_triangles; }
};

//! @brief Returns the 12-bit crossed-edge mask of a cube index.
/*!
 * @param cube_index Cube index in [0, 256).
 * @return Mask with bit i set iff edge i is crossed by the isosurface.
 */
std::uint16_t edge_mask(int cube_index);

//! @brief Returns the triangle row of a cube index.
/*!
 * @param cube_index Cube index in [0, 256).
 * @return View of 0 to 5 edge triples.
 */
TRIANGLE_CASE triangle_case(int cube_index);

//! @brief Checks whether edge @p edge is set in @p mask.
inline bool is_edge_crossed(std::uint16_t mask, int edge)
{
    return (mask >> edge) & 1u;
}

#endif // MMC_TABLES_H
