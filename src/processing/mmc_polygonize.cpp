//! @file mmc_polygonize.cpp
//! @brief Implementation of cell classification, edge interpolation and triangulation.

#include "processing/mmc_polygonize.h"

//! Classifies every corner sample of a cell.
CORNER_SIGNS classify_corners(const std::array<double, NUM_CUBE_CORNERS> &samples, double isolevel)
{
    CORNER_SIGNS signs;
    for (int v = 0; v < NUM_CUBE_CORNERS; ++v)
    {
        signs[v] = is_above_isolevel(samples[v], isolevel);
    }
    return signs;
}

//! Assembles the cube index from corner signs.
int compute_cube_index(const CORNER_SIGNS &signs)
{
    int cube_index = 0;
    int weight = 1;
    for (int v = 0; v < NUM_CUBE_CORNERS; ++v)
    {
        cube_index += signs[v] ? weight : 0;
        weight *= 2;
    }
    return cube_index;
}

//! Computes the isosurface crossing on an edge.
Point interpolate_crossing(double isolevel, const Point &p0, const Point &p1, double s0, double s1)
{
    if (isolevel == s0)
        return p0;
    if (isolevel == s1)
        return p1;
    if (s0 == s1)
        return p0;

    const double t = (isolevel - s0) / (s1 - s0);
    return p0 + t * (p1 - p0);
}

//! Runs marching cubes on one cell.
CELL_POLYGON polygonize_cell(const std::array<Point, NUM_CUBE_CORNERS> &corners,
                             const std::array<double, NUM_CUBE_CORNERS> &samples,
                             double isolevel)
{
    CELL_POLYGON result;
    result.cube_index = compute_cube_index(classify_corners(samples, isolevel));

    const std::uint16_t edges = edge_mask(result.cube_index);
    if (edges == 0)
        return result;

    // Crossing point of every cut edge, indexed by edge number.
    std::array<Point, NUM_CUBE_EDGES> crossing;
    for (int e = 0; e < NUM_CUBE_EDGES; ++e)
    {
        if (!is_edge_crossed(edges, e))
            continue;
        const int v0 = CUBE_EDGE_CORNERS[e][0];
        const int v1 = CUBE_EDGE_CORNERS[e][1];
        crossing[e] = interpolate_crossing(isolevel, corners[v0], corners[v1], samples[v0], samples[v1]);
    }

    const TRIANGLE_CASE row = triangle_case(result.cube_index);
    result.triangles.reserve(row.size());
    for (const EDGE_TRIPLE &tri : row)
    {
        result.triangles.emplace_back(crossing[tri.edge[0]], crossing[tri.edge[1]], crossing[tri.edge[2]]);
    }

    return result;
}

//! Runs marching cubes on a grid cell using its cached samples.
CELL_POLYGON polygonize_cell(const GridCell &cell, double isolevel)
{
    return polygonize_cell(cell.corners, cell.samples, isolevel);
}
