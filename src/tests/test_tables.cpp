#include "test/test_mmc.h"

// Checks the marching-cubes tables against the corner classification they encode.

// Edge e is crossed iff its two corners fall on different sides.
static std::uint16_t mask_from_corners(int cube_index)
{
    std::uint16_t mask = 0;
    for (int e = 0; e < NUM_CUBE_EDGES; ++e)
    {
        const bool in0 = (cube_index >> CUBE_EDGE_CORNERS[e][0]) & 1;
        const bool in1 = (cube_index >> CUBE_EDGE_CORNERS[e][1]) & 1;
        if (in0 != in1)
            mask |= static_cast<std::uint16_t>(1u << e);
    }
    return mask;
}

int main()
{
    int num_triangles = 0;
    int max_row = 0;

    for (int c = 0; c < NUM_CUBE_CASES; ++c)
    {
        const std::uint16_t mask = edge_mask(c);
        MMC_CHECK(mask == mask_from_corners(c));

        const TRIANGLE_CASE row = triangle_case(c);
        MMC_CHECK(row.size() >= 0 && row.size() <= MAX_CASE_TRIANGLES);
        MMC_CHECK(row.empty() == (mask == 0));

        for (const EDGE_TRIPLE &tri : row)
        {
            for (int i = 0; i < 3; ++i)
            {
                MMC_CHECK(tri.edge[i] >= 0 && tri.edge[i] < NUM_CUBE_EDGES);
                MMC_CHECK(is_edge_crossed(mask, tri.edge[i]));
            }
            MMC_CHECK(tri.edge[0] != tri.edge[1] && tri.edge[1] != tri.edge[2] && tri.edge[0] != tri.edge[2]);
        }

        // Every crossed edge carries a vertex of some triangle.
        for (int e = 0; e < NUM_CUBE_EDGES; ++e)
        {
            if (!is_edge_crossed(mask, e))
                continue;
            bool used = false;
            for (const EDGE_TRIPLE &tri : row)
                used = used || tri.edge[0] == e || tri.edge[1] == e || tri.edge[2] == e;
            MMC_CHECK(used);
        }

        num_triangles += row.size();
        max_row = std::max(max_row, row.size());
    }

    MMC_CHECK(edge_mask(0) == 0);
    MMC_CHECK(edge_mask(NUM_CUBE_CASES - 1) == 0);
    MMC_CHECK(triangle_case(0).empty());
    MMC_CHECK(triangle_case(NUM_CUBE_CASES - 1).empty());

    // A single inside corner cuts its three incident edges with one triangle.
    MMC_CHECK(edge_mask(1) == 0x109);
    MMC_CHECK(triangle_case(1).size() == 1);

    // Complementary cases cut the same edges.
    for (int c = 0; c < NUM_CUBE_CASES; ++c)
        MMC_CHECK(edge_mask(c) == edge_mask(NUM_CUBE_CASES - 1 - c));

    std::cout << "Triangle table: " << num_triangles << " triangles, at most "
              << max_row << " per case" << std::endl;
    MMC_CHECK(max_row == MAX_CASE_TRIANGLES);

    return test_report("test_tables");
}
