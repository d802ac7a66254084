#include "test/test_mmc.h"
#include <cstdio>

// Mesh and sampled-field export.

static TriangleList two_triangles()
{
    TriangleList triangles;
    triangles.emplace_back(Point(0, 0, 0), Point(1, 0, 0), Point(0, 1, 0));
    triangles.emplace_back(Point(0, 0, 1), Point(1, 0, 1), Point(0, 1, 1));
    return triangles;
}

static std::vector<std::string> read_lines(const std::string &filename)
{
    std::ifstream in(filename);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

static void check_off()
{
    const std::string filename = "test_io_mesh.off";
    MMC_CHECK(writeOFF(filename, two_triangles()));

    const std::vector<std::string> lines = read_lines(filename);
    MMC_CHECK(lines.size() == 2 + 6 + 2);
    if (lines.size() == 10)
    {
        MMC_CHECK(lines[0] == "OFF");
        MMC_CHECK(lines[1] == "6 2 0");
        MMC_CHECK(lines[2] == "0 0 0");
        MMC_CHECK(lines[8] == "3 0 1 2");
        MMC_CHECK(lines[9] == "3 3 4 5");
    }
    std::remove(filename.c_str());

    // Empty frames still give a valid file.
    MMC_CHECK(writeOFF(filename, TriangleList()));
    const std::vector<std::string> empty = read_lines(filename);
    MMC_CHECK(empty.size() == 2 && empty[1] == "0 0 0");
    std::remove(filename.c_str());
}

static void check_ply()
{
    const std::string filename = "test_io_mesh.ply";
    MMC_CHECK(writePLY(filename, two_triangles()));

    const std::vector<std::string> lines = read_lines(filename);
    MMC_CHECK(lines.size() == 9 + 6 + 2);
    if (lines.size() == 17)
    {
        MMC_CHECK(lines[0] == "ply");
        MMC_CHECK(lines[2] == "element vertex 6");
        MMC_CHECK(lines[6] == "element face 2");
        MMC_CHECK(lines[8] == "end_header");
        MMC_CHECK(lines[16] == "3 3 4 5");
    }
    std::remove(filename.c_str());
}

static void check_output_dispatch()
{
    MMC_PARAM mp;
    mp.output_format = "ply";
    mp.output_filename = "test_io_dispatch.ply";
    mp.indicator = false;
    MMC_CHECK(handle_output_mesh(mp, two_triangles()) == EXIT_SUCCESS);
    MMC_CHECK(read_lines(mp.output_filename).front() == "ply");
    std::remove(mp.output_filename.c_str());

    mp.output_format = "obj";
    MMC_CHECK(handle_output_mesh(mp, two_triangles()) == EXIT_FAILURE);

    // Unwritable paths are reported, not thrown.
    mp.output_format = "off";
    mp.output_filename = "no_such_directory/mesh.off";
    MMC_CHECK(handle_output_mesh(mp, two_triangles()) == EXIT_FAILURE);
    MMC_CHECK(!writePLY(mp.output_filename, two_triangles()));
}

static void check_nrrd()
{
    SampleGrid grid(Point(0, 0, 0), 0.5, 6);
    MetaballField field(Point(0, 0, 0), grid.width());
    field.add(Metaball(Point(1.2, 1.4, 1.7), Vector3(0, 0, 0), 0.6));
    grid.resample(field);

    const std::string filename = "test_io_field.nrrd";
    MMC_CHECK(write_field_nrrd(filename, grid));

    Nrrd *nrrd = nrrdNew();
    if (nrrdLoad(nrrd, filename.c_str(), NULL))
    {
        char *err = biffGetDone(NRRD);
        std::cerr << "Error reading NRRD file: " << err << std::endl;
        free(err);
        nrrdNuke(nrrd);
        MMC_CHECK(false);
        return;
    }

    MMC_CHECK(nrrd->dim == 3);
    MMC_CHECK(nrrd->type == nrrdTypeFloat);
    for (unsigned int a = 0; a < 3; ++a)
    {
        MMC_CHECK(nrrd->axis[a].size == 6);
        MMC_CHECK(nrrd->axis[a].spacing == 0.5);
        MMC_CHECK(nrrd->axis[a].min == 0.25);
    }

    const std::vector<float> expected = grid.center_samples();
    MMC_CHECK(nrrdElementNumber(nrrd) == expected.size());
    const float *data = static_cast<const float *>(nrrd->data);
    for (int z = 0; z < 6; ++z)
        for (int y = 0; y < 6; ++y)
            for (int x = 0; x < 6; ++x)
            {
                const int c = grid.coords_to_index(x, y, z);
                MMC_CHECK(data[z * 36 + y * 6 + x] == expected[c]);
            }

    nrrdNuke(nrrd);
    std::remove(filename.c_str());
}

int main()
{
    check_off();
    check_ply();
    check_output_dispatch();
    check_nrrd();
    return test_report("test_io");
}
