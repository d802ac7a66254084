#include "io/mmc_io.h"

#include <cstdlib>

namespace
{

void write_vertices(std::ostream &out, const TriangleList &triangles)
{
    for (const IsoTriangle &tri : triangles)
    {
        for (int i = 0; i < 3; ++i)
        {
            const Point &v = tri.vertex(i);
            out << v.x() << " " << v.y() << " " << v.z() << "\n";
        }
    }
}

void write_faces(std::ostream &out, const TriangleList &triangles)
{
    for (std::size_t t = 0; t < triangles.size(); ++t)
    {
        out << "3 " << 3 * t << " " << 3 * t + 1 << " " << 3 * t + 2 << "\n";
    }
}

} // namespace

//! Writes a triangle list in OFF format.
bool writeOFF(const std::string &filename, const TriangleList &triangles)
{
    std::ofstream out(filename);
    if (!out)
    {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }

    // Header
    out << "OFF\n";
    out << 3 * triangles.size() << " " << triangles.size() << " 0\n";

    write_vertices(out, triangles);
    write_faces(out, triangles);

    out.close();
    if (!out)
    {
        std::cerr << "Error writing file: " << filename << std::endl;
        return false;
    }
    return true;
}

//! Writes a triangle list in PLY format.
bool writePLY(const std::string &filename, const TriangleList &triangles)
{
    std::ofstream out(filename);
    if (!out)
    {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }

    // Write PLY header
    out << "ply\n";
    out << "format ascii 1.0\n";
    out << "element vertex " << 3 * triangles.size() << "\n";
    out << "property float x\n";
    out << "property float y\n";
    out << "property float z\n";
    out << "element face " << triangles.size() << "\n";
    out << "property list uchar int vertex_index\n";
    out << "end_header\n";

    write_vertices(out, triangles);
    write_faces(out, triangles);

    out.close();
    if (!out)
    {
        std::cerr << "Error writing file: " << filename << std::endl;
        return false;
    }
    return true;
}

//! Writes the center samples of a grid to a NRRD file.
bool write_field_nrrd(const std::string &filename, const SampleGrid &grid)
{
    std::vector<float> data = grid.center_samples();
    const std::size_t res = static_cast<std::size_t>(grid.resolution());
    const std::size_t size[3] = {res, res, res};

    const double half = 0.5 * grid.cell_width();
    const double spacing[3] = {grid.cell_width(), grid.cell_width(), grid.cell_width()};
    const double min[3] = {grid.origin().x() + half, grid.origin().y() + half, grid.origin().z() + half};

    // The nrrd only wraps `data`; nrrdNix releases the struct and leaves the samples alone.
    Nrrd *nrrd = nrrdNew();
    if (nrrdWrap_nva(nrrd, data.data(), nrrdTypeFloat, 3, size))
    {
        char *err = biffGetDone(NRRD);
        std::cerr << "Error wrapping field samples: " << err << std::endl;
        free(err);
        nrrdNix(nrrd);
        return false;
    }
    nrrdAxisInfoSet_nva(nrrd, nrrdAxisInfoSpacing, spacing);
    nrrdAxisInfoSet_nva(nrrd, nrrdAxisInfoMin, min);

    if (nrrdSave(filename.c_str(), nrrd, NULL))
    {
        char *err = biffGetDone(NRRD);
        std::cerr << "Error writing NRRD file: " << err << std::endl;
        free(err);
        nrrdNix(nrrd);
        return false;
    }

    nrrdNix(nrrd);
    return true;
}

//! Writes the mesh of the last frame in the configured format.
int handle_output_mesh(const MMC_PARAM &mp, const TriangleList &triangles)
{
    bool written = false;
    if (mp.output_format == "off")
    {
        written = writeOFF(mp.output_filename, triangles);
    }
    else if (mp.output_format == "ply")
    {
        written = writePLY(mp.output_filename, triangles);
    }
    else
    {
        std::cerr << "Unsupported output format: " << mp.output_format << std::endl;
        return EXIT_FAILURE;
    }

    if (!written)
        return EXIT_FAILURE;

    if (mp.indicator)
        std::cout << "Result file at: " << mp.output_filename << std::endl;
    return EXIT_SUCCESS;
}
