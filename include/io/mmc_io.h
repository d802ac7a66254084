//! @file mmc_io.h
//! @brief Header file for mesh and sampled-field export.

#ifndef MMC_IO_H
#define MMC_IO_H

#include <teem/nrrd.h> // Teem library for handling NRRD data files.

#include "core/mmc_commandline.h"
#include "core/mmc_type.h"
#include "grid/mmc_grid.h"

//! @brief Writes a triangle list in OFF format.
/*!
 * The mesh is written as a triangle soup: every triangle contributes its own
 * three vertices and the face `3 3t 3t+1 3t+2`.
 *
 * @param filename The output file path.
 * @param triangles The triangles of one frame.
 * @return `false` if the file cannot be opened or written.
 */
bool writeOFF(const std::string &filename, const TriangleList &triangles);

//! @brief Writes a triangle list in ASCII PLY format.
/*!
 * Same vertex layout as writeOFF().
 *
 * @param filename The output file path.
 * @param triangles The triangles of one frame.
 * @return `false` if the file cannot be opened or written.
 */
bool writePLY(const std::string &filename, const TriangleList &triangles);

//! @brief Writes the center samples of a grid to a NRRD file.
/*!
 * The volume holds one float per cell, x fastest, with axis spacing equal to
 * the cell width and axis minimum at the center of cell (0,0,0).
 *
 * @param filename The output file path (`.nrrd` or `.nhdr`).
 * @param grid The sampled grid.
 * @return `false` if teem fails to write the file.
 */
bool write_field_nrrd(const std::string &filename, const SampleGrid &grid);

//! @brief Writes the mesh of the last frame in the configured format.
/*!
 * @param mp Run configuration providing the format and file name.
 * @param triangles The triangles to write.
 * @return EXIT_SUCCESS on success, EXIT_FAILURE on error
 */
int handle_output_mesh(const MMC_PARAM &mp, const TriangleList &triangles);

#endif // MMC_IO_H
