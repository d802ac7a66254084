//! @file mmc_type.h
//! @brief Type definitions and includes for metaball field sampling and marching-cubes polygonization.

#ifndef MMC_TYPE_H
#define MMC_TYPE_H

// Standard library headers for various utilities.
#include <iostream>  // Input and output stream.
#include <fstream>   // File stream for reading and writing files.
#include <vector>    // STL vector container.
#include <array>     // STL array container.
#include <cmath>     // Math functions like abs(), sqrt(), etc.
#include <limits>    // To work with numeric limits of data types.
#include <string>
#include <algorithm> // Common algorithms like min(), max().
#include <cstddef>   // Definitions for size_t, ptrdiff_t, etc.
#include <iomanip>   // For formatted output (e.g., precision control).
#include <stdexcept> // Exceptions reported on invalid construction parameters.

// CGAL headers for computational geometry operations.
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h> // Kernel for exact predicates and inexact constructions.
#include <CGAL/Vector_3.h>                                      // Represents a vector in 3D space.
#include <CGAL/squared_distance_3.h>                            // Squared distance between 3D objects.

//! @brief CGAL Kernel.
/*!
 * Provides geometric primitives like points and vectors with
 * exact predicates and inexact constructions.
 */
typedef CGAL::Exact_predicates_inexact_constructions_kernel K;

//! @brief Represents a point in 3D space.
typedef K::Point_3 Point;

//! @brief Represents a vector in 3D space.
/*!
 * Vectors are used for velocities, translations and other vector operations.
 */
typedef K::Vector_3 Vector3;

//! @brief Floor of the squared distance used in field evaluation.
/*!
 * A sample point closer than `sqrt(FIELD_MIN_SQUARED_DISTANCE)` to a ball
 * center contributes `radius² / FIELD_MIN_SQUARED_DISTANCE`, a large but
 * finite value.
 */
static const double FIELD_MIN_SQUARED_DISTANCE = 1e-12;

//! @brief Largest field value a configuration may produce.
/*!
 * Runs whose clamped samples could exceed this bound are rejected, so corner
 * samples and their differences stay finite.
 */
static const double FIELD_MAX_SAMPLE = 1e300;

//! @brief Represents a triangle of the reconstructed isosurface.
/*!
 * Vertices are in world space. The vertex order is the order given by the
 * triangle table and sets the triangle winding.
 */
struct IsoTriangle
{
    Point vertex1;
    Point vertex2;
    Point vertex3;

    IsoTriangle() {}
    IsoTriangle(const Point &v1, const Point &v2, const Point &v3)
        : vertex1(v1), vertex2(v2), vertex3(v3) {}

    //! @brief Access vertex @p i (0, 1 or 2).
    const Point &vertex(int i) const
    {
        return (i == 0) ? vertex1 : ((i == 1) ? vertex2 : vertex3);
    }

    //! @brief Print triangle for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE &out) const
    {
        out << "IsoTriangle: (" << vertex1 << ") (" << vertex2 << ") (" << vertex3 << ")\n";
    }
};

//! @brief Triangle soup produced for one frame.
typedef std::vector<IsoTriangle> TriangleList;

//! @brief Structure for comparing points for approximate equality.
/*!
 * Compares points coordinate-wise with a small epsilon tolerance to handle
 * floating-point precision issues.
 */
struct PointApproxEqual
{
    double eps = 1e-9;

    bool operator()(const Point &p1, const Point &p2) const
    {
        return (std::abs(p1.x() - p2.x()) < eps) &&
               (std::abs(p1.y() - p2.y()) < eps) &&
               (std::abs(p1.z() - p2.z()) < eps);
    }
};

#endif // MMC_TYPE_H
