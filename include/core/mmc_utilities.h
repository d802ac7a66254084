//! @file mmc_utilities.h
//! @brief Utility functions for isolevel classification, tolerant comparison and centroid calculations.

#ifndef MMC_UTILITIES_H
#define MMC_UTILITIES_H

#include "core/mmc_type.h"

//! @brief Checks if a sample lies strictly above the isolevel.
/*!
 * This is the single classification rule used for cube indices and for
 * visibility gating.
 *
 * @param value The sampled scalar value.
 * @param isolevel The isolevel.
 * @return `true` if `value > isolevel`, otherwise `false`.
 */
bool is_above_isolevel(double value, double isolevel);

//! @brief Checks if two scalar values are bipolar with respect to an isolevel.
/*!
 * Determines if exactly one of the two values is above the isolevel, i.e.
 * whether the isosurface crosses the edge joining them.
 *
 * @param val1 First scalar value.
 * @param val2 Second scalar value.
 * @param isolevel The isolevel used for comparison.
 * @return `true` if the values are bipolar, otherwise `false`.
 */
bool is_bipolar(double val1, double val2, double isolevel);

//! @brief Compares two values with a relative tolerance.
/*!
 * @param a First value.
 * @param b Second value.
 * @param rel_tol Tolerance relative to the larger magnitude.
 * @return `true` if `|a - b| <= rel_tol * max(|a|, |b|)`.
 */
bool nearly_equal(double a, double b, double rel_tol);

//! @brief Computes the centroid of a set of points using CGAL.
/*!
 * @param points Vector of points to compute the centroid for (must be non-empty).
 * @return The computed centroid as a Point.
 */
Point compute_centroid(const std::vector<Point> &points);

#endif // MMC_UTILITIES_H
