#include "core/mmc_utilities.h"

#include <CGAL/centroid.h>

//! Checks if a sample lies strictly above the isolevel.
bool is_above_isolevel(double value, double isolevel)
{
    return value > isolevel;
}

//! Checks if two scalar values are bipolar.
bool is_bipolar(double val1, double val2, double isolevel)
{
    return is_above_isolevel(val1, isolevel) != is_above_isolevel(val2, isolevel);
}

//! Compares two values with a relative tolerance.
bool nearly_equal(double a, double b, double rel_tol)
{
    const double scale = std::max(std::abs(a), std::abs(b));
    return std::abs(a - b) <= rel_tol * scale;
}

//! Computes the centroid of a set of points using CGAL.
Point compute_centroid(const std::vector<Point> &points)
{
    return CGAL::centroid(points.begin(), points.end());
}
