//! @file mmc_metaball.h
//! @brief Metaballs and the summed inverse-square scalar field they generate.

#ifndef MMC_METABALL_H
#define MMC_METABALL_H

#include "core/mmc_type.h"
#include "core/mmc_commandline.h"

//! @brief A moving point source of the scalar field.
struct Metaball
{
    Point position;   //!< Center of the ball (world coordinates).
    Vector3 velocity; //!< Displacement per unit time.
    double radius;    //!< Radius of influence, > 0.

    Metaball() : position(0, 0, 0), velocity(0, 0, 0), radius(1.0) {}
    Metaball(const Point &p, const Vector3 &v, double r) : position(p), velocity(v), radius(r) {}

    //! @brief Squared radius, the numerator of the falloff.
    double radius2() const { return radius * radius; }

    //! @brief Contribution of this ball to the field at @p point.
    double influence(const Point &point) const;

    //! @brief Print metaball for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE &out) const
    {
        out << "Metaball: position (" << position << "), velocity (" << velocity
            << "), radius " << radius << "\n";
    }
};

//! @brief The set of metaballs confined to a cubic domain.
/*!
 * The field value at a point is the sum over all balls of
 * `radius² / squared_distance(point, position)`. Balls move along straight
 * lines and bounce elastically off the six faces of
 * `[domain_min, domain_min + domain_width]³`.
 */
class MetaballField
{
public:
    //! @brief Creates an empty field over the given domain.
    /*!
     * @param domain_min Lower corner of the domain.
     * @param domain_width Side length of the domain.
     * @throws std::invalid_argument if `domain_width <= 0`.
     */
    MetaballField(const Point &domain_min, double domain_width);

    //! @brief Creates the randomized ball population described by @p mp.
    /*!
     * Every ball starts at the domain center. Velocity components are drawn
     * uniformly from `[-max_speed, max_speed]` and radii from
     * `[min_radius, max_radius]`.
     *
     * @param mp Validated run configuration.
     * @param domain_min Lower corner of the domain.
     * @return The populated field.
     */
    static MetaballField setup_random(const MMC_PARAM &mp, const Point &domain_min);

    //! @brief Adds a ball to the population.
    /*!
     * @throws std::invalid_argument if the radius is not positive, the
     *         position lies outside the domain, or the clamped field of all
     *         balls could exceed `FIELD_MAX_SAMPLE`.
     */
    void add(const Metaball &ball);

    //! @brief Evaluates the summed field at @p point.
    double evaluate(const Point &point) const;

    //! @brief Advances every ball by @p dt and bounces it off the domain faces.
    void step(double dt);

    //! @brief Checks whether @p p lies in the closed domain.
    bool contains(const Point &p) const;

    const std::vector<Metaball> &balls() const { return balls_; }
    std::size_t size() const { return balls_.size(); }
    const Point &domain_min() const { return domain_min_; }
    double domain_width() const { return domain_width_; }

    //! @brief Print field for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE &out) const
    {
        out << "MetaballField: " << balls_.size() << " ball(s), domain min ("
            << domain_min_ << "), width " << domain_width_ << "\n";
        for (const Metaball &ball : balls_)
        {
            out << "  ";
            ball.Print(out);
        }
    }

private:
    std::vector<Metaball> balls_;
    Point domain_min_;
    double domain_width_;
    double peak_sample_ = 0.0; //!< Sum of the clamped peaks of all balls.
};

//! @brief Moves one coordinate and reflects it at the interval bounds.
/*!
 * Computes `coord + speed * dt`. If the result leaves `[lo, hi]` it is
 * clamped to the bound it crossed and @p speed is negated.
 *
 * @param coord Coordinate before the step.
 * @param speed Velocity component; negated on a bounce.
 * @param dt Time step.
 * @param lo Lower bound of the interval.
 * @param hi Upper bound of the interval.
 * @return The coordinate after the step.
 */
double advance_with_bounce(double coord, double &speed, double dt, double lo, double hi);

#endif // MMC_METABALL_H
