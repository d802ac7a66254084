#include "field/mmc_metaball.h"

#include <random>

//! Contribution of one ball to the field at a point.
double Metaball::influence(const Point &point) const
{
    const double d2 = CGAL::squared_distance(point, position);
    return radius2() / std::max(d2, FIELD_MIN_SQUARED_DISTANCE);
}

//! Creates an empty field over the given domain.
MetaballField::MetaballField(const Point &domain_min, double domain_width)
    : domain_min_(domain_min), domain_width_(domain_width)
{
    if (!(domain_width > 0.0))
    {
        throw std::invalid_argument("MetaballField: domain width must be > 0.");
    }
}

//! Creates the randomized ball population of a run.
MetaballField MetaballField::setup_random(const MMC_PARAM &mp, const Point &domain_min)
{
    MetaballField field(domain_min, mp.grid_width);

    std::mt19937 rng(mp.seed != 0 ? mp.seed : std::random_device{}());
    std::uniform_real_distribution<double> unit(-1.0, 1.0);
    std::uniform_real_distribution<double> radius_dist(mp.min_radius, mp.max_radius);

    const double half = mp.grid_width / 2.0;
    const Point center(domain_min.x() + half, domain_min.y() + half, domain_min.z() + half);

    field.balls_.reserve(mp.num_metaballs);
    for (int i = 0; i < mp.num_metaballs; ++i)
    {
        const double vx = unit(rng) * mp.max_speed;
        const double vy = unit(rng) * mp.max_speed;
        const double vz = unit(rng) * mp.max_speed;
        field.add(Metaball(center, Vector3(vx, vy, vz), radius_dist(rng)));
    }

    if (mp.debug)
    {
        std::cout << "[DEBUG] ";
        field.Print(std::cout);
    }

    return field;
}

//! Adds a ball to the population.
void MetaballField::add(const Metaball &ball)
{
    if (!(ball.radius > 0.0))
    {
        throw std::invalid_argument("MetaballField: metaball radius must be > 0.");
    }
    if (!contains(ball.position))
    {
        throw std::invalid_argument("MetaballField: metaball position lies outside the domain.");
    }
    const double peak = peak_sample_ + ball.radius2() / FIELD_MIN_SQUARED_DISTANCE;
    if (!(peak <= FIELD_MAX_SAMPLE))
    {
        throw std::invalid_argument("MetaballField: metaball radius would let the field exceed FIELD_MAX_SAMPLE.");
    }
    peak_sample_ = peak;
    balls_.push_back(ball);
}

//! Evaluates the summed field at a point.
double MetaballField::evaluate(const Point &point) const
{
    double value = 0.0;
    for (const Metaball &ball : balls_)
    {
        value += ball.influence(point);
    }
    return value;
}

//! Checks whether a point lies in the closed domain.
bool MetaballField::contains(const Point &p) const
{
    const double lo[3] = {domain_min_.x(), domain_min_.y(), domain_min_.z()};
    for (int d = 0; d < 3; ++d)
    {
        if (p[d] < lo[d] || p[d] > lo[d] + domain_width_)
            return false;
    }
    return true;
}

//! Moves one coordinate and reflects it at the interval bounds.
double advance_with_bounce(double coord, double &speed, double dt, double lo, double hi)
{
    const double next = coord + speed * dt;
    if (next < lo)
    {
        speed = -speed;
        return lo;
    }
    if (next > hi)
    {
        speed = -speed;
        return hi;
    }
    return next;
}

//! Advances every ball and bounces it off the domain faces.
void MetaballField::step(double dt)
{
    const double lo[3] = {domain_min_.x(), domain_min_.y(), domain_min_.z()};

    for (Metaball &ball : balls_)
    {
        double pos[3] = {ball.position.x(), ball.position.y(), ball.position.z()};
        double vel[3] = {ball.velocity.x(), ball.velocity.y(), ball.velocity.z()};

        for (int d = 0; d < 3; ++d)
        {
            pos[d] = advance_with_bounce(pos[d], vel[d], dt, lo[d], lo[d] + domain_width_);
        }

        ball.position = Point(pos[0], pos[1], pos[2]);
        ball.velocity = Vector3(vel[0], vel[1], vel[2]);
    }
}
