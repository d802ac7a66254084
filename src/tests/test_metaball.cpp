#include "test/test_mmc.h"

// Field evaluation, the singularity clamp, bouncing and the random population.

static bool approx(double a, double b, double tol = 1e-12)
{
    return std::abs(a - b) <= tol * std::max(1.0, std::abs(b));
}

static void check_field()
{
    MetaballField field(Point(0, 0, 0), 10.0);
    field.add(Metaball(Point(5, 5, 5), Vector3(0, 0, 0), 2.0));

    // R² / d² with d the true Euclidean distance.
    MMC_CHECK(approx(field.evaluate(Point(7, 5, 5)), 1.0));
    MMC_CHECK(approx(field.evaluate(Point(6, 6, 5)), 2.0));
    MMC_CHECK(approx(field.evaluate(Point(6, 6, 6)), 4.0 / 3.0));

    // Each axis enters on its own: offsets along z alone change the value.
    MMC_CHECK(approx(field.evaluate(Point(5, 5, 6)), 4.0));
    MMC_CHECK(approx(field.evaluate(Point(5, 5, 9)), 0.25));
    MMC_CHECK(!approx(field.evaluate(Point(5, 5, 6)), field.evaluate(Point(5, 5, 7))));

    // The ball center stays finite.
    const double at_center = field.evaluate(Point(5, 5, 5));
    MMC_CHECK(std::isfinite(at_center));
    MMC_CHECK(approx(at_center, 4.0 / FIELD_MIN_SQUARED_DISTANCE));

    // Contributions add up.
    field.add(Metaball(Point(1, 5, 5), Vector3(0, 0, 0), 1.0));
    MMC_CHECK(approx(field.evaluate(Point(3, 5, 5)), 4.0 / 4.0 + 1.0 / 4.0));
    MMC_CHECK(field.size() == 2);

    MetaballField empty(Point(0, 0, 0), 1.0);
    MMC_CHECK(empty.evaluate(Point(0.5, 0.5, 0.5)) == 0.0);
}

static void check_add_errors()
{
    MetaballField field(Point(0, 0, 0), 4.0);
    bool thrown = false;
    try { field.add(Metaball(Point(1, 1, 1), Vector3(0, 0, 0), 0.0)); }
    catch (const std::invalid_argument &) { thrown = true; }
    MMC_CHECK(thrown);

    thrown = false;
    try { field.add(Metaball(Point(1, 5, 1), Vector3(0, 0, 0), 1.0)); }
    catch (const std::invalid_argument &) { thrown = true; }
    MMC_CHECK(thrown);

    thrown = false;
    try { MetaballField bad(Point(0, 0, 0), 0.0); }
    catch (const std::invalid_argument &) { thrown = true; }
    MMC_CHECK(thrown);

    // A ball whose clamped peak exceeds FIELD_MAX_SAMPLE is refused.
    thrown = false;
    try { field.add(Metaball(Point(1, 1, 1), Vector3(0, 0, 0), 1e154)); }
    catch (const std::invalid_argument &) { thrown = true; }
    MMC_CHECK(thrown);
    MMC_CHECK(field.size() == 0);

    // The bound covers the sum over all balls.
    MetaballField crowded(Point(0, 0, 0), 4.0);
    int accepted = 0;
    thrown = false;
    try
    {
        for (int i = 0; i < 20; ++i)
        {
            crowded.add(Metaball(Point(2, 2, 2), Vector3(0, 0, 0), 3e143));
            ++accepted;
        }
    }
    catch (const std::invalid_argument &) { thrown = true; }
    MMC_CHECK(thrown);
    MMC_CHECK(accepted == 11);
    MMC_CHECK(crowded.size() == 11);
    const double peak = crowded.evaluate(Point(2, 2, 2));
    MMC_CHECK(std::isfinite(peak) && peak <= FIELD_MAX_SAMPLE);

    // Domain faces belong to the domain.
    field.add(Metaball(Point(0, 4, 4), Vector3(0, 0, 0), 1.0));
    MMC_CHECK(field.size() == 1);
}

static void check_bounce()
{
    double speed = 2.0;
    double x = advance_with_bounce(0.5, speed, 0.1, 0.0, 1.0);
    MMC_CHECK(approx(x, 0.7));
    MMC_CHECK(speed == 2.0);

    x = advance_with_bounce(0.9, speed, 0.1, 0.0, 1.0);
    MMC_CHECK(x == 1.0);
    MMC_CHECK(speed == -2.0);

    x = advance_with_bounce(0.1, speed, 0.1, 0.0, 1.0);
    MMC_CHECK(x == 0.0);
    MMC_CHECK(speed == 2.0);

    // Only the axis that crossed a face is reflected.
    MetaballField field(Point(0, 0, 0), 1.0);
    field.add(Metaball(Point(0.95, 0.5, 0.5), Vector3(1.0, 0.5, -0.5), 0.3));
    field.step(0.1);
    const Metaball &ball = field.balls()[0];
    MMC_CHECK(ball.position.x() == 1.0);
    MMC_CHECK(approx(ball.position.y(), 0.55));
    MMC_CHECK(approx(ball.position.z(), 0.45));
    MMC_CHECK(ball.velocity.x() == -1.0);
    MMC_CHECK(ball.velocity.y() == 0.5);
    MMC_CHECK(ball.velocity.z() == -0.5);

    // Zero time step leaves everything in place.
    field.step(0.0);
    MMC_CHECK(field.balls()[0].position.x() == 1.0);
}

static void check_random_population()
{
    MMC_PARAM mp;
    mp.num_metaballs = 40;
    mp.min_radius = 0.25;
    mp.max_radius = 0.75;
    mp.max_speed = 3.0;
    mp.grid_width = 5.0;
    mp.seed = 1234;

    MetaballField field = MetaballField::setup_random(mp, Point(0, 0, 0));
    MMC_CHECK(field.size() == 40);
    MMC_CHECK(field.domain_width() == 5.0);
    for (const Metaball &ball : field.balls())
    {
        MMC_CHECK(ball.radius >= mp.min_radius && ball.radius <= mp.max_radius);
        MMC_CHECK(std::abs(ball.velocity.x()) <= mp.max_speed);
        MMC_CHECK(std::abs(ball.velocity.y()) <= mp.max_speed);
        MMC_CHECK(std::abs(ball.velocity.z()) <= mp.max_speed);
        MMC_CHECK(ball.position == Point(2.5, 2.5, 2.5));
    }

    // The same seed gives the same population.
    MetaballField again = MetaballField::setup_random(mp, Point(0, 0, 0));
    for (std::size_t i = 0; i < field.size(); ++i)
    {
        MMC_CHECK(field.balls()[i].radius == again.balls()[i].radius);
        MMC_CHECK(field.balls()[i].velocity == again.balls()[i].velocity);
    }

    // Balls never leave the domain.
    for (int f = 0; f < 500; ++f)
    {
        field.step(1.0 / 30.0);
        for (const Metaball &ball : field.balls())
            MMC_CHECK(field.contains(ball.position));
    }
}

int main()
{
    check_field();
    check_add_errors();
    check_bounce();
    check_random_population();
    return test_report("test_metaball");
}
