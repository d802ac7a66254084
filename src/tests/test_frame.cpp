#include "test/test_mmc.h"
#include <sstream>

// End-to-end frames over a 4x4x4 grid of unit cells holding one metaball.

namespace
{

class RecordingHooks : public VisualizationHooks
{
public:
    int grid_toggles = 0;
    bool grid_visible = true;
    int cell_reports = 0;
    int visible_cells = 0;
    int frames = 0;
    std::size_t last_stats_visible = 0;

    void set_grid_visible(bool visible) override
    {
        ++grid_toggles;
        grid_visible = visible;
    }

    void set_cell_visible(int, bool visible) override
    {
        ++cell_reports;
        if (visible)
            ++visible_cells;
    }

    void frame_done(const FrameStats &stats) override
    {
        ++frames;
        last_stats_visible = stats.visible_cells;
    }
};

MMC_PARAM unit_grid_param(double isolevel)
{
    MMC_PARAM mp;
    mp.isolevel = isolevel;
    mp.grid_cell_width = 1.0;
    mp.grid_res = 4;
    mp.grid_width = 4.0;
    mp.num_metaballs = 1;
    return mp;
}

MetaballField single_ball(const Point &center, double radius, const Vector3 &velocity = Vector3(0, 0, 0))
{
    MetaballField field(Point(0, 0, 0), 4.0);
    field.add(Metaball(center, velocity, radius));
    return field;
}

bool threw_invalid_argument(const MMC_PARAM &mp)
{
    try
    {
        FrameDriver driver(mp);
    }
    catch (const std::invalid_argument &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

} // namespace

static void check_sphere()
{
    const Point center(2, 2, 2);
    MMC_PARAM mp = unit_grid_param(1.0);
    mp.summary_stats = true;
    FrameDriver driver(mp, single_ball(center, 1.5));
    const TriangleList triangles = driver.step(1.0 / 60.0);

    std::cout << "Sphere: " << triangles.size() << " triangles" << std::endl;
    MMC_CHECK(triangles.size() == 104);
    MMC_CHECK(driver.frame_count() == 1);

    for (const IsoTriangle &tri : triangles)
    {
        for (int i = 0; i < 3; ++i)
        {
            const double d = std::sqrt(CGAL::squared_distance(tri.vertex(i), center));
            MMC_CHECK(std::abs(d - 1.5) <= 0.3);
        }

        // Faces are wound toward the higher field, here the ball center.
        const Vector3 n = CGAL::cross_product(tri.vertex2 - tri.vertex1, tri.vertex3 - tri.vertex1);
        const Point c = CGAL::centroid(tri.vertex1, tri.vertex2, tri.vertex3);
        MMC_CHECK(n * (c - center) < -1e-9);
    }

    const FrameStats &stats = driver.frame_stats();
    MMC_CHECK(stats.frame == 1);
    MMC_CHECK(stats.iso_triangles == 104);
    MMC_CHECK(stats.cells == 64);
    MMC_CHECK(stats.has_field_stats);
    MMC_CHECK(stats.visible_cells == 8);
    MMC_CHECK(stats.field_evaluations == 64 * 9);
    MMC_CHECK(stats.has_surface);
    MMC_CHECK(CGAL::squared_distance(stats.surface_centroid, center) < 1e-18);
    print_summary_report(stats, std::cout);

    // The ball does not move, so the next frame repeats the surface.
    MMC_CHECK(driver.step(1.0 / 60.0).size() == 104);
}

static void check_high_isolevel()
{
    // Only the clamped sample at the lattice point under the ball center
    // exceeds 3.0; the surface stays within one cell of it.
    const Point center(2, 2, 2);
    FrameDriver spike(unit_grid_param(3.0), single_ball(center, 1.5));
    const TriangleList triangles = spike.step(0.0);
    MMC_CHECK(triangles.size() == 8);
    for (const IsoTriangle &tri : triangles)
    {
        for (int i = 0; i < 3; ++i)
            MMC_CHECK(CGAL::squared_distance(tri.vertex(i), center) <= 1.0 + 1e-12);
    }

    // Centered in a cell, the ball exceeds R² nowhere on the lattice.
    FrameDriver none(unit_grid_param(3.5), single_ball(Point(2.5, 2.5, 2.5), 1.5));
    MMC_CHECK(none.step(0.0).empty());
    MMC_CHECK(!none.frame_stats().has_surface);
    MMC_CHECK(none.frame_stats().active_cells == 0);
}

static void check_stats_gating()
{
    // Plain frames fill the polygonizer counters but skip the field pass.
    FrameDriver plain(unit_grid_param(1.0), single_ball(Point(2, 2, 2), 1.5));
    plain.step(0.0);
    const FrameStats &stats = plain.frame_stats();
    MMC_CHECK(stats.iso_triangles == 104);
    MMC_CHECK(stats.active_cells > 0 && stats.active_cells <= stats.cells);
    MMC_CHECK(stats.max_cell_triangles >= 1);
    MMC_CHECK(stats.max_cell_triangles <= static_cast<std::size_t>(MAX_CASE_TRIANGLES));
    MMC_CHECK(!stats.has_field_stats);
    MMC_CHECK(stats.visible_cells == 0);
    MMC_CHECK(stats.field_evaluations == 0);
    MMC_CHECK(!stats.has_surface);

    // Each active cell holds a corner on either side of the isolevel.
    std::size_t mixed = 0;
    for (const GridCell &cell : plain.grid().cells())
    {
        const int index = compute_cube_index(classify_corners(cell.samples, 1.0));
        if (index != 0 && index != NUM_CUBE_CASES - 1)
            ++mixed;
    }
    MMC_CHECK(stats.active_cells == mixed);

    // Debug frames dump each active cell and its polygon, then gather field stats.
    MMC_PARAM mp = unit_grid_param(1.0);
    mp.debug = true;
    FrameDriver verbose(mp, single_ball(Point(2, 2, 2), 1.5));
    MMC_CHECK(verbose.step(0.0).size() == 104);
    MMC_CHECK(verbose.frame_stats().active_cells == stats.active_cells);
    MMC_CHECK(verbose.frame_stats().has_field_stats);
    MMC_CHECK(verbose.frame_stats().visible_cells == 8);
}

static void check_pause()
{
    TimingStats::instance().reset();
    FrameDriver driver(unit_grid_param(1.0), single_ball(Point(2, 2, 2), 1.0, Vector3(1, 0, 0)));
    driver.step(0.5);
    MMC_CHECK(driver.field().balls()[0].position == Point(2.5, 2, 2));

    driver.pause();
    MMC_CHECK(driver.is_paused());
    MMC_CHECK(driver.step(0.5).empty());
    MMC_CHECK(driver.frame_count() == 1);
    MMC_CHECK(driver.field().balls()[0].position == Point(2.5, 2, 2));

    driver.resume();
    MMC_CHECK(!driver.is_paused());
    MMC_CHECK(!driver.step(0.5).empty());
    MMC_CHECK(driver.frame_count() == 2);
    MMC_CHECK(driver.field().balls()[0].position == Point(3, 2, 2));

    // Paused steps are not timed.
    TimingStats &timing = TimingStats::instance();
    MMC_CHECK(timing.runs("Frame step") == 2);
    MMC_CHECK(timing.runs("2. Resample grid") == 2);
    MMC_CHECK(timing.elapsed("Frame step") >= timing.elapsed("3. Polygonize cells"));
    MMC_CHECK(timing.runs("Output") == 0);
    timing.print_report(std::cout);
}

static void check_visualization()
{
    MMC_PARAM mp = unit_grid_param(1.0);
    mp.visual_debug = true;
    RecordingHooks hooks;
    FrameDriver driver(mp, single_ball(Point(2, 2, 2), 1.5), &hooks);

    // The eight cells around the ball center have center samples of 3.
    driver.step(0.0);
    MMC_CHECK(hooks.cell_reports == 64);
    MMC_CHECK(hooks.visible_cells == 8);
    MMC_CHECK(hooks.frames == 1);
    MMC_CHECK(hooks.last_stats_visible == 8);

    driver.hide();
    MMC_CHECK(!driver.is_grid_shown());
    MMC_CHECK(hooks.grid_toggles == 1 && !hooks.grid_visible);
    MMC_CHECK(driver.step(0.0).size() == 104);
    MMC_CHECK(hooks.cell_reports == 64);
    MMC_CHECK(hooks.frames == 1);

    driver.show();
    MMC_CHECK(driver.is_grid_shown());
    MMC_CHECK(hooks.grid_toggles == 2 && hooks.grid_visible);
    driver.step(0.0);
    MMC_CHECK(hooks.cell_reports == 128);
    MMC_CHECK(hooks.frames == 2);

    // Without visual debugging the hooks only hear show/hide.
    RecordingHooks quiet;
    FrameDriver plain(unit_grid_param(1.0), single_ball(Point(2, 2, 2), 1.5), &quiet);
    plain.step(0.0);
    MMC_CHECK(quiet.cell_reports == 0 && quiet.frames == 0);

    // Console rendition of the same frame.
    std::ostringstream out;
    ConsoleVisualizer console(out, mp.grid_res, true);
    FrameDriver printed(mp, single_ball(Point(2, 2, 2), 1.5), &console);
    printed.step(0.0);
    MMC_CHECK(console.num_visible() == 8);
    MMC_CHECK(console.cell_visible(printed.grid().coords_to_index(1, 1, 1)));
    MMC_CHECK(!console.cell_visible(printed.grid().coords_to_index(0, 0, 0)));
    MMC_CHECK(out.str().find("8/64") != std::string::npos);

    // A console sized for a smaller grid refuses cells it does not hold.
    std::ostringstream small_out;
    ConsoleVisualizer small(small_out, 2, false);
    bool out_of_range = false;
    try
    {
        small.set_cell_visible(8, true);
    }
    catch (const std::out_of_range &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
        out_of_range = true;
    }
    MMC_CHECK(out_of_range);

    out_of_range = false;
    try
    {
        small.set_cell_visible(-1, true);
    }
    catch (const std::out_of_range &)
    {
        out_of_range = true;
    }
    MMC_CHECK(out_of_range);

    out_of_range = false;
    FrameDriver mismatched(mp, single_ball(Point(2, 2, 2), 1.5), &small);
    try
    {
        mismatched.step(0.0);
    }
    catch (const std::out_of_range &)
    {
        out_of_range = true;
    }
    MMC_CHECK(out_of_range);
    MMC_CHECK(small.num_visible() <= 8);
}

static void check_configuration()
{
    MMC_CHECK(!threw_invalid_argument(unit_grid_param(1.0)));

    MMC_PARAM mp = unit_grid_param(1.0);
    mp.grid_width = 5.0;
    MMC_CHECK(threw_invalid_argument(mp));

    mp = unit_grid_param(std::numeric_limits<double>::quiet_NaN());
    MMC_CHECK(threw_invalid_argument(mp));

    mp = unit_grid_param(1.0);
    mp.grid_res = 0;
    MMC_CHECK(threw_invalid_argument(mp));

    mp = unit_grid_param(1.0);
    mp.min_radius = 2.0;
    mp.max_radius = 1.0;
    MMC_CHECK(threw_invalid_argument(mp));

    mp = unit_grid_param(1.0);
    mp.num_metaballs = 0;
    MMC_CHECK(threw_invalid_argument(mp));

    mp = unit_grid_param(1.0);
    mp.max_speed = -1.0;
    MMC_CHECK(threw_invalid_argument(mp));

    // Tiny rounding in the width is tolerated.
    mp = unit_grid_param(1.0);
    mp.grid_cell_width = 0.1;
    mp.grid_res = 30;
    mp.grid_width = 3.0;
    MMC_CHECK(!threw_invalid_argument(mp));

    // A field over a different domain is rejected.
    bool thrown = false;
    try
    {
        MetaballField other(Point(0, 0, 0), 8.0);
        other.add(Metaball(Point(1, 1, 1), Vector3(0, 0, 0), 1.0));
        FrameDriver driver(unit_grid_param(1.0), other);
    }
    catch (const std::invalid_argument &)
    {
        thrown = true;
    }
    MMC_CHECK(thrown);
}

static void check_random_run()
{
    MMC_PARAM mp;
    mp.seed = 42;
    FrameDriver driver(mp);
    MMC_CHECK(driver.field().size() == static_cast<std::size_t>(mp.num_metaballs));
    for (int f = 0; f < mp.num_frames; ++f)
    {
        const TriangleList triangles = driver.step(mp.dt);
        MMC_CHECK(driver.frame_stats().max_cell_triangles <= static_cast<std::size_t>(MAX_CASE_TRIANGLES));
        MMC_CHECK(triangles.size() == driver.frame_stats().iso_triangles);
        for (const Metaball &ball : driver.field().balls())
            MMC_CHECK(driver.field().contains(ball.position));
    }
    MMC_CHECK(driver.frame_count() == static_cast<std::size_t>(mp.num_frames));
}

int main()
{
    check_sphere();
    check_high_isolevel();
    check_stats_gating();
    check_pause();
    check_visualization();
    check_configuration();
    check_random_run();
    return test_report("test_frame");
}
