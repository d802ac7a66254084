#include "test/test_mmc.h"

// Command-line parsing and configuration defaults.

static MMC_PARAM parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "mmc");
    std::vector<char *> argv;
    for (std::string &a : args)
        argv.push_back(&a[0]);
    MMC_PARAM mp;
    parse_arguments(static_cast<int>(argv.size()), argv.data(), mp);
    return mp;
}

static bool rejected(const std::vector<std::string> &args)
{
    try
    {
        parse(args);
    }
    catch (const std::invalid_argument &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

static bool invalid(const MMC_PARAM &mp)
{
    try
    {
        validate_parameters(mp);
    }
    catch (const std::invalid_argument &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

int main()
{
    // Defaults describe a valid run.
    const MMC_PARAM defaults = parse({});
    MMC_CHECK(defaults.isolevel == 1.0);
    MMC_CHECK(defaults.grid_res == 10);
    MMC_CHECK(defaults.grid_cell_width == 0.5);
    MMC_CHECK(defaults.grid_width == 5.0);
    MMC_CHECK(defaults.num_metaballs == 5);
    MMC_CHECK(defaults.output_format == "off");
    MMC_CHECK(defaults.output_filename == "metaballs_res-10_balls-5.off");
    MMC_CHECK(defaults.indicator && !defaults.debug && !defaults.visual_debug);
    validate_parameters(defaults);

    const MMC_PARAM mp = parse({"-isolevel", "2.5", "-cell_width", "0.25", "-grid_res", "16",
                                "-grid_width", "4", "-num_balls", "3", "-seed", "7", "-ply",
                                "-frames", "12", "-dt", "0.05", "-visual_debug", "-quiet",
                                "-out_nrrd", "field_out.nrrd"});
    MMC_CHECK(mp.isolevel == 2.5);
    MMC_CHECK(mp.grid_cell_width == 0.25);
    MMC_CHECK(mp.grid_res == 16);
    MMC_CHECK(mp.grid_width == 4.0);
    MMC_CHECK(mp.num_metaballs == 3);
    MMC_CHECK(mp.seed == 7u);
    MMC_CHECK(mp.num_frames == 12);
    MMC_CHECK(mp.dt == 0.05);
    MMC_CHECK(mp.output_format == "ply");
    MMC_CHECK(mp.output_filename == "metaballs_res-16_balls-3.ply");
    MMC_CHECK(mp.visual_debug && !mp.indicator);
    MMC_CHECK(mp.out_nrrd && mp.out_nrrd_name == "field_out.nrrd");
    validate_parameters(mp);

    MMC_CHECK(parse({"-o", "custom.off", "-ply"}).output_filename == "custom.off");

    MMC_CHECK(rejected({"-unknown"}));
    MMC_CHECK(rejected({"-isolevel"}));
    MMC_CHECK(rejected({"-isolevel", "abc"}));
    MMC_CHECK(rejected({"-grid_res", "4.5"}));
    MMC_CHECK(rejected({"-seed", "-3"}));
    MMC_CHECK(rejected({"input.nrrd"}));

    // Parsing accepts the values; validation rejects the inconsistent width.
    const MMC_PARAM inconsistent = parse({"-grid_res", "20"});
    bool thrown = false;
    try { validate_parameters(inconsistent); }
    catch (const std::invalid_argument &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
        thrown = true;
    }
    MMC_CHECK(thrown);

    // Field samples must stay finite: radii and isolevel are bounded.
    MMC_CHECK(invalid(parse({"-min_radius", "1e154", "-max_radius", "1e154"})));
    MMC_CHECK(invalid(parse({"-max_radius", "1e144", "-num_balls", "5"})));
    MMC_CHECK(!invalid(parse({"-max_radius", "1e143", "-num_balls", "5"})));
    MMC_CHECK(invalid(parse({"-isolevel", "1e301"})));
    MMC_CHECK(invalid(parse({"-isolevel", "-1e301"})));
    MMC_CHECK(!invalid(parse({"-isolevel", "-1e300"})));

    // grid_res^3 cells must be indexable by an int.
    MMC_CHECK(invalid(parse({"-grid_res", "1291", "-cell_width", "1", "-grid_width", "1291"})));
    MMC_CHECK(!invalid(parse({"-grid_res", "1290", "-cell_width", "1", "-grid_width", "1290"})));

    return test_report("test_commandline");
}
