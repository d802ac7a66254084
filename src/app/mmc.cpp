#include "core/mmc.h"

int main(int argc, char *argv[])
{
    TimingStats& timer = TimingStats::instance();
    timer.start_timer("Total Processing");

    MMC_PARAM mmc_param;

    // Parse command-line arguments to set program options and parameters.
    try
    {
        parse_arguments(argc, argv, mmc_param);
        validate_parameters(mmc_param);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_help(std::cerr);
        return EXIT_FAILURE;
    }

    if (mmc_param.debug)
        mmc_param.Print(std::cout);

    // Populate the metaballs and allocate the sample grid.
    timer.start_timer("Setup", "Total Processing");
    std::unique_ptr<ConsoleVisualizer> visualizer;
    if (mmc_param.visual_debug)
    {
        visualizer = std::make_unique<ConsoleVisualizer>(std::cout, mmc_param.grid_res, mmc_param.debug);
    }
    FrameDriver driver(mmc_param, visualizer.get());
    timer.stop_timer("Setup");

    if (mmc_param.indicator)
    {
        std::cout << "[INFO] " << driver.field().size() << " metaballs, "
                  << mmc_param.grid_res << "^3 cells of width " << mmc_param.grid_cell_width << std::endl;
    }

    // Step the simulation; only the last frame's surface is kept.
    timer.start_timer("Frames", "Total Processing");
    TriangleList triangles;
    for (int f = 0; f < mmc_param.num_frames; ++f)
    {
        triangles = driver.step(mmc_param.dt);
        if (mmc_param.indicator && !mmc_param.debug &&
            ((f + 1) % 10 == 0 || f + 1 == mmc_param.num_frames))
        {
            std::cout << "[INFO] Frame " << (f + 1) << "/" << mmc_param.num_frames
                      << ": " << triangles.size() << " triangles" << std::endl;
        }
    }
    timer.stop_timer("Frames");

    if (mmc_param.debug)
    {
        std::cout << "[DEBUG] ";
        driver.grid().print_grid(std::cout);
    }

    timer.start_timer("Output", "Total Processing");
    int result = handle_output_mesh(mmc_param, triangles);
    if (result == EXIT_SUCCESS && mmc_param.out_nrrd)
    {
        if (!write_field_nrrd(mmc_param.out_nrrd_name, driver.grid()))
            result = EXIT_FAILURE;
        else if (mmc_param.indicator)
            std::cout << "Sampled field at: " << mmc_param.out_nrrd_name << std::endl;
    }
    timer.stop_timer("Output");

    timer.stop_timer("Total Processing");

    if (mmc_param.summary_stats)
        print_summary_report(driver.frame_stats(), std::cout);

    if (mmc_param.timing)
        timer.print_report(std::cout);

    return result;
}
