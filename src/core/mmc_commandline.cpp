#include "core/mmc_commandline.h"

#include <cstdlib>
#include <sstream>

//! Prints the help message for the program.
void print_help(std::ostream &out)
{
    out << "Usage: mmc [OPTIONS]\n\n";
    out << "Animates metaballs in a cubic domain and polygonizes their isosurface with marching cubes.\n\n";
    out << "OPTIONS:\n";
    out << "  -isolevel {value}           : Isolevel of the extracted surface (default: 1.0).\n";
    out << "  -min_radius {r}             : Smallest random metaball radius (default: 0.5).\n";
    out << "  -max_radius {r}             : Largest random metaball radius (default: 1.0).\n";
    out << "  -cell_width {w}             : Side length of a grid cell (default: 0.5).\n";
    out << "  -grid_res {n}               : Number of cells per axis (default: 10).\n";
    out << "  -grid_width {w}             : Side length of the domain, must equal cell_width * grid_res (default: 5.0).\n";
    out << "  -max_speed {s}              : Bound on the random initial velocity per axis (default: 0.5).\n";
    out << "  -num_balls {n}              : Number of metaballs (default: 5).\n";
    out << "  -frames {n}                 : Number of frames to step (default: 60).\n";
    out << "  -dt {s}                     : Time step per frame (default: 1/60).\n";
    out << "  -seed {n}                   : Random seed, 0 for a random seed (default: 0).\n";
    out << "  -o {output_filename}        : Mesh of the last frame (default: derived from the configuration).\n";
    out << "  -off                        : Generate output in .off format (default).\n";
    out << "  -ply                        : Generate output in .ply format.\n";
    out << "  -out_nrrd {nrrd_filename}   : Write the sampled field of the last frame to a NRRD file.\n";
    out << "  -visual_debug               : Report per-cell visibility to the console visualizer.\n";
    out << "  -debug                      : Print debug messages.\n";
    out << "  -quiet                      : Do not print progress messages.\n";
    out << "  -summary_stats              : Print summary statistics of the last frame.\n";
    out << "  -timing                     : Print the timing report.\n";
    out << "  --help                      : Print this help message.\n";
}

namespace
{

//! Converts an option value to a double, rejecting trailing characters.
double parse_double(const std::string &option, const std::string &text)
{
    std::istringstream in(text);
    double value = 0.0;
    char extra;
    if (!(in >> value) || (in >> extra))
    {
        throw std::invalid_argument("Option " + option + " expects a number, got '" + text + "'.");
    }
    return value;
}

//! Converts an option value to an int, rejecting trailing characters.
int parse_int(const std::string &option, const std::string &text)
{
    std::istringstream in(text);
    long value = 0;
    char extra;
    if (!(in >> value) || (in >> extra) ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
    {
        throw std::invalid_argument("Option " + option + " expects an integer, got '" + text + "'.");
    }
    return static_cast<int>(value);
}

//! Returns the value following option @p i, or throws if there is none.
std::string option_value(int argc, char *argv[], int &i)
{
    if (i + 1 >= argc)
    {
        throw std::invalid_argument(std::string("Missing value for option ") + argv[i] + ".");
    }
    return argv[++i];
}

} // namespace

//! Parses command-line arguments and configures program settings.
void parse_arguments(int argc, char *argv[], MMC_PARAM &mp)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "-isolevel")
        {
            mp.isolevel = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-min_radius")
        {
            mp.min_radius = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-max_radius")
        {
            mp.max_radius = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-cell_width")
        {
            mp.grid_cell_width = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-grid_res")
        {
            mp.grid_res = parse_int(arg, option_value(argc, argv, i));
        }
        else if (arg == "-grid_width")
        {
            mp.grid_width = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-max_speed")
        {
            mp.max_speed = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-num_balls")
        {
            mp.num_metaballs = parse_int(arg, option_value(argc, argv, i));
        }
        else if (arg == "-frames")
        {
            mp.num_frames = parse_int(arg, option_value(argc, argv, i));
        }
        else if (arg == "-dt")
        {
            mp.dt = parse_double(arg, option_value(argc, argv, i));
        }
        else if (arg == "-seed")
        {
            const int seed = parse_int(arg, option_value(argc, argv, i));
            if (seed < 0)
            {
                throw std::invalid_argument("Option -seed expects a non-negative integer.");
            }
            mp.seed = static_cast<unsigned int>(seed);
        }
        else if (arg == "-o")
        {
            mp.output_filename = option_value(argc, argv, i); // Set custom output filename.
        }
        else if (arg == "-off")
        {
            mp.output_format = "off";
        }
        else if (arg == "-ply")
        {
            mp.output_format = "ply";
        }
        else if (arg == "-out_nrrd")
        {
            mp.out_nrrd = true;
            mp.out_nrrd_name = option_value(argc, argv, i);
        }
        else if (arg == "-visual_debug")
        {
            mp.visual_debug = true;
        }
        else if (arg == "-debug")
        {
            mp.debug = true;
        }
        else if (arg == "-quiet")
        {
            mp.indicator = false;
        }
        else if (arg == "-summary_stats")
        {
            mp.summary_stats = true;
        }
        else if (arg == "-timing")
        {
            mp.timing = true;
        }
        else if (arg == "--help")
        {
            print_help(std::cout);
            exit(EXIT_SUCCESS);
        }
        else
        {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    // Generate default output filename if not specified.
    if (mp.output_filename.empty())
    {
        mp.output_filename = "metaballs_res-" + std::to_string(mp.grid_res) +
                             "_balls-" + std::to_string(mp.num_metaballs) +
                             "." + mp.output_format;
    }
}

//! Checks the construction-time constraints of a configuration.
void validate_parameters(const MMC_PARAM &mp)
{
    if (!(std::abs(mp.isolevel) <= FIELD_MAX_SAMPLE))
    {
        throw std::invalid_argument("isolevel must be a finite number of magnitude <= 1e300.");
    }
    if (!(mp.min_radius > 0.0))
    {
        throw std::invalid_argument("min_radius must be > 0.");
    }
    if (!(mp.min_radius <= mp.max_radius))
    {
        throw std::invalid_argument("min_radius must be <= max_radius.");
    }
    if (!(mp.grid_cell_width > 0.0))
    {
        throw std::invalid_argument("grid_cell_width must be > 0.");
    }
    if (!(mp.grid_width > 0.0))
    {
        throw std::invalid_argument("grid_width must be > 0.");
    }
    if (mp.grid_res <= 0)
    {
        throw std::invalid_argument("grid_res must be > 0.");
    }
    if (static_cast<long long>(mp.grid_res) * mp.grid_res * mp.grid_res > std::numeric_limits<int>::max())
    {
        throw std::invalid_argument("grid_res is too large: grid_res^3 cells must fit in an int.");
    }
    if (!nearly_equal(mp.grid_width, mp.grid_cell_width * mp.grid_res, GRID_WIDTH_REL_TOLERANCE))
    {
        std::ostringstream msg;
        msg << "grid_width (" << mp.grid_width << ") must equal grid_cell_width * grid_res ("
            << mp.grid_cell_width << " * " << mp.grid_res << " = " << mp.grid_cell_width * mp.grid_res << ").";
        throw std::invalid_argument(msg.str());
    }
    if (!(mp.max_speed >= 0.0))
    {
        throw std::invalid_argument("max_speed must be >= 0.");
    }
    if (mp.num_metaballs <= 0)
    {
        throw std::invalid_argument("num_metaballs must be > 0.");
    }
    // Bound of the field at a point where every ball is clamped.
    const double peak = mp.num_metaballs * (mp.max_radius * mp.max_radius / FIELD_MIN_SQUARED_DISTANCE);
    if (!(peak <= FIELD_MAX_SAMPLE))
    {
        throw std::invalid_argument("max_radius is too large: num_metaballs * max_radius^2 / 1e-12 must be <= 1e300.");
    }
    if (mp.num_frames <= 0)
    {
        throw std::invalid_argument("num_frames must be > 0.");
    }
    if (!(mp.dt >= 0.0))
    {
        throw std::invalid_argument("dt must be >= 0.");
    }
    if (mp.output_format != "off" && mp.output_format != "ply")
    {
        throw std::invalid_argument("Unsupported output format: " + mp.output_format);
    }
}
