//! @file mmc_commandline.h
//! @brief Header file for the run configuration, command-line parsing and help messages.

#ifndef MMC_COMMANDLINE_H
#define MMC_COMMANDLINE_H

#include "core/mmc_type.h"
#include "core/mmc_utilities.h"

//! @brief Relative tolerance of the `grid_width == cell_width * grid_res` check.
static const double GRID_WIDTH_REL_TOLERANCE = 1e-6;

//! @brief Structure to hold top-level parameters parsed from command-line arguments.
/*!
 * This structure consolidates all configurable parameters for the program and
 * is passed explicitly to every component at construction; there are no
 * process-wide flags.
 */
struct MMC_PARAM {
    double isolevel;               //!< Threshold scalar for surface extraction.
    double min_radius;             //!< Lower bound of the random metaball radius.
    double max_radius;             //!< Upper bound of the random metaball radius.
    double grid_cell_width;        //!< Side length of one grid cell.
    double grid_width;             //!< Side length of the cubic domain.
    int grid_res;                  //!< Number of cells per axis.
    double max_speed;              //!< Bound on the random initial velocity per axis.
    int num_metaballs;             //!< Number of metaballs.
    bool visual_debug;             //!< Enables the visualization hooks.

    int num_frames;                //!< Number of frames the application steps.
    double dt;                     //!< Time step of one frame.
    unsigned int seed;             //!< Random seed; 0 seeds from std::random_device.
    std::string output_format;     //!< The format of the output file ("off" or "ply").
    std::string output_filename;   //!< Mesh file written after the last frame.
    std::string out_nrrd_name;     //!< NRRD file receiving the sampled field.

    bool out_nrrd;                 //!< Flag to enable exporting the sampled field to NRRD.
    bool debug = false;            //!< Guard: print [DEBUG] messages
    bool indicator = true;         //!< Guard: print [INFO] progress messages
    bool summary_stats = false;    //!< Guard: print summary statistics at the end of the run
    bool timing = false;           //!< Guard: print the timing report at the end of the run

    //! @brief Constructor to initialize default parameter values.
    MMC_PARAM()
        : isolevel(1.0),
          min_radius(0.5),
          max_radius(1.0),
          grid_cell_width(0.5),
          grid_width(5.0),
          grid_res(10),
          max_speed(0.5),
          num_metaballs(5),
          visual_debug(false),
          num_frames(60),
          dt(1.0 / 60.0),
          seed(0),
          output_format("off"),
          output_filename(""),
          out_nrrd_name("field.nrrd"),
          out_nrrd(false)
    {}

    //! @brief Print MMC parameters for debugging
    template <typename OSTREAM_TYPE>
    void Print(OSTREAM_TYPE & out) const {
        out << "MMC_PARAM:\n";
        out << "  Isolevel: " << isolevel << "\n";
        out << "  Radius range: [" << min_radius << ", " << max_radius << "]\n";
        out << "  Grid cell width: " << grid_cell_width << "\n";
        out << "  Grid width: " << grid_width << "\n";
        out << "  Grid res: " << grid_res << "\n";
        out << "  Max speed: " << max_speed << "\n";
        out << "  Num metaballs: " << num_metaballs << "\n";
        out << "  Visual debug: " << (visual_debug ? "true" : "false") << "\n";
        out << "  Frames: " << num_frames << "\n";
        out << "  dt: " << dt << "\n";
        out << "  Seed: " << seed << "\n";
        out << "  Output format: " << output_format << "\n";
        out << "  Output filename: " << output_filename << "\n";
        out << "  Out NRRD: " << (out_nrrd ? out_nrrd_name : "none") << "\n";
        out << "  Summary stats: " << (summary_stats ? "true" : "false") << "\n";
    }
};

//! @brief Prints the help message to the console.
/*!
 * This function outputs usage information and available options for the program.
 *
 * @param out The stream receiving the message.
 */
void print_help(std::ostream &out);

//! @brief Parses the command-line arguments to populate program parameters.
/*!
 * Every option starts with '-'; there are no positional arguments. `--help`
 * prints the help message and exits. A derived output filename is filled in
 * when `-o` is not given.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @param mp A reference to a `MMC_PARAM` object where parsed parameters are stored.
 * @throws std::invalid_argument on an unknown option, a missing option value
 *         or a malformed number.
 */
void parse_arguments(int argc, char *argv[], MMC_PARAM &mp);

//! @brief Checks the construction-time constraints of a configuration.
/*!
 * @param mp The parameters to check.
 * @throws std::invalid_argument naming the first violated constraint.
 */
void validate_parameters(const MMC_PARAM &mp);

#endif // MMC_COMMANDLINE_H
