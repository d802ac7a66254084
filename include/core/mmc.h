//! @file mmc.h
//! @brief Umbrella header that aggregates the public API for metaball surface extraction.
//! @details
//! Include this single header from applications to access the core building
//! blocks: types, command-line parsing, the metaball field, the sample grid,
//! marching-cubes polygonization, the frame driver and mesh I/O.

#ifndef MMC_H
#define MMC_H

#include "core/mmc_utilities.h"
#include "core/mmc_commandline.h"
#include "core/mmc_debug.h"
#include "core/mmc_stats.h"
#include "core/mmc_timing.h"
#include "field/mmc_metaball.h"
#include "grid/mmc_grid.h"
#include "processing/mmc_polygonize.h"
#include "processing/mmc_frame.h"
#include "io/mmc_io.h"
#include <cstdlib>
#include <memory>

#endif // MMC_H
