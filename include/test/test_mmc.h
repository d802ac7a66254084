//! @file test_mmc.h
//! @brief Test harness header for the metaball surface test programs.
//! @details
//! Includes the umbrella header and provides a failure counter so each test
//! program can report its checks and exit non-zero when one fails.

#ifndef TEST_MMC_H
#define TEST_MMC_H

#include "core/mmc.h"

//! @brief Number of failed checks in the running test program.
inline int &test_failures()
{
    static int failures = 0;
    return failures;
}

//! @brief Records the result of one check, printing it on failure.
inline void test_check(bool passed, const char *expr, const char *file, int line)
{
    if (!passed)
    {
        ++test_failures();
        std::cerr << "[FAIL] " << file << ":" << line << ": " << expr << std::endl;
    }
}

//! @brief Prints the outcome of a test program and returns its exit code.
inline int test_report(const char *name)
{
    if (test_failures() == 0)
    {
        std::cout << name << " completed." << std::endl;
        return EXIT_SUCCESS;
    }
    std::cout << name << ": " << test_failures() << " check(s) failed." << std::endl;
    return EXIT_FAILURE;
}

#define MMC_CHECK(cond) test_check((cond), #cond, __FILE__, __LINE__)

#endif // TEST_MMC_H
