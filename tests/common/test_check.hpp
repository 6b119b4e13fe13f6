#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helpers (active in every build type)
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                           \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

#define TEST_CHECK_EQ(a, b)                                                  \
    do {                                                                     \
        if (!((a) == (b))) {                                                 \
            std::cerr << "[TEST FAILED] " << #a << " == " << #b              \
                      << " (" << (a) << " vs " << (b) << ")"                 \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)
