#ifndef HYMAT_LIBRARY_CONFIG_HPP
#define HYMAT_LIBRARY_CONFIG_HPP

#include <cstddef>

static constexpr bool HYMAT_OPENMP_ENABLED = true;
static constexpr size_t ThreadCount = 2;
static constexpr size_t BLOCK_SIZE = 64;

// Multiply kernels with fewer output rows than this stay serial.
static constexpr size_t HYMAT_PARALLEL_MIN_ROWS = 32;

// Default tolerance for Real and Complex comparisons.
static constexpr double HYMAT_DEFAULT_TOLERANCE = 1e-9;

#endif  // HYMAT_LIBRARY_CONFIG_HPP
