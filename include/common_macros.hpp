#pragma once

#include <cstdlib>
#include <iostream>

// ---------------------------------------------
// Define the macro to print messages conditionally
#ifdef DEBUG_BUILD
#define DEBUG_PRINT(...)                                                     \
  do {                                                                       \
    std::cerr << __VA_ARGS__ << std::endl;                                   \
  } while (0)
#else
#define DEBUG_PRINT(...)     // No operation
#endif

// -------------------------------------------------

#define DEVLAUNCH_VERBOSE_LOG(...)                     \
  do {                                                 \
    if (std::getenv("DEVLAUNCH_VERBOSE") != nullptr) { \
      std::cerr << __VA_ARGS__ << std::endl;           \
    }                                                  \
  } while (0)
