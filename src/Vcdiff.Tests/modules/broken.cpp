#include "vcdiff/abi.h"

// vcdiff/broken: a shared library that loads fine but does not export the
// backend entry points.

extern "C" VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_broken_version() {
  return 1;
}
