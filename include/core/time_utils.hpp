#pragma once

#include <cstdint>

namespace crane {

int64_t nowSteadyNs();
int64_t nowUnixMs();

}  // namespace crane
