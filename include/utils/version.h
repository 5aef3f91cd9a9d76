#pragma once

#ifndef PACA_VERSION
#define PACA_VERSION "0.1.0"
#endif

namespace paca {

inline const char* version() { return PACA_VERSION; }

}  // namespace paca
