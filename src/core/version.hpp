#pragma once

#ifndef CONDUCTOR_VERSION_STRING
#define CONDUCTOR_VERSION_STRING "0.1.0"
#endif

namespace conductor {

inline constexpr const char* kVersion = CONDUCTOR_VERSION_STRING;

}  // namespace conductor
