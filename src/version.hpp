#pragma once

#ifndef CHIX_VERSION
#define CHIX_VERSION "0.1.0"
#endif

namespace chix {

constexpr const char* kVersion = CHIX_VERSION;

}  // namespace chix
