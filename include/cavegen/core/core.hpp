// CaveGen Core
// core.hpp - Forward declarations and common includes

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace cavegen::core {

// Forward declarations
class Config;
class Logger;
class RandomSource;
class SeededRandom;

template <typename T>
struct Result;

inline constexpr const char* VERSION = "1.0.0";

}  // namespace cavegen::core
