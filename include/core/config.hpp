// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for core facilities.

// Global hardening switch for optional runtime assertions in hot paths
// (neighbour scans, per-round updates). Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

// Node index and count types shared by graphs, labelings and counters.
#ifndef CORE_INDEX_T
#define CORE_INDEX_T std::size_t
#endif
namespace core {
using index_t = CORE_INDEX_T;
using count_t = std::uint64_t;
}

// Defaults mirrored by the CLI (see cli/cli.hpp).
namespace core { namespace defaults {
inline constexpr std::size_t nodes      = 1000;
inline constexpr std::size_t attach     = 2;
inline constexpr std::size_t max_rounds = 50;
inline constexpr std::size_t trials     = 200;
inline constexpr std::uint64_t seed     = 42;
} }

// Lightweight ANSI color tokens for terminal output.
// Color 0 is the majority opinion (Blue), color 1 the minority (Red).
namespace core { namespace config {
inline constexpr const char* col0  = "\x1b[34m"; // blue for color 0
inline constexpr const char* col1  = "\x1b[31m"; // red  for color 1
inline constexpr const char* reset = "\x1b[0m";  // reset
} }
