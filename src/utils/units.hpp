#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// 90 -> "1m30s", 0 -> "0s"; at most maxUnits units, largest first
std::string seconds2human(uint64_t seconds, size_t maxUnits = 2);
