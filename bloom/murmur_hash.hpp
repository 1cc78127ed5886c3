#pragma once

#include <cstddef>
#include <cstdint>

// First 64-bit half of MurmurHash3 x64/128 with seed 0.
uint64_t murmur3_64(const void* data, size_t size);
