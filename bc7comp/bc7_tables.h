#pragma once

#include <cstdint>

namespace bc7comp {

// Texel -> subset id for the 64 two-subset and 64 three-subset partitions.
extern const uint8_t g_bc7_partition2[64][16];
extern const uint8_t g_bc7_partition3[64][16];

// Part ids 0..63 are two-subset partitions, 64..127 three-subset ones.
// pattern: 2 bits per texel subset id, texel 0 in the low bits.
// pattern mask: low 16 bits subset 0, high 16 bits subset 1.
// skip: fixup texel of subset 1 in the high nibble, subset 2 in the low nibble.
extern const uint32_t g_bc7_pattern[128];
extern const uint32_t g_bc7_pattern_mask[128];
extern const uint8_t g_bc7_skip[128];

extern const int g_bc7_weights2[4];
extern const int g_bc7_weights3[8];
extern const int g_bc7_weights4[16];

inline uint32_t get_pattern(int part_id)
{
    return g_bc7_pattern[part_id];
}

inline uint32_t get_pattern_mask(int part_id, int j)
{
    uint32_t mask_packed = g_bc7_pattern_mask[part_id];
    uint32_t mask0 = mask_packed & 0xFFFF;
    uint32_t mask1 = mask_packed >> 16;

    if (j == 0) return mask0;
    if (j == 1) return mask1;
    return ~mask0 & ~mask1;
}

inline void get_skips(int skips[3], int part_id)
{
    int skip_packed = g_bc7_skip[part_id];
    skips[0] = 0;
    skips[1] = skip_packed >> 4;
    skips[2] = skip_packed & 15;
}

inline const int* get_weights(int bits)
{
    if (bits == 2) return g_bc7_weights2;
    if (bits == 3) return g_bc7_weights3;
    return g_bc7_weights4;
}

inline int get_unquant_value(int bits, int index)
{
    return get_weights(bits)[index];
}

} // namespace bc7comp
