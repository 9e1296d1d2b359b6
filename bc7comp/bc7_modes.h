#pragma once

#include <cstdint>

namespace bc7comp {

enum bc7_pbit_kind {
    BC7_PBIT_NONE = 0,
    BC7_PBIT_SHARED,   // one per subset
    BC7_PBIT_UNIQUE    // one per endpoint
};

struct bc7_mode_info
{
    int subsets;
    int partition_bits;
    int color_bits;     // stored bits per color component, p-bit excluded
    int alpha_bits;     // 0 when the mode has no alpha
    bc7_pbit_kind pbits;
    int rotation_bits;
    int selector_bits;
    int index_bits;
    int index2_bits;    // 0 unless the mode has a separate alpha index stream
};

static const bc7_mode_info g_bc7_modes[8] = {
    //  sub pb  cb  ab  pbits            rot sel ib  ib2
    {   3,  4,  4,  0,  BC7_PBIT_UNIQUE, 0,  0,  3,  0 },
    {   2,  6,  6,  0,  BC7_PBIT_SHARED, 0,  0,  3,  0 },
    {   3,  6,  5,  0,  BC7_PBIT_NONE,   0,  0,  2,  0 },
    {   2,  6,  7,  0,  BC7_PBIT_UNIQUE, 0,  0,  2,  0 },
    {   1,  0,  5,  6,  BC7_PBIT_NONE,   2,  1,  2,  3 },
    {   1,  0,  7,  8,  BC7_PBIT_NONE,   2,  0,  2,  2 },
    {   1,  0,  7,  7,  BC7_PBIT_UNIQUE, 0,  0,  4,  0 },
    {   2,  6,  5,  5,  BC7_PBIT_UNIQUE, 0,  0,  2,  0 },
};

inline int pbit_count(const bc7_mode_info& info)
{
    if (info.pbits == BC7_PBIT_SHARED) return info.subsets;
    if (info.pbits == BC7_PBIT_UNIQUE) return info.subsets * 2;
    return 0;
}

// Endpoint precision after the p-bit is appended.
inline int endpoint_bits(const bc7_mode_info& info)
{
    return info.color_bits + (info.pbits != BC7_PBIT_NONE ? 1 : 0);
}

inline int alpha_endpoint_bits(const bc7_mode_info& info)
{
    if (info.alpha_bits == 0) return 0;
    return info.alpha_bits + (info.pbits != BC7_PBIT_NONE ? 1 : 0);
}

} // namespace bc7comp
