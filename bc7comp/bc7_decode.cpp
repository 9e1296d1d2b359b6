#include "bc7comp.h"
#include "bc7_bits.h"
#include "bc7_modes.h"
#include "bc7_tables.h"

#include <algorithm> // for std::swap
#include <cstring>

namespace bc7comp {

static inline int interpolate(int a, int b, const int* weights, int index)
{
    return (a * (64 - weights[index]) + b * weights[index] + 32) >> 6;
}

static inline int expand_to_byte(int v, int prec)
{
    v <<= 8 - prec;
    return v | (v >> prec);
}

void DecodeBlockBC7(const uint8_t block[16], uint8_t* dst, size_t pitch)
{
    bit_reader bstream(block);

    int mode = 0;
    while (mode < 8 && bstream.read_bit() == 0) mode++;

    // no mode bit in the first byte: transparent black
    if (mode == 8)
    {
        for (int i = 0; i < 4; i++)
            memset(dst + i * pitch, 0, 16);
        return;
    }

    const bc7_mode_info& info = g_bc7_modes[mode];

    int partition = info.partition_bits ? int(bstream.read_bits(info.partition_bits)) : 0;
    int rotation = info.rotation_bits ? int(bstream.read_bits(info.rotation_bits)) : 0;
    int selector = info.selector_bits ? int(bstream.read_bits(info.selector_bits)) : 0;

    int num_endpoints = info.subsets * 2;
    int endpoints[6][4];

    for (int c = 0; c < 3; c++)
    for (int i = 0; i < num_endpoints; i++)
        endpoints[i][c] = int(bstream.read_bits(info.color_bits));

    for (int i = 0; i < num_endpoints; i++)
        endpoints[i][3] = info.alpha_bits ? int(bstream.read_bits(info.alpha_bits)) : 0;

    if (info.pbits != BC7_PBIT_NONE)
    {
        for (int i = 0; i < num_endpoints; i++)
        for (int c = 0; c < 4; c++)
            endpoints[i][c] <<= 1;

        if (info.pbits == BC7_PBIT_SHARED)
        {
            for (int j = 0; j < info.subsets; j++)
            {
                int pbit = int(bstream.read_bit());
                for (int c = 0; c < 4; c++)
                {
                    endpoints[j * 2][c] |= pbit;
                    endpoints[j * 2 + 1][c] |= pbit;
                }
            }
        }
        else
        {
            for (int i = 0; i < num_endpoints; i++)
            {
                int pbit = int(bstream.read_bit());
                for (int c = 0; c < 4; c++) endpoints[i][c] |= pbit;
            }
        }
    }

    int color_prec = endpoint_bits(info);
    int alpha_prec = alpha_endpoint_bits(info);

    for (int i = 0; i < num_endpoints; i++)
    {
        for (int c = 0; c < 3; c++)
            endpoints[i][c] = expand_to_byte(endpoints[i][c], color_prec);

        endpoints[i][3] = alpha_prec ? expand_to_byte(endpoints[i][3], alpha_prec) : 255;
    }

    const uint8_t* subsets = nullptr;
    int skips[3] = { 0, 0, 0 };
    if (info.subsets == 2)
    {
        subsets = g_bc7_partition2[partition];
        get_skips(skips, partition);
    }
    if (info.subsets == 3)
    {
        subsets = g_bc7_partition3[partition];
        get_skips(skips, partition + 64);
    }

    // pass 1: primary indices, one bit less at each subset's fixup texel
    int indices[16];
    int subset_of[16];
    for (int k = 0; k < 16; k++)
    {
        int s = subsets ? subsets[k] : 0;
        bool fixup = (k == skips[s]);

        subset_of[k] = s;
        indices[k] = int(bstream.read_bits(fixup ? info.index_bits - 1 : info.index_bits));
    }

    // pass 2: interpolate
    const int* weights = get_weights(info.index_bits);
    const int* weights2 = info.index2_bits ? get_weights(info.index2_bits) : nullptr;

    for (int k = 0; k < 16; k++)
    {
        const int* e0 = endpoints[subset_of[k] * 2];
        const int* e1 = endpoints[subset_of[k] * 2 + 1];

        int r, g, b, a;
        if (weights2)
        {
            int index2 = int(bstream.read_bits(k == 0 ? info.index2_bits - 1 : info.index2_bits));

            const int* color_weights = selector ? weights2 : weights;
            const int* alpha_weights = selector ? weights : weights2;
            int color_index = selector ? index2 : indices[k];
            int alpha_index = selector ? indices[k] : index2;

            r = interpolate(e0[0], e1[0], color_weights, color_index);
            g = interpolate(e0[1], e1[1], color_weights, color_index);
            b = interpolate(e0[2], e1[2], color_weights, color_index);
            a = interpolate(e0[3], e1[3], alpha_weights, alpha_index);
        }
        else
        {
            r = interpolate(e0[0], e1[0], weights, indices[k]);
            g = interpolate(e0[1], e1[1], weights, indices[k]);
            b = interpolate(e0[2], e1[2], weights, indices[k]);
            a = interpolate(e0[3], e1[3], weights, indices[k]);
        }

        switch (rotation)
        {
        case 1: std::swap(a, r); break;
        case 2: std::swap(a, g); break;
        case 3: std::swap(a, b); break;
        default: break;
        }

        uint8_t* texel = dst + (k / 4) * pitch + (k % 4) * 4;
        texel[0] = uint8_t(r);
        texel[1] = uint8_t(g);
        texel[2] = uint8_t(b);
        texel[3] = uint8_t(a);
    }
}

} // namespace bc7comp
