/**
 * @brief Unit tests for the partition, fixup and mode tables.
 */

#include "gtest/gtest.h"

#include "../bc7_modes.h"
#include "../bc7_tables.h"

namespace bc7comp
{

static int subset_of(int part_id, int texel)
{
    if (part_id < 64) return g_bc7_partition2[part_id][texel];
    return g_bc7_partition3[part_id - 64][texel];
}

TEST(tables, pattern_matches_partition_tables)
{
    for (int part_id = 0; part_id < 128; part_id++)
    {
        uint32_t pattern = get_pattern(part_id);
        for (int k = 0; k < 16; k++)
            EXPECT_EQ(int((pattern >> (2 * k)) & 3), subset_of(part_id, k)) << "part " << part_id << " texel " << k;
    }
}

TEST(tables, pattern_masks_cover_each_texel_once)
{
    for (int part_id = 0; part_id < 128; part_id++)
    {
        int subsets = part_id < 64 ? 2 : 3;
        for (int k = 0; k < 16; k++)
        {
            int owner = subset_of(part_id, k);
            for (int j = 0; j < subsets; j++)
            {
                bool in_mask = ((get_pattern_mask(part_id, j) >> k) & 1) != 0;
                EXPECT_EQ(in_mask, owner == j) << "part " << part_id << " texel " << k;
            }
        }
    }
}

TEST(tables, fixup_texels_belong_to_their_subset)
{
    for (int part_id = 0; part_id < 128; part_id++)
    {
        int skips[3];
        get_skips(skips, part_id);

        EXPECT_EQ(skips[0], 0);
        EXPECT_EQ(subset_of(part_id, 0), 0);
        EXPECT_EQ(subset_of(part_id, skips[1]), 1) << "part " << part_id;

        if (part_id >= 64)
            EXPECT_EQ(subset_of(part_id, skips[2]), 2) << "part " << part_id;
    }
}

TEST(tables, known_partition_rows)
{
    static const uint8_t p2_13[16] = { 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 1, 1, 1, 1 };
    static const uint8_t p3_0[16] = { 0, 0, 1, 1, 0, 0, 1, 1, 0, 2, 2, 1, 2, 2, 2, 2 };
    static const uint8_t p3_63[16] = { 0, 1, 1, 1, 2, 0, 1, 1, 2, 2, 0, 1, 2, 2, 2, 0 };

    for (int k = 0; k < 16; k++)
    {
        EXPECT_EQ(g_bc7_partition2[13][k], p2_13[k]);
        EXPECT_EQ(g_bc7_partition3[0][k], p3_0[k]);
        EXPECT_EQ(g_bc7_partition3[63][k], p3_63[k]);
    }
}

TEST(tables, weights_are_symmetric)
{
    static const int bit_counts[] = { 2, 3, 4 };
    for (int bits : bit_counts)
    {
        int levels = 1 << bits;
        const int* weights = get_weights(bits);

        EXPECT_EQ(weights[0], 0);
        EXPECT_EQ(weights[levels - 1], 64);
        for (int i = 0; i < levels; i++)
            EXPECT_EQ(weights[i] + weights[levels - 1 - i], 64);
        for (int i = 1; i < levels; i++)
            EXPECT_GT(weights[i], weights[i - 1]);
    }

    EXPECT_EQ(get_unquant_value(3, 4), 37);
}

/** @brief Every mode layout fills exactly 128 bits. */
TEST(tables, mode_layouts_fill_128_bits)
{
    for (int mode = 0; mode < 8; mode++)
    {
        const bc7_mode_info& info = g_bc7_modes[mode];

        int bits = mode + 1;
        bits += info.partition_bits + info.rotation_bits + info.selector_bits;
        bits += info.subsets * 2 * (3 * info.color_bits + info.alpha_bits);
        bits += pbit_count(info);
        bits += 16 * info.index_bits - info.subsets;
        if (info.index2_bits) bits += 16 * info.index2_bits - 1;

        EXPECT_EQ(bits, 128) << "mode " << mode;
    }
}

TEST(tables, endpoint_precision)
{
    EXPECT_EQ(endpoint_bits(g_bc7_modes[0]), 5);
    EXPECT_EQ(endpoint_bits(g_bc7_modes[1]), 7);
    EXPECT_EQ(endpoint_bits(g_bc7_modes[4]), 5);
    EXPECT_EQ(alpha_endpoint_bits(g_bc7_modes[4]), 6);
    EXPECT_EQ(alpha_endpoint_bits(g_bc7_modes[6]), 8);
    EXPECT_EQ(alpha_endpoint_bits(g_bc7_modes[7]), 6);
    EXPECT_EQ(alpha_endpoint_bits(g_bc7_modes[3]), 0);
}

}
