/**
 * @brief Unit tests for the BC7 block and image decoder.
 */

#include <cstring>

#include "gtest/gtest.h"

#include "../bc7comp.h"

namespace bc7comp
{

// Decodes with a tight pitch and compares all 64 bytes.
static void expect_decodes_to(const uint8_t block[16], const uint8_t expected[64])
{
    uint8_t output[64];
    memset(output, 0xAB, sizeof(output));
    DecodeBlockBC7(block, output, 16);

    for (int i = 0; i < 64; i++)
        EXPECT_EQ(output[i], expected[i]) << "byte " << i;
}

/** @brief Mode 0, three subsets, a p-bit per endpoint. */
TEST(decode, mode0_fixture)
{
    static const uint8_t block[16] {
        0x39, 0xB4, 0xE6, 0x52, 0xE4, 0x4D, 0xA7, 0xF2,
        0x37, 0x0D, 0x9E, 0x26, 0x0E, 0x27, 0x13, 0x65
    };

    static const uint8_t expected[64] {
        0x4F, 0x21, 0x6E, 0xFF, 0x3F, 0xA1, 0xD1, 0xFF,
        0x36, 0x78, 0xBE, 0xFF, 0x8E, 0x6A, 0x80, 0xFF,
        0x10, 0x21, 0x52, 0xFF, 0x31, 0x63, 0xB5, 0xFF,
        0x52, 0xF7, 0xF7, 0xFF, 0x8E, 0x6A, 0x80, 0xFF,
        0x4F, 0x21, 0x6E, 0xFF, 0x49, 0xCD, 0xE4, 0xFF,
        0x36, 0x78, 0xBE, 0xFF, 0x8E, 0x6A, 0x80, 0xFF,
        0x10, 0x21, 0x52, 0xFF, 0x3A, 0x8D, 0xC8, 0xFF,
        0x3F, 0xA1, 0xD1, 0xFF, 0x80, 0x9D, 0x95, 0xFF
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 1, two subsets, a shared p-bit per subset. */
TEST(decode, mode1_fixture)
{
    static const uint8_t block[16] {
        0x52, 0xA4, 0xA3, 0xA6, 0xD0, 0x7F, 0x5C, 0x0C,
        0x33, 0x2F, 0x8B, 0x12, 0x24, 0x08, 0x3F, 0xD2
    };

    static const uint8_t expected[64] {
        0x7A, 0x77, 0x32, 0xFF, 0x93, 0x42, 0x32, 0xFF,
        0xAA, 0x27, 0xB8, 0xFF, 0xAA, 0x27, 0xB8, 0xFF,
        0x86, 0x5D, 0x32, 0xFF, 0x93, 0x42, 0x32, 0xFF,
        0x86, 0x5D, 0x32, 0xFF, 0xAA, 0x27, 0xB8, 0xFF,
        0x93, 0x42, 0x32, 0xFF, 0x86, 0x5D, 0x32, 0xFF,
        0x60, 0xAF, 0x32, 0xFF, 0x3A, 0xFF, 0x32, 0xFF,
        0x6D, 0x92, 0x32, 0xFF, 0x60, 0xAF, 0x32, 0xFF,
        0x60, 0xAF, 0x32, 0xFF, 0x47, 0xE4, 0x32, 0xFF
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 2, three subsets, no p-bits. */
TEST(decode, mode2_fixture)
{
    static const uint8_t block[16] {
        0x2C, 0x90, 0x2F, 0x89, 0x11, 0xE8, 0x18, 0x18,
        0xF8, 0xC9, 0x9D, 0x5D, 0x5D, 0x98, 0x31, 0x95
    };

    static const uint8_t expected[64] {
        0x7D, 0x7E, 0x83, 0xFF, 0x7D, 0x7E, 0x83, 0xFF,
        0x34, 0x43, 0xD9, 0xFF, 0x29, 0x63, 0xDE, 0xFF,
        0x42, 0x84, 0x7B, 0xFF, 0xF7, 0x73, 0x94, 0xFF,
        0x29, 0x63, 0xDE, 0xFF, 0x4A, 0x00, 0xCE, 0xFF,
        0x42, 0x84, 0x7B, 0xFF, 0xBC, 0x79, 0x8C, 0xFF,
        0x4D, 0x51, 0x86, 0xFF, 0x37, 0x8D, 0x9A, 0xFF,
        0xBC, 0x79, 0x8C, 0xFF, 0xBC, 0x79, 0x8C, 0xFF,
        0x63, 0x18, 0x73, 0xFF, 0x4D, 0x51, 0x86, 0xFF
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 3, two subsets, a p-bit per endpoint. */
TEST(decode, mode3_fixture)
{
    static const uint8_t block[16] {
        0x78, 0x04, 0xD9, 0x0E, 0x94, 0x5D, 0xE2, 0xE8,
        0xF5, 0x4E, 0xE7, 0x81, 0xCC, 0x75, 0xF6, 0x36
    };

    static const uint8_t expected[64] {
        0x9F, 0xAB, 0x6C, 0xFF, 0x9F, 0xAB, 0x6C, 0xFF,
        0xBC, 0x66, 0x5D, 0xFF, 0xD9, 0x25, 0x4F, 0xFF,
        0xBC, 0x66, 0x5D, 0xFF, 0xBC, 0x66, 0x5D, 0xFF,
        0xD9, 0x25, 0x4F, 0xFF, 0x1C, 0x1C, 0xCE, 0xFF,
        0xD9, 0x25, 0x4F, 0xFF, 0xBC, 0x66, 0x5D, 0xFF,
        0x50, 0x7A, 0x06, 0xFF, 0x2D, 0x3B, 0x8C, 0xFF,
        0xD9, 0x25, 0x4F, 0xFF, 0x3F, 0x5B, 0x48, 0xFF,
        0x2D, 0x3B, 0x8C, 0xFF, 0x1C, 0x1C, 0xCE, 0xFF
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 4, green and alpha swapped, the 3 bit indices drive color. */
TEST(decode, mode4_fixture)
{
    static const uint8_t block[16] {
        0xD0, 0x50, 0x99, 0x09, 0x5A, 0xA3, 0x00, 0x16,
        0x5A, 0x67, 0x03, 0x6F, 0x9B, 0x54, 0x0D, 0x6B
    };

    static const uint8_t expected[64] {
        0x7D, 0x34, 0x0F, 0x40, 0x84, 0x34, 0x00, 0x31,
        0x67, 0x34, 0x3E, 0x6F, 0x52, 0x34, 0x6B, 0x9C,
        0x59, 0x28, 0x5C, 0x8D, 0x59, 0x2C, 0x5C, 0x8D,
        0x59, 0x34, 0x5C, 0x8D, 0x67, 0x34, 0x3E, 0x6F,
        0x67, 0x30, 0x3E, 0x6F, 0x76, 0x28, 0x1E, 0x4F,
        0x60, 0x2C, 0x4D, 0x7E, 0x59, 0x2C, 0x5C, 0x8D,
        0x84, 0x28, 0x00, 0x31, 0x59, 0x34, 0x5C, 0x8D,
        0x76, 0x28, 0x1E, 0x4F, 0x6F, 0x2C, 0x2D, 0x5E
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 5, blue and alpha swapped. */
TEST(decode, mode5_fixture)
{
    static const uint8_t block[16] {
        0xE0, 0x0B, 0xE2, 0x11, 0x24, 0x17, 0x9C, 0x3D,
        0xD9, 0xF7, 0x38, 0x17, 0xCE, 0x6E, 0x11, 0x8D
    };

    static const uint8_t expected[64] {
        0x16, 0x8F, 0x5F, 0xE5, 0x89, 0x40, 0x4F, 0x04,
        0x63, 0x5A, 0x67, 0x4E, 0x89, 0x40, 0x4F, 0x04,
        0x89, 0x40, 0x57, 0x04, 0x63, 0x5A, 0x4F, 0x4E,
        0x89, 0x40, 0x57, 0x04, 0x3C, 0x75, 0x5F, 0x9B,
        0x16, 0x8F, 0x5F, 0xE5, 0x89, 0x40, 0x67, 0x04,
        0x3C, 0x75, 0x5F, 0x9B, 0x63, 0x5A, 0x67, 0x4E,
        0x89, 0x40, 0x5F, 0x04, 0x63, 0x5A, 0x4F, 0x4E,
        0x16, 0x8F, 0x67, 0xE5, 0x16, 0x8F, 0x57, 0xE5
    };

    expect_decodes_to(block, expected);
}

/** @brief Mode 6 block decoded with an 8 byte pitch, later rows overlap earlier ones. */
TEST(decode, mode6_fixture)
{
    static const uint8_t block[16] {
        0x40, 0xAF, 0xF6, 0x0B, 0xFD, 0x2E, 0xFF, 0xFF,
        0x11, 0x71, 0x10, 0xA1, 0x21, 0xF2, 0x33, 0x73
    };

    static const uint8_t expected[64] {
        0xBD, 0xBF, 0xBF, 0xFF, 0xBD, 0xBD, 0xBD, 0xFF,
        0xBD, 0xBF, 0xBF, 0xFF, 0xBD, 0xBD, 0xBD, 0xFF,
        0xBD, 0xBD, 0xBD, 0xFF, 0xBC, 0xBB, 0xB9, 0xFF,
        0xBB, 0xB9, 0xB7, 0xFF, 0xBB, 0xB9, 0xB7, 0xFF,
        0xBB, 0xB9, 0xB7, 0xFF, 0xB9, 0xB1, 0xAC, 0xFF,
    };

    uint8_t output[64] { 0 };
    DecodeBlockBC7(block, output, 8);

    for (int i = 0; i < 64; i++)
        EXPECT_EQ(output[i], expected[i]) << "byte " << i;
}

TEST(decode, mode7_fixture)
{
    static const uint8_t block[16] {
        0xC0, 0x8C, 0xEF, 0xA2, 0xBB, 0xDC, 0xFE, 0x7F,
        0x6C, 0x55, 0x6A, 0x34, 0x4F, 0x00, 0x5D, 0x00
    };

    static const uint8_t expected[64] {
        0x50, 0x4A, 0x48, 0xFE, 0x50, 0x4A, 0x48, 0xFE,
        0x64, 0x5D, 0x59, 0xFE, 0x50, 0x4A, 0x48, 0xFE,
        0x7C, 0x74, 0x6E, 0xFE, 0x46, 0x41, 0x3F, 0xFE,
        0x72, 0x6A, 0x65, 0xFE, 0x4A, 0x45, 0x43, 0xFE,
        0x32, 0x2E, 0x2E, 0xFE, 0x32, 0x2E, 0x2E, 0xFE,
    };

    uint8_t output[64] { 0 };
    DecodeBlockBC7(block, output, 8);

    for (int i = 0; i < 64; i++)
        EXPECT_EQ(output[i], expected[i]) << "byte " << i;
}

/** @brief A first byte without any mode bit decodes to transparent black. */
TEST(decode, invalid_mode_is_transparent_black)
{
    uint8_t block[16];
    memset(block, 0xFF, sizeof(block));
    block[0] = 0x00;

    uint8_t output[4 * 16];
    memset(output, 0xAB, sizeof(output));
    DecodeBlockBC7(block, output, 16);

    for (int i = 0; i < 64; i++)
        EXPECT_EQ(output[i], 0) << "byte " << i;
}

TEST(decode, decode_is_pure)
{
    static const uint8_t block[16] {
        0xC0, 0x8C, 0xEF, 0xA2, 0xBB, 0xDC, 0xFE, 0x7F,
        0x6C, 0x55, 0x6A, 0x34, 0x4F, 0x00, 0x5D, 0x00
    };

    uint8_t copy[16];
    memcpy(copy, block, sizeof(copy));

    uint8_t first[64];
    uint8_t second[64];
    memset(first, 0x11, sizeof(first));
    memset(second, 0x22, sizeof(second));

    DecodeBlockBC7(copy, first, 16);
    DecodeBlockBC7(copy, second, 16);

    EXPECT_EQ(memcmp(first, second, sizeof(first)), 0);
    EXPECT_EQ(memcmp(copy, block, sizeof(copy)), 0);
}

/** @brief Pitch larger than a block row leaves the gap untouched. */
TEST(decode, pitch_leaves_gap)
{
    static const uint8_t block[16] {
        0x40, 0xAF, 0xF6, 0x0B, 0xFD, 0x2E, 0xFF, 0xFF,
        0x11, 0x71, 0x10, 0xA1, 0x21, 0xF2, 0x33, 0x73
    };

    uint8_t output[4 * 32];
    memset(output, 0x5A, sizeof(output));
    DecodeBlockBC7(block, output, 32);

    for (int y = 0; y < 4; y++)
    {
        for (int i = 0; i < 16; i++)
            EXPECT_EQ(output[y * 32 + i + 3], 0xFF) << "alpha row " << y;
        for (int i = 16; i < 32; i++)
            EXPECT_EQ(output[y * 32 + i], 0x5A);
    }
}

TEST(decode, image_layout)
{
    // 8x4 image: left block invalid, right block the mode 6 fixture
    uint8_t blocks[32] { 0 };
    static const uint8_t mode6[16] {
        0x40, 0xAF, 0xF6, 0x0B, 0xFD, 0x2E, 0xFF, 0xFF,
        0x11, 0x71, 0x10, 0xA1, 0x21, 0xF2, 0x33, 0x73
    };
    memcpy(blocks + 16, mode6, 16);

    uint8_t image[8 * 4 * 4];
    memset(image, 0x77, sizeof(image));

    bc7_error status = DecompressBlocksBC7(blocks, sizeof(blocks), image, sizeof(image), 8, 4);
    ASSERT_EQ(status, BC7_SUCCESS);

    uint8_t reference[4 * 16];
    DecodeBlockBC7(mode6, reference, 16);

    for (int y = 0; y < 4; y++)
    {
        for (int i = 0; i < 16; i++)
        {
            EXPECT_EQ(image[y * 32 + i], 0);
            EXPECT_EQ(image[y * 32 + 16 + i], reference[y * 16 + i]);
        }
    }
}

TEST(decode, image_rejects_bad_sizes)
{
    uint8_t blocks[64] { 0 };
    uint8_t image[8 * 8 * 4];

    EXPECT_EQ(DecompressBlocksBC7(blocks, 64, image, sizeof(image), 6, 8), BC7_ERR_BAD_DIMENSIONS);
    EXPECT_EQ(DecompressBlocksBC7(blocks, 64, image, sizeof(image), 0, 8), BC7_ERR_BAD_DIMENSIONS);
    EXPECT_EQ(DecompressBlocksBC7(blocks, 48, image, sizeof(image), 8, 8), BC7_ERR_BAD_BUFFER_SIZE);
    EXPECT_EQ(DecompressBlocksBC7(blocks, 64, image, sizeof(image) - 4, 8, 8), BC7_ERR_BAD_BUFFER_SIZE);
    EXPECT_EQ(DecompressBlocksBC7(nullptr, 64, image, sizeof(image), 8, 8), BC7_ERR_BAD_PARAM);
    EXPECT_EQ(DecompressBlocksBC7(blocks, 64, image, sizeof(image), 8, 8), BC7_SUCCESS);
}

}
