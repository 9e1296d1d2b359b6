/**
 * @brief Unit tests for the BC7 encoder and its image entry points.
 */

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../bc7comp.h"

namespace bc7comp
{

typedef void (*profile_fn)(bc7_enc_settings*);

static const profile_fn all_profiles[] {
    GetProfile_ultrafast, GetProfile_veryfast, GetProfile_fast, GetProfile_basic, GetProfile_slow,
    GetProfile_alpha_ultrafast, GetProfile_alpha_veryfast, GetProfile_alpha_fast, GetProfile_alpha_basic,
    GetProfile_alpha_slow
};

// Gradient with noise, alpha falling off to the right.
static std::vector<uint8_t> make_test_image(int width, int height, uint32_t seed)
{
    std::vector<uint8_t> pixels(size_t(width) * height * 4);
    uint32_t state = seed;
    auto next = [&state]() {
        state = state * 1664525u + 1013904223u;
        return int((state >> 24) & 31);
    };

    for (int y = 0; y < height; y++)
    {
        for (int x = 0; x < width; x++)
        {
            uint8_t* p = &pixels[(size_t(y) * width + x) * 4];
            p[0] = uint8_t(std::min(255, x * 12 + next()));
            p[1] = uint8_t(std::min(255, y * 14 + next()));
            p[2] = uint8_t(std::min(255, (x + y) * 6 + next()));
            p[3] = uint8_t(std::max(0, 255 - x * 8 - next()));
        }
    }
    return pixels;
}

static double block_error(const uint8_t* a, const uint8_t* b, int channels)
{
    double err = 0;
    for (int k = 0; k < 16; k++)
    {
        for (int p = 0; p < channels; p++)
        {
            int d = int(a[k * 4 + p]) - int(b[k * 4 + p]);
            err += d * d;
        }
    }
    return err;
}

static double image_error(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b, int channels, int* max_diff)
{
    double err = 0;
    *max_diff = 0;
    for (size_t i = 0; i < a.size(); i++)
    {
        if (int(i % 4) >= channels) continue;
        int d = std::abs(int(a[i]) - int(b[i]));
        err += d * d;
        *max_diff = std::max(*max_diff, d);
    }
    return err;
}

static std::vector<uint8_t> extract_block(const std::vector<uint8_t>& image, int width, int bx, int by)
{
    std::vector<uint8_t> block(64);
    for (int y = 0; y < 4; y++)
        memcpy(&block[y * 16], &image[((size_t(by) * 4 + y) * width + bx * 4) * 4], 16);
    return block;
}

TEST(encode, solid_colors_round_trip)
{
    static const uint8_t colors[][4] {
        { 0, 0, 0, 0 }, { 255, 255, 255, 255 }, { 12, 200, 77, 255 }, { 128, 64, 32, 100 }, { 1, 2, 3, 4 }
    };

    for (profile_fn profile : all_profiles)
    {
        bc7_enc_settings settings;
        profile(&settings);

        for (const auto& color : colors)
        {
            uint8_t pixels[64];
            for (int k = 0; k < 16; k++) memcpy(&pixels[k * 4], color, 4);

            uint8_t block[16];
            CompressBlockBC7(pixels, 16, &settings, block);

            uint8_t decoded[64];
            DecodeBlockBC7(block, decoded, 16);

            for (int k = 0; k < 16; k++)
                for (int p = 0; p < settings.channels; p++)
                    EXPECT_LE(std::abs(int(decoded[k * 4 + p]) - int(color[p])), 1);
        }
    }
}

TEST(encode, zero_image_decodes_to_zero)
{
    const int width = 8, height = 8;
    std::vector<uint8_t> pixels(width * height * 4, 0);
    rgba_surface surface { pixels.data(), width, height, width * 4 };

    bc7_enc_settings settings;
    GetProfile_alpha_basic(&settings);

    std::vector<uint8_t> blocks(BlocksByteSize(width, height));
    ASSERT_EQ(CompressBlocksBC7(&surface, blocks.data(), blocks.size(), &settings), BC7_SUCCESS);

    std::vector<uint8_t> decoded(pixels.size(), 0xCD);
    ASSERT_EQ(DecompressBlocksBC7(blocks.data(), blocks.size(), decoded.data(), decoded.size(), width, height), BC7_SUCCESS);

    EXPECT_EQ(decoded, pixels);
}

/** @brief The returned error is the squared error of what the decoder reconstructs. */
TEST(encode, error_estimate_matches_decoder)
{
    const int width = 16, height = 16;
    std::vector<uint8_t> image = make_test_image(width, height, 12345);

    for (profile_fn profile : all_profiles)
    {
        bc7_enc_settings settings;
        profile(&settings);

        for (int by = 0; by < height / 4; by++)
        {
            for (int bx = 0; bx < width / 4; bx++)
            {
                std::vector<uint8_t> pixels = extract_block(image, width, bx, by);

                uint8_t block[16];
                float estimate = CompressBlockBC7(pixels.data(), 16, &settings, block);

                uint8_t decoded[64];
                DecodeBlockBC7(block, decoded, 16);
                double actual = block_error(pixels.data(), decoded, settings.channels);

                if (settings.channels == 4)
                    EXPECT_NEAR(estimate, actual, 0.5 + actual * 1e-4);
                else
                    EXPECT_LE(actual, estimate + 0.5 + actual * 1e-4);
            }
        }
    }
}

TEST(encode, image_error_total_matches_decoder)
{
    const int width = 16, height = 16;
    std::vector<uint8_t> image = make_test_image(width, height, 12345);
    rgba_surface surface { image.data(), width, height, width * 4 };

    bc7_enc_settings settings;
    GetProfile_alpha_fast(&settings);

    std::vector<uint8_t> blocks(BlocksByteSize(width, height));
    double total = -1;
    ASSERT_EQ(CompressBlocksBC7_Error(&surface, blocks.data(), blocks.size(), &settings, &total), BC7_SUCCESS);

    std::vector<uint8_t> decoded(image.size());
    ASSERT_EQ(DecompressBlocksBC7(blocks.data(), blocks.size(), decoded.data(), decoded.size(), width, height), BC7_SUCCESS);

    int max_diff = 0;
    double actual = image_error(image, decoded, 4, &max_diff);
    EXPECT_NEAR(total, actual, 1.0 + actual * 1e-4);
    EXPECT_LE(max_diff, 64);
}

TEST(encode, slow_profile_beats_basic)
{
    const int width = 16, height = 16;
    std::vector<uint8_t> image = make_test_image(width, height, 12345);
    rgba_surface surface { image.data(), width, height, width * 4 };

    bc7_enc_settings basic, slow;
    GetProfile_basic(&basic);
    GetProfile_slow(&slow);

    std::vector<uint8_t> basic_blocks(BlocksByteSize(width, height));
    std::vector<uint8_t> slow_blocks(BlocksByteSize(width, height));
    ASSERT_EQ(CompressBlocksBC7(&surface, basic_blocks.data(), basic_blocks.size(), &basic), BC7_SUCCESS);
    ASSERT_EQ(CompressBlocksBC7(&surface, slow_blocks.data(), slow_blocks.size(), &slow), BC7_SUCCESS);

    std::vector<uint8_t> basic_decoded(image.size());
    std::vector<uint8_t> slow_decoded(image.size());
    DecompressBlocksBC7(basic_blocks.data(), basic_blocks.size(), basic_decoded.data(), basic_decoded.size(), width, height);
    DecompressBlocksBC7(slow_blocks.data(), slow_blocks.size(), slow_decoded.data(), slow_decoded.size(), width, height);

    int basic_max = 0, slow_max = 0;
    double basic_err = image_error(image, basic_decoded, 3, &basic_max);
    double slow_err = image_error(image, slow_decoded, 3, &slow_max);

    EXPECT_LE(slow_err, basic_err);
    EXPECT_LE(basic_max, 64);
    EXPECT_LE(slow_max, 64);
}

/** @brief Extra refinement never makes a block worse. */
TEST(encode, more_refinement_never_hurts)
{
    const int width = 16, height = 16;
    std::vector<uint8_t> image = make_test_image(width, height, 777);

    bc7_enc_settings base;
    GetProfile_alpha_basic(&base);
    bc7_enc_settings refined = base;
    for (int i = 0; i < 8; i++) refined.refineIterations[i] = base.refineIterations[i] + 2;

    for (int by = 0; by < height / 4; by++)
    {
        for (int bx = 0; bx < width / 4; bx++)
        {
            std::vector<uint8_t> pixels = extract_block(image, width, bx, by);
            uint8_t block[16];
            float base_err = CompressBlockBC7(pixels.data(), 16, &base, block);
            float refined_err = CompressBlockBC7(pixels.data(), 16, &refined, block);
            EXPECT_LE(refined_err, base_err + 1e-3f);
        }
    }
}

/**
 * @brief Each preset in a speed chain is no worse than the one before it.
 *
 * Uniform noise spreads the partition candidates out, so a slower preset
 * regularly refines a different partition than the faster one. Several of
 * these seeds (9, 619, 1279 among them) give a block where the longer
 * candidate list refines to a worse result than its best prefix entry.
 */
TEST(encode, slower_presets_never_lose)
{
    static const profile_fn opaque_chain[] {
        GetProfile_ultrafast, GetProfile_veryfast, GetProfile_fast, GetProfile_basic, GetProfile_slow
    };
    static const profile_fn alpha_chain[] {
        GetProfile_alpha_ultrafast, GetProfile_alpha_veryfast, GetProfile_alpha_fast, GetProfile_alpha_basic,
        GetProfile_alpha_slow
    };
    const profile_fn* chains[] { opaque_chain, alpha_chain };

    for (uint32_t seed = 1; seed <= 1600; seed++)
    {
        uint32_t state = seed;
        uint8_t pixels[64];
        for (uint8_t& p : pixels)
        {
            state = state * 1664525u + 1013904223u;
            p = uint8_t(state >> 24);
        }

        for (const profile_fn* chain : chains)
        {
            float previous = -1.0f;
            for (int i = 0; i < 5; i++)
            {
                bc7_enc_settings settings;
                chain[i](&settings);
                uint8_t block[16];
                float err = CompressBlockBC7(pixels, 16, &settings, block);
                ASSERT_GE(err, 0.0f);
                if (i > 0)
                    EXPECT_LE(err, previous + 1e-3f) << "seed " << seed << ", preset " << i;
                previous = err;
            }
        }
    }
}

TEST(encode, block_rejects_bad_settings)
{
    uint8_t pixels[64];
    for (int i = 0; i < 64; i++) pixels[i] = uint8_t(i * 37);

    uint8_t out[16];
    memset(out, 0x5C, sizeof(out));

    bc7_enc_settings settings;
    GetProfile_slow(&settings);

    // more candidates than there are partitions
    bc7_enc_settings wide = settings;
    wide.fastSkipTreshold_mode1 = 100;
    EXPECT_LT(CompressBlockBC7(pixels, 16, &wide, out), 0.0f);

    bc7_enc_settings bad_channels = settings;
    bad_channels.channels = 5;
    EXPECT_LT(CompressBlockBC7(pixels, 16, &bad_channels, out), 0.0f);

    EXPECT_LT(CompressBlockBC7(pixels, 16, nullptr, out), 0.0f);
    EXPECT_LT(CompressBlockBC7(pixels, 12, &settings, out), 0.0f);
    EXPECT_LT(CompressBlockBC7(nullptr, 16, &settings, out), 0.0f);

    for (uint8_t b : out) EXPECT_EQ(b, 0x5C);

    EXPECT_GE(CompressBlockBC7(pixels, 16, &settings, out), 0.0f);
}

TEST(encode, rejects_bad_arguments)
{
    std::vector<uint8_t> pixels(8 * 8 * 4, 0);
    std::vector<uint8_t> blocks(BlocksByteSize(8, 8));

    bc7_enc_settings settings;
    GetProfile_fast(&settings);

    rgba_surface odd { pixels.data(), 6, 8, 8 * 4 };
    EXPECT_EQ(CompressBlocksBC7(&odd, blocks.data(), blocks.size(), &settings), BC7_ERR_BAD_DIMENSIONS);

    rgba_surface empty { pixels.data(), 0, 8, 8 * 4 };
    EXPECT_EQ(CompressBlocksBC7(&empty, blocks.data(), blocks.size(), &settings), BC7_ERR_BAD_DIMENSIONS);

    rgba_surface surface { pixels.data(), 8, 8, 8 * 4 };
    EXPECT_EQ(CompressBlocksBC7(&surface, blocks.data(), blocks.size() - 1, &settings), BC7_ERR_BAD_BUFFER_SIZE);
    EXPECT_EQ(CompressBlocksBC7(&surface, nullptr, blocks.size(), &settings), BC7_ERR_BAD_PARAM);
    EXPECT_EQ(CompressBlocksBC7(nullptr, blocks.data(), blocks.size(), &settings), BC7_ERR_BAD_PARAM);
    EXPECT_EQ(CompressBlocksBC7(&surface, blocks.data(), blocks.size(), nullptr), BC7_ERR_BAD_PARAM);

    rgba_surface narrow { pixels.data(), 8, 8, 8 * 4 - 4 };
    EXPECT_EQ(CompressBlocksBC7(&narrow, blocks.data(), blocks.size(), &settings), BC7_ERR_BAD_PARAM);

    bc7_enc_settings broken = settings;
    broken.channels = 2;
    EXPECT_EQ(CompressBlocksBC7(&surface, blocks.data(), blocks.size(), &broken), BC7_ERR_BAD_SETTINGS);

    EXPECT_EQ(CompressBlocksBC7(&surface, blocks.data(), blocks.size(), &settings), BC7_SUCCESS);
}

TEST(encode, strided_source)
{
    const int width = 8, height = 8, stride = width * 4 + 12;
    std::vector<uint8_t> packed = make_test_image(width, height, 99);
    std::vector<uint8_t> padded(size_t(stride) * height, 0xEE);
    for (int y = 0; y < height; y++)
        memcpy(&padded[size_t(y) * stride], &packed[size_t(y) * width * 4], width * 4);

    bc7_enc_settings settings;
    GetProfile_alpha_veryfast(&settings);

    rgba_surface a { packed.data(), width, height, width * 4 };
    rgba_surface b { padded.data(), width, height, stride };

    std::vector<uint8_t> out_a(BlocksByteSize(width, height));
    std::vector<uint8_t> out_b(BlocksByteSize(width, height));
    ASSERT_EQ(CompressBlocksBC7(&a, out_a.data(), out_a.size(), &settings), BC7_SUCCESS);
    ASSERT_EQ(CompressBlocksBC7(&b, out_b.data(), out_b.size(), &settings), BC7_SUCCESS);
    EXPECT_EQ(out_a, out_b);
}

/** @brief Bands of rows compressed on separate threads give the same bytes. */
TEST(encode, threaded_bands_match_single_call)
{
    const int width = 16, height = 32, bands = 4;
    std::vector<uint8_t> image = make_test_image(width, height, 4242);

    bc7_enc_settings settings;
    GetProfile_alpha_fast(&settings);

    rgba_surface whole { image.data(), width, height, width * 4 };
    std::vector<uint8_t> expected(BlocksByteSize(width, height));
    ASSERT_EQ(CompressBlocksBC7(&whole, expected.data(), expected.size(), &settings), BC7_SUCCESS);

    const int band_height = height / bands;
    const size_t band_bytes = BlocksByteSize(width, band_height);
    std::vector<uint8_t> actual(expected.size(), 0);
    std::vector<bc7_error> results(bands, BC7_ERR_DEVICE);

    std::vector<std::thread> workers;
    for (int i = 0; i < bands; i++)
    {
        workers.emplace_back([&, i]() {
            rgba_surface band { image.data() + size_t(i) * band_height * width * 4, width, band_height, width * 4 };
            results[i] = CompressBlocksBC7(&band, actual.data() + i * band_bytes, band_bytes, &settings);
        });
    }
    for (auto& worker : workers) worker.join();

    for (bc7_error result : results) EXPECT_EQ(result, BC7_SUCCESS);
    EXPECT_EQ(actual, expected);
}

}
