////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2016-2019, Intel Corporation
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <cstdint>

namespace bc7comp {

struct rgba_surface
{
    uint8_t* ptr;
    int32_t width;
    int32_t height;
    int32_t stride; // in bytes
};

// One slot per BC7 mode in mode_selection and refineIterations.
struct bc7_enc_settings
{
    bool mode_selection[8];
    int refineIterations[8];

    bool skip_mode2;
    int fastSkipTreshold_mode1;
    int fastSkipTreshold_mode3;
    int fastSkipTreshold_mode7;

    int mode45_channel0;
    int refineIterations_channel;

    int channels;
};

enum bc7_error {
    /** @brief The call was successful. */
    BC7_SUCCESS = 0,
    /** @brief A null pointer or otherwise out-of-range argument. */
    BC7_ERR_BAD_PARAM,
    /** @brief Width, height or row offset is not a multiple of 4. */
    BC7_ERR_BAD_DIMENSIONS,
    /** @brief A source or destination buffer has the wrong size. */
    BC7_ERR_BAD_BUFFER_SIZE,
    /** @brief The settings bundle is out of range. */
    BC7_ERR_BAD_SETTINGS,
    /** @brief No preset with the requested name. */
    BC7_ERR_BAD_PROFILE,
    /** @brief The destination buffer is not usable as a storage buffer. */
    BC7_ERR_BAD_USAGE,
    /** @brief The device compressor was used before init(). */
    BC7_ERR_NOT_INITIALIZED,
    /** @brief A Vulkan call failed. */
    BC7_ERR_DEVICE
};

const char* bc7_get_error_string(bc7_error status);

// profiles for RGB data (alpha channel will be ignored)
void GetProfile_ultrafast(bc7_enc_settings* settings);
void GetProfile_veryfast(bc7_enc_settings* settings);
void GetProfile_fast(bc7_enc_settings* settings);
void GetProfile_basic(bc7_enc_settings* settings);
void GetProfile_slow(bc7_enc_settings* settings);

// profiles for RGBA inputs
void GetProfile_alpha_ultrafast(bc7_enc_settings* settings);
void GetProfile_alpha_veryfast(bc7_enc_settings* settings);
void GetProfile_alpha_fast(bc7_enc_settings* settings);
void GetProfile_alpha_basic(bc7_enc_settings* settings);
void GetProfile_alpha_slow(bc7_enc_settings* settings);

// "ultra-fast", "very-fast", "fast", "basic", "slow"; hyphens are optional.
bc7_error GetProfileByName(const char* name, bool alpha, bc7_enc_settings* settings);

bc7_error ValidateSettings(const bc7_enc_settings* settings);

size_t BlocksByteSize(uint32_t width, uint32_t height);
uint32_t BytesPerRow(uint32_t width);

/*
Notes:
    - input width and height need to be a multiple of block size
    - LDR input is 32 bit/pixel (sRGB), HDR is not supported
    - dst buffer must be at least BlocksByteSize(width, height) bytes
    - a surface may describe a horizontal band of a larger image; pass the
      matching offset into dst to compress bands on separate threads
*/

bc7_error CompressBlocksBC7(const rgba_surface* src, uint8_t* dst, size_t dst_size, const bc7_enc_settings* settings);

// Same as CompressBlocksBC7, also returns the summed squared error estimate of all blocks.
bc7_error CompressBlocksBC7_Error(const rgba_surface* src, uint8_t* dst, size_t dst_size, const bc7_enc_settings* settings, double* total_err);

// Single 4x4 block. pixels points at the top-left texel, stride in bytes.
// Returns the squared error the encoder estimated for the chosen encoding,
// or a negative value when an argument or the settings are invalid (out is
// left untouched).
float CompressBlockBC7(const uint8_t* pixels, size_t stride, const bc7_enc_settings* settings, uint8_t out[16]);

void DecodeBlockBC7(const uint8_t block[16], uint8_t* dst, size_t pitch);

// src_size and dst_size must match the image exactly.
bc7_error DecompressBlocksBC7(const uint8_t* src, size_t src_size, uint8_t* dst, size_t dst_size, uint32_t width, uint32_t height);

} // namespace bc7comp
