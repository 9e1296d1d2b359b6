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

#include "bc7comp.h"
#include "bc7_encode.h"
#include "bc7comp_log.h"

#include <cstring>

namespace bc7comp {

const char* bc7_get_error_string(bc7_error status)
{
    switch (status)
    {
    case BC7_SUCCESS:
        return "BC7_SUCCESS";
    case BC7_ERR_BAD_PARAM:
        return "BC7_ERR_BAD_PARAM";
    case BC7_ERR_BAD_DIMENSIONS:
        return "BC7_ERR_BAD_DIMENSIONS";
    case BC7_ERR_BAD_BUFFER_SIZE:
        return "BC7_ERR_BAD_BUFFER_SIZE";
    case BC7_ERR_BAD_SETTINGS:
        return "BC7_ERR_BAD_SETTINGS";
    case BC7_ERR_BAD_PROFILE:
        return "BC7_ERR_BAD_PROFILE";
    case BC7_ERR_BAD_USAGE:
        return "BC7_ERR_BAD_USAGE";
    case BC7_ERR_NOT_INITIALIZED:
        return "BC7_ERR_NOT_INITIALIZED";
    case BC7_ERR_DEVICE:
        return "BC7_ERR_DEVICE";
    }

    return nullptr;
}

void GetProfile_ultrafast(bc7_enc_settings* settings)
{
    settings->channels = 3;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = false;
    settings->mode_selection[3] = false;
    settings->mode_selection[7] = false;
    settings->fastSkipTreshold_mode1 = 3;
    settings->fastSkipTreshold_mode3 = 1;
    settings->fastSkipTreshold_mode7 = 0;

    settings->refineIterations[1] = 2;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 0;

    // mode45
    settings->mode_selection[4] = false;
    settings->mode_selection[5] = false;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 0;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 1;
}

void GetProfile_veryfast(bc7_enc_settings* settings)
{
    settings->channels = 3;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 3;
    settings->fastSkipTreshold_mode3 = 1;
    settings->fastSkipTreshold_mode7 = 0;

    settings->refineIterations[1] = 2;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 0;

    // mode45
    settings->mode_selection[4] = false;
    settings->mode_selection[5] = false;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 0;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 1;
}

void GetProfile_fast(bc7_enc_settings* settings)
{
    settings->channels = 3;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 12;
    settings->fastSkipTreshold_mode3 = 4;
    settings->fastSkipTreshold_mode7 = 0;

    settings->refineIterations[1] = 2;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 0;

    // mode45
    settings->mode_selection[4] = false;
    settings->mode_selection[5] = false;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 0;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_basic(bc7_enc_settings* settings)
{
    settings->channels = 3;

    // mode02
    settings->mode_selection[0] = true;
    settings->mode_selection[2] = true;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 12;
    settings->fastSkipTreshold_mode3 = 8;
    settings->fastSkipTreshold_mode7 = 0;

    settings->refineIterations[1] = 2;
    settings->refineIterations[3] = 2;
    settings->refineIterations[7] = 0;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 2;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_slow(bc7_enc_settings* settings)
{
    settings->channels = 3;

    int moreRefine = 2;
    // mode02
    settings->mode_selection[0] = true;
    settings->mode_selection[2] = true;
    settings->skip_mode2 = false;

    settings->refineIterations[0] = 2+moreRefine;
    settings->refineIterations[2] = 2+moreRefine;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 64;
    settings->fastSkipTreshold_mode3 = 64;
    settings->fastSkipTreshold_mode7 = 0;

    settings->refineIterations[1] = 2+moreRefine;
    settings->refineIterations[3] = 2+moreRefine;
    settings->refineIterations[7] = 0;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 2+moreRefine;
    settings->refineIterations[4] = 2+moreRefine;
    settings->refineIterations[5] = 2+moreRefine;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2+moreRefine;
}

void GetProfile_alpha_ultrafast(bc7_enc_settings* settings)
{
    settings->channels = 4;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = false;
    settings->mode_selection[3] = false;
    settings->mode_selection[7] = false;
    settings->fastSkipTreshold_mode1 = 0;
    settings->fastSkipTreshold_mode3 = 0;
    settings->fastSkipTreshold_mode7 = 4;

    settings->refineIterations[1] = 1;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 2;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 3;
    settings->refineIterations_channel = 1;
    settings->refineIterations[4] = 1;
    settings->refineIterations[5] = 1;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_alpha_veryfast(bc7_enc_settings* settings)
{
    settings->channels = 4;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 0;
    settings->fastSkipTreshold_mode3 = 0;
    settings->fastSkipTreshold_mode7 = 4;

    settings->refineIterations[1] = 1;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 2;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 3;
    settings->refineIterations_channel = 2;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_alpha_fast(bc7_enc_settings* settings)
{
    settings->channels = 4;

    // mode02
    settings->mode_selection[0] = false;
    settings->mode_selection[2] = false;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 4;
    settings->fastSkipTreshold_mode3 = 4;
    settings->fastSkipTreshold_mode7 = 8;

    settings->refineIterations[1] = 1;
    settings->refineIterations[3] = 1;
    settings->refineIterations[7] = 2;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 3;
    settings->refineIterations_channel = 2;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_alpha_basic(bc7_enc_settings* settings)
{
    settings->channels = 4;

    // mode02
    settings->mode_selection[0] = true;
    settings->mode_selection[2] = true;
    settings->skip_mode2 = true;

    settings->refineIterations[0] = 2;
    settings->refineIterations[2] = 2;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 12;
    settings->fastSkipTreshold_mode3 = 8;
    settings->fastSkipTreshold_mode7 = 8;

    settings->refineIterations[1] = 2;
    settings->refineIterations[3] = 2;
    settings->refineIterations[7] = 2;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 2;
    settings->refineIterations[4] = 2;
    settings->refineIterations[5] = 2;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2;
}

void GetProfile_alpha_slow(bc7_enc_settings* settings)
{
    settings->channels = 4;

    int moreRefine = 2;
    // mode02
    settings->mode_selection[0] = true;
    settings->mode_selection[2] = true;
    settings->skip_mode2 = false;

    settings->refineIterations[0] = 2+moreRefine;
    settings->refineIterations[2] = 2+moreRefine;

    // mode137
    settings->mode_selection[1] = true;
    settings->mode_selection[3] = true;
    settings->mode_selection[7] = true;
    settings->fastSkipTreshold_mode1 = 64;
    settings->fastSkipTreshold_mode3 = 64;
    settings->fastSkipTreshold_mode7 = 64;

    settings->refineIterations[1] = 2+moreRefine;
    settings->refineIterations[3] = 2+moreRefine;
    settings->refineIterations[7] = 2+moreRefine;

    // mode45
    settings->mode_selection[4] = true;
    settings->mode_selection[5] = true;

    settings->mode45_channel0 = 0;
    settings->refineIterations_channel = 2+moreRefine;
    settings->refineIterations[4] = 2+moreRefine;
    settings->refineIterations[5] = 2+moreRefine;

    // mode6
    settings->mode_selection[6] = true;

    settings->refineIterations[6] = 2+moreRefine;
}

struct profile_entry
{
    const char* name;
    void (*opaque)(bc7_enc_settings*);
    void (*alpha)(bc7_enc_settings*);
};

static const profile_entry g_profiles[] = {
    { "ultrafast", GetProfile_ultrafast, GetProfile_alpha_ultrafast },
    { "veryfast", GetProfile_veryfast, GetProfile_alpha_veryfast },
    { "fast", GetProfile_fast, GetProfile_alpha_fast },
    { "basic", GetProfile_basic, GetProfile_alpha_basic },
    { "slow", GetProfile_slow, GetProfile_alpha_slow },
};

bc7_error GetProfileByName(const char* name, bool alpha, bc7_enc_settings* settings)
{
    if (!name || !settings)
        return BC7_ERR_BAD_PARAM;

    // drop hyphens so "ultra-fast" and "ultrafast" both match
    char key[32];
    size_t len = 0;
    for (const char* c = name; *c; c++)
    {
        if (*c == '-') continue;
        if (len + 1 >= sizeof(key))
            return BC7_ERR_BAD_PROFILE;
        key[len++] = *c;
    }
    key[len] = 0;

    for (const profile_entry& entry : g_profiles)
    {
        if (strcmp(entry.name, key) != 0) continue;

        memset(settings, 0, sizeof(*settings));
        if (alpha) entry.alpha(settings);
        else entry.opaque(settings);
        return BC7_SUCCESS;
    }

    BC7COMP_LOGW("unknown profile '%s'", name);
    return BC7_ERR_BAD_PROFILE;
}

bc7_error ValidateSettings(const bc7_enc_settings* settings)
{
    if (!settings)
        return BC7_ERR_BAD_PARAM;

    if (settings->channels != 3 && settings->channels != 4)
        return BC7_ERR_BAD_SETTINGS;

    for (int i = 0; i < 8; i++)
    {
        if (settings->refineIterations[i] < 0)
            return BC7_ERR_BAD_SETTINGS;
    }

    if (settings->refineIterations_channel < 0)
        return BC7_ERR_BAD_SETTINGS;

    // partition candidates come from a 64 entry list
    if (settings->fastSkipTreshold_mode1 < 0 || settings->fastSkipTreshold_mode1 > 64 ||
        settings->fastSkipTreshold_mode3 < 0 || settings->fastSkipTreshold_mode3 > 64 ||
        settings->fastSkipTreshold_mode7 < 0 || settings->fastSkipTreshold_mode7 > 64)
        return BC7_ERR_BAD_SETTINGS;

    if (settings->mode45_channel0 < 0 || settings->mode45_channel0 > settings->channels)
        return BC7_ERR_BAD_SETTINGS;

    return BC7_SUCCESS;
}

size_t BlocksByteSize(uint32_t width, uint32_t height)
{
    size_t blocks_x = (width + 3) / 4;
    size_t blocks_y = (height + 3) / 4;
    return blocks_x * blocks_y * 16;
}

uint32_t BytesPerRow(uint32_t width)
{
    return ((width + 3) / 4) * 16;
}

static bc7_error validate_surface(const rgba_surface* src, uint8_t* dst, size_t dst_size, const bc7_enc_settings* settings)
{
    if (!src || !src->ptr || !dst || !settings)
    {
        BC7COMP_LOGW("null surface, destination or settings");
        return BC7_ERR_BAD_PARAM;
    }

    if (src->width <= 0 || src->height <= 0 || src->width % 4 != 0 || src->height % 4 != 0)
    {
        BC7COMP_LOGW("surface %dx%d is not a positive multiple of 4", src->width, src->height);
        return BC7_ERR_BAD_DIMENSIONS;
    }

    if (src->stride < src->width * 4)
    {
        BC7COMP_LOGW("stride %d is smaller than a row of %d texels", src->stride, src->width);
        return BC7_ERR_BAD_PARAM;
    }

    size_t needed = BlocksByteSize(uint32_t(src->width), uint32_t(src->height));
    if (dst_size < needed)
    {
        BC7COMP_LOGW("destination holds %zu bytes, %zu required", dst_size, needed);
        return BC7_ERR_BAD_BUFFER_SIZE;
    }

    bc7_error status = ValidateSettings(settings);
    if (status != BC7_SUCCESS)
    {
        BC7COMP_LOGW("invalid settings: %s", bc7_get_error_string(status));
        return status;
    }

    return BC7_SUCCESS;
}

bc7_error CompressBlocksBC7_Error(const rgba_surface* src, uint8_t* dst, size_t dst_size, const bc7_enc_settings* settings, double* total_err)
{
    bc7_error status = validate_surface(src, dst, dst_size, settings);
    if (status != BC7_SUCCESS)
        return status;

    int blocks_x = src->width / 4;
    int blocks_y = src->height / 4;

    BC7COMP_LOGD("compressing %dx%d blocks, %d channels", blocks_x, blocks_y, settings->channels);

    block_compressor_bc7 compressor(settings);
    double err_sum = 0.0;

    for (int yy = 0; yy < blocks_y; yy++)
    for (int xx = 0; xx < blocks_x; xx++)
    {
        const uint8_t* pixels = src->ptr + size_t(yy) * 4 * src->stride + size_t(xx) * 16;

        compressor.load_block_interleaved_rgba(pixels, size_t(src->stride));
        compressor.compress_block();
        compressor.store(dst + (size_t(yy) * blocks_x + xx) * 16);

        err_sum += compressor.best_err();
    }

    if (total_err) *total_err = err_sum;
    return BC7_SUCCESS;
}

bc7_error CompressBlocksBC7(const rgba_surface* src, uint8_t* dst, size_t dst_size, const bc7_enc_settings* settings)
{
    return CompressBlocksBC7_Error(src, dst, dst_size, settings, nullptr);
}

float CompressBlockBC7(const uint8_t* pixels, size_t stride, const bc7_enc_settings* settings, uint8_t out[16])
{
    if (!pixels || !out || !settings || stride < 16)
    {
        BC7COMP_LOGE("null block, output or settings, or stride %zu below one block row", stride);
        return -1.0f;
    }

    bc7_error status = ValidateSettings(settings);
    if (status != BC7_SUCCESS)
    {
        BC7COMP_LOGE("invalid settings: %s", bc7_get_error_string(status));
        return -1.0f;
    }

    block_compressor_bc7 compressor(settings);
    compressor.load_block_interleaved_rgba(pixels, stride);
    compressor.compress_block();
    compressor.store(out);
    return compressor.best_err();
}

bc7_error DecompressBlocksBC7(const uint8_t* src, size_t src_size, uint8_t* dst, size_t dst_size, uint32_t width, uint32_t height)
{
    if (!src || !dst)
        return BC7_ERR_BAD_PARAM;

    if (width == 0 || height == 0 || width % 4 != 0 || height % 4 != 0)
    {
        BC7COMP_LOGW("image %ux%u is not a positive multiple of 4", width, height);
        return BC7_ERR_BAD_DIMENSIONS;
    }

    size_t pitch = size_t(width) * 4;
    if (src_size != BlocksByteSize(width, height) || dst_size != pitch * height)
    {
        BC7COMP_LOGW("buffer sizes %zu/%zu do not match a %ux%u image", src_size, dst_size, width, height);
        return BC7_ERR_BAD_BUFFER_SIZE;
    }

    uint32_t blocks_x = width / 4;
    uint32_t blocks_y = height / 4;

    for (uint32_t by = 0; by < blocks_y; by++)
    for (uint32_t bx = 0; bx < blocks_x; bx++)
    {
        const uint8_t* block = src + (size_t(by) * blocks_x + bx) * 16;
        DecodeBlockBC7(block, dst + size_t(by) * 4 * pitch + size_t(bx) * 16, pitch);
    }

    return BC7_SUCCESS;
}

} // namespace bc7comp
