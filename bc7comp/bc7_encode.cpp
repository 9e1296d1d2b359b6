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

#include "bc7_encode.h"
#include "bc7_modes.h"
#include "bc7_tables.h"

#include <algorithm> // for std::min, std::max, std::swap
#include <cfloat>    // for FLT_MAX
#include <cstring>

namespace bc7comp {

static inline float sq(float v)
{
    return v * v;
}

static inline int clamp(int v, int lo, int hi)
{
    return std::min(std::max(v, lo), hi);
}

// Least squares endpoints are unbounded; keep the float -> int conversion defined.
static inline int to_int(float v)
{
    return int(std::min(std::max(v, -65536.0f), 65536.0f));
}

static inline int unpack_to_byte(int v, int bits)
{
    int vv = v << (8 - bits);
    return vv + (vv >> bits);
}

///////////////////////////
//   endpoint quantization

// Modes with a p-bit per endpoint (0, 3, 6, 7).
static void ep_quant0367(bc7_qendpoints* qep, const bc7_endpoints& ep, int mode, int channels)
{
    int bits = endpoint_bits(g_bc7_modes[mode]);
    int levels2 = (1 << bits) - 1;

    for (int i = 0; i < 2; i++)
    {
        int qep_b[2][4];
        for (int b = 0; b < 2; b++)
        for (int p = 0; p < 4; p++)
        {
            int v = to_int((ep.v[i][p] / 255 * levels2 - b) / 2 + 0.5f) * 2 + b;
            qep_b[b][p] = clamp(v, b, levels2 - 1 + b);
        }

        float err0 = 0;
        float err1 = 0;
        for (int p = 0; p < channels; p++)
        {
            err0 += sq(ep.v[i][p] - unpack_to_byte(qep_b[0][p], bits));
            err1 += sq(ep.v[i][p] - unpack_to_byte(qep_b[1][p], bits));
        }

        for (int p = 0; p < 4; p++)
            qep->v[i][p] = (err0 < err1) ? qep_b[0][p] : qep_b[1][p];
    }
}

// Mode 1, one p-bit shared by both endpoints of a subset.
static void ep_quant1(bc7_qendpoints* qep, const bc7_endpoints& ep)
{
    int qep_b[2][2][4];

    for (int b = 0; b < 2; b++)
    for (int i = 0; i < 2; i++)
    for (int p = 0; p < 4; p++)
    {
        int v = to_int((ep.v[i][p] / 255 * 127 - b) / 2 + 0.5f) * 2 + b;
        qep_b[b][i][p] = clamp(v, b, 126 + b);
    }

    float err0 = 0;
    float err1 = 0;
    for (int i = 0; i < 2; i++)
    for (int p = 0; p < 3; p++)
    {
        err0 += sq(ep.v[i][p] - unpack_to_byte(qep_b[0][i][p], 7));
        err1 += sq(ep.v[i][p] - unpack_to_byte(qep_b[1][i][p], 7));
    }

    int b = (err0 < err1) ? 0 : 1;
    for (int i = 0; i < 2; i++)
    for (int p = 0; p < 4; p++)
        qep->v[i][p] = qep_b[b][i][p];
}

// Modes without p-bits (2, 4, 5).
static void ep_quant245(bc7_qendpoints* qep, const bc7_endpoints& ep, int mode)
{
    int levels = 1 << g_bc7_modes[mode].color_bits;

    for (int i = 0; i < 2; i++)
    for (int p = 0; p < 4; p++)
    {
        int v = to_int(ep.v[i][p] / 255 * (levels - 1) + 0.5f);
        qep->v[i][p] = clamp(v, 0, levels - 1);
    }
}

static void ep_dequant(bc7_endpoints* ep, const bc7_qendpoints& qep, int mode)
{
    int bits = endpoint_bits(g_bc7_modes[mode]);

    for (int i = 0; i < 2; i++)
    for (int p = 0; p < 4; p++)
        ep->v[i][p] = float(unpack_to_byte(qep.v[i][p], bits));
}

void ep_quant_dequant(bc7_qendpoints qep[], bc7_endpoints ep[], int mode, int channels)
{
    const bc7_mode_info& info = g_bc7_modes[mode];

    for (int j = 0; j < info.subsets; j++)
    {
        if (info.pbits == BC7_PBIT_UNIQUE) ep_quant0367(&qep[j], ep[j], mode, channels);
        else if (info.pbits == BC7_PBIT_SHARED) ep_quant1(&qep[j], ep[j]);
        else ep_quant245(&qep[j], ep[j], mode);

        ep_dequant(&ep[j], qep[j], mode);
    }
}

///////////////////////////
//   index assignment

float block_quant(uint32_t qblock[2], const float block[64], int bits, const bc7_endpoints ep[], uint32_t pattern, int channels)
{
    const int* weights = get_weights(bits);
    int levels = 1 << bits;
    float total_err = 0;

    qblock[0] = 0;
    qblock[1] = 0;

    uint32_t pattern_shifted = pattern;
    for (int k = 0; k < 16; k++)
    {
        int j = pattern_shifted & 3;
        pattern_shifted >>= 2;

        float proj = 0;
        float div = 0;
        for (int p = 0; p < channels; p++)
        {
            float ep_a = ep[j].v[0][p];
            float ep_b = ep[j].v[1][p];
            proj += (block[k + p * 16] - ep_a) * (ep_b - ep_a);
            div += sq(ep_b - ep_a);
        }

        if (div > 0) proj /= div;
        else proj = 0;

        int q1 = to_int(proj * levels + 0.5f);
        q1 = clamp(q1, 1, levels - 1);

        float err0 = 0;
        float err1 = 0;
        int w0 = weights[q1 - 1];
        int w1 = weights[q1];

        for (int p = 0; p < channels; p++)
        {
            int ep_a = int(ep[j].v[0][p]);
            int ep_b = int(ep[j].v[1][p]);
            int dec_v0 = ((64 - w0) * ep_a + w0 * ep_b + 32) / 64;
            int dec_v1 = ((64 - w1) * ep_a + w1 * ep_b + 32) / 64;
            err0 += sq(dec_v0 - block[k + p * 16]);
            err1 += sq(dec_v1 - block[k + p * 16]);
        }

        // ties go to the lower index
        int best_q = q1;
        float best_err = err1;
        if (err0 <= err1)
        {
            best_q = q1 - 1;
            best_err = err0;
        }

        qblock[k / 8] |= uint32_t(best_q) << (4 * (k % 8));
        total_err += best_err;
    }

    return total_err;
}

static float channel_opt_quant(uint32_t qblock[2], const float channel_block[16], int bits, const float ep[2])
{
    const int* weights = get_weights(bits);
    int levels = 1 << bits;
    float total_err = 0;

    qblock[0] = 0;
    qblock[1] = 0;

    for (int k = 0; k < 16; k++)
    {
        float proj = (channel_block[k] - ep[0]) / (ep[1] - ep[0] + 0.001f);

        int q1 = to_int(proj * levels + 0.5f);
        q1 = clamp(q1, 1, levels - 1);

        int w0 = weights[q1 - 1];
        int w1 = weights[q1];
        int dec_v0 = ((64 - w0) * int(ep[0]) + w0 * int(ep[1]) + 32) / 64;
        int dec_v1 = ((64 - w1) * int(ep[0]) + w1 * int(ep[1]) + 32) / 64;
        float err0 = sq(dec_v0 - channel_block[k]);
        float err1 = sq(dec_v1 - channel_block[k]);

        int best_q = (err0 <= err1) ? q1 - 1 : q1;
        qblock[k / 8] |= uint32_t(best_q) << (4 * (k % 8));
        total_err += std::min(err0, err1);
    }

    return total_err;
}

static void channel_quant_dequant(int qep[2], float ep[2], int epbits)
{
    int elevels = 1 << epbits;

    for (int i = 0; i < 2; i++)
    {
        int v = to_int(ep[i] / 255 * (elevels - 1) + 0.5f);
        qep[i] = clamp(v, 0, elevels - 1);
        ep[i] = float(unpack_to_byte(qep[i], epbits));
    }
}

void partial_sort_list(int list[], int length, int partial_count)
{
    partial_count = std::min(partial_count, length);

    for (int k = 0; k < partial_count; k++)
    {
        int best_idx = k;
        int best_value = list[k];
        for (int i = k + 1; i < length; i++)
        {
            if (best_value > list[i])
            {
                best_value = list[i];
                best_idx = i;
            }
        }

        std::swap(list[k], list[best_idx]);
    }
}

///////////////////////////
//   canonicalization

static uint32_t apply_swap_mode01237(bc7_qendpoints qep[3], const uint32_t qblock[2], int mode, int part_id)
{
    const bc7_mode_info& info = g_bc7_modes[mode];
    uint32_t levels = 1u << info.index_bits;
    uint32_t flips = 0;

    int skips[3];
    get_skips(skips, part_id);

    for (int j = 0; j < info.subsets; j++)
    {
        int k0 = skips[j];
        uint32_t q = (qblock[k0 >> 3] >> ((k0 & 7) * 4)) & 15;

        if (q >= levels / 2)
        {
            for (int p = 0; p < 4; p++) std::swap(qep[j].v[0][p], qep[j].v[1][p]);
            flips |= get_pattern_mask(part_id, j);
        }
    }

    return flips;
}

static bool needs_swap_mode456(const uint32_t qblock[2], int bits)
{
    uint32_t levels = 1u << bits;
    return (qblock[0] & 15) >= levels / 2;
}

static void invert_qblock(uint32_t qblock[2], int bits)
{
    uint32_t levels = 1u << bits;
    for (int k = 0; k < 2; k++)
        qblock[k] = 0x11111111u * (levels - 1) - qblock[k];
}

static void apply_swap_mode456(bc7_qendpoints* qep, uint32_t qblock[2], int bits)
{
    if (!needs_swap_mode456(qblock, bits)) return;

    for (int p = 0; p < 4; p++) std::swap(qep->v[0][p], qep->v[1][p]);
    invert_qblock(qblock, bits);
}

static void apply_swap_mode456(int qep[2], uint32_t qblock[2], int bits)
{
    if (!needs_swap_mode456(qblock, bits)) return;

    std::swap(qep[0], qep[1]);
    invert_qblock(qblock, bits);
}

///////////////////////////
//   block_compressor_bc7

block_compressor_bc7::block_compressor_bc7(const bc7_enc_settings* settings)
    : m_settings(settings)
    , m_opaque_err(0)
    , m_best_err(FLT_MAX)
{
    memset(m_block, 0, sizeof(m_block));
}

void block_compressor_bc7::load_block_interleaved_rgba(const uint8_t* pixels, size_t stride)
{
    for (int y = 0; y < 4; y++)
    for (int x = 0; x < 4; x++)
    {
        const uint8_t* pixel = pixels + y * stride + x * 4;
        for (int p = 0; p < 4; p++)
            m_block[p * 16 + y * 4 + x] = float(pixel[p]);
    }
}

void block_compressor_bc7::compute_opaque_err()
{
    m_opaque_err = 0;
    if (m_settings->channels == 3) return;

    for (int k = 0; k < 16; k++)
        m_opaque_err += sq(m_block[48 + k] - 255);
}

void block_compressor_bc7::compress_block()
{
    m_best_err = FLT_MAX;
    m_writer.clear();
    compute_opaque_err();

    const bool* sel = m_settings->mode_selection;

    if (sel[0] || sel[2]) enc_mode02();
    if (sel[1] || sel[3]) enc_mode13();
    if (sel[7]) enc_mode7();
    if (sel[4] || sel[5]) enc_mode45();
    if (sel[6]) enc_mode6();
}

float block_compressor_bc7::enc_mode01237_part_fast(bc7_qendpoints qep[3], uint32_t qblock[2], int part_id, int mode) const
{
    const bc7_mode_info& info = g_bc7_modes[mode];
    int channels = info.alpha_bits ? 4 : 3;

    bc7_endpoints ep[3] = {};
    for (int j = 0; j < info.subsets; j++)
    {
        uint32_t mask = get_pattern_mask(part_id, j);
        block_segment(&ep[j], m_block, mask, channels);
    }

    ep_quant_dequant(qep, ep, mode, channels);

    return block_quant(qblock, m_block, info.index_bits, ep, get_pattern(part_id), channels);
}

// Least-squares refinement of one partition, keeping each step that is no worse.
float block_compressor_bc7::refine_mode01237(bc7_qendpoints qep[3], uint32_t qblock[2], float err, int part_id, int mode) const
{
    const bc7_mode_info& info = g_bc7_modes[mode];
    int bits = info.index_bits;
    int pairs = info.subsets;
    int channels = info.alpha_bits ? 4 : 3;

    for (int i = 0; i < m_settings->refineIterations[mode]; i++)
    {
        bc7_endpoints ep[3] = {};
        for (int j = 0; j < pairs; j++)
        {
            uint32_t mask = get_pattern_mask(part_id, j);
            opt_endpoints(&ep[j], m_block, bits, qblock, mask, channels);
        }

        bc7_qendpoints qep_r[3] = {};
        uint32_t qblock_r[2];
        ep_quant_dequant(qep_r, ep, mode, channels);
        float err_r = block_quant(qblock_r, m_block, bits, ep, get_pattern(part_id), channels);

        if (err_r <= err)
        {
            for (int j = 0; j < pairs; j++) qep[j] = qep_r[j];
            qblock[0] = qblock_r[0];
            qblock[1] = qblock_r[1];
            err = err_r;
        }
    }

    return err;
}

void block_compressor_bc7::enc_mode01237(int mode, const int part_list[64], int part_count)
{
    if (part_count == 0) return;

    int pairs = g_bc7_modes[mode].subsets;

    bc7_qendpoints best_qep[3] = {};
    uint32_t best_qblock[2] = { 0, 0 };
    int best_part_id = -1;
    float best_err = FLT_MAX;
    float best_fast_err = FLT_MAX;

    for (int i = 0; i < part_count; i++)
    {
        int part_id = part_list[i] & 63;
        if (pairs == 3) part_id += 64;

        bc7_qendpoints qep[3] = {};
        uint32_t qblock[2];
        float err = enc_mode01237_part_fast(qep, qblock, part_id, mode);

        // only partitions that lead the unrefined ranking are refined; a
        // longer candidate list then never ends worse than its prefix
        if (err >= best_fast_err) continue;
        best_fast_err = err;

        err = refine_mode01237(qep, qblock, err, part_id, mode);

        if (err < best_err)
        {
            for (int j = 0; j < pairs; j++) best_qep[j] = qep[j];
            best_qblock[0] = qblock[0];
            best_qblock[1] = qblock[1];
            best_part_id = part_id;
            best_err = err;
        }
    }

    if (mode != 7) best_err += m_opaque_err;

    if (best_err < m_best_err)
    {
        m_best_err = best_err;
        code_mode01237(best_qep, best_qblock, best_part_id, mode);
    }
}

void block_compressor_bc7::enc_mode02()
{
    int part_list[64];
    for (int part = 0; part < 64; part++)
        part_list[part] = part;

    if (m_settings->mode_selection[0])
        enc_mode01237(0, part_list, 16);

    if (m_settings->mode_selection[2] && !m_settings->skip_mode2)
        enc_mode01237(2, part_list, 64);
}

void block_compressor_bc7::enc_mode13()
{
    int threshold1 = m_settings->mode_selection[1] ? m_settings->fastSkipTreshold_mode1 : 0;
    int threshold3 = m_settings->mode_selection[3] ? m_settings->fastSkipTreshold_mode3 : 0;
    if (threshold1 == 0 && threshold3 == 0) return;

    bc7_stats full_stats;
    compute_stats_masked(&full_stats, m_block, 0xFFFFFFFF, 3);

    int part_list[64];
    for (int part = 0; part < 64; part++)
    {
        uint32_t mask = get_pattern_mask(part, 0);
        float bound12 = block_pca_bound_split(m_block, mask, full_stats, 3);
        int bound = int(bound12);
        part_list[part] = part + bound * 64;
    }

    partial_sort_list(part_list, 64, std::max(threshold1, threshold3));
    enc_mode01237(1, part_list, threshold1);
    enc_mode01237(3, part_list, threshold3);
}

void block_compressor_bc7::enc_mode7()
{
    int threshold7 = m_settings->fastSkipTreshold_mode7;
    if (threshold7 == 0) return;

    int channels = m_settings->channels;

    bc7_stats full_stats;
    compute_stats_masked(&full_stats, m_block, 0xFFFFFFFF, channels);

    int part_list[64];
    for (int part = 0; part < 64; part++)
    {
        uint32_t mask = get_pattern_mask(part, 0);
        float bound12 = block_pca_bound_split(m_block, mask, full_stats, channels);
        int bound = int(bound12);
        part_list[part] = part + bound * 64;
    }

    partial_sort_list(part_list, 64, threshold7);
    enc_mode01237(7, part_list, threshold7);
}

float block_compressor_bc7::opt_channel(uint32_t qblock[2], int qep[2], const float channel_block[16], int bits, int epbits) const
{
    float ep[2] = { 255, 0 };

    for (int k = 0; k < 16; k++)
    {
        ep[0] = std::min(ep[0], channel_block[k]);
        ep[1] = std::max(ep[1], channel_block[k]);
    }

    channel_quant_dequant(qep, ep, epbits);
    float err = channel_opt_quant(qblock, channel_block, bits, ep);

    // refine
    for (int i = 0; i < m_settings->refineIterations_channel; i++)
    {
        float ep_r[2] = { ep[0], ep[1] };
        int qep_r[2];
        uint32_t qblock_r[2];

        channel_opt_endpoints(ep_r, channel_block, bits, qblock);
        channel_quant_dequant(qep_r, ep_r, epbits);
        float err_r = channel_opt_quant(qblock_r, channel_block, bits, ep_r);

        if (err_r <= err)
        {
            ep[0] = ep_r[0];
            ep[1] = ep_r[1];
            qep[0] = qep_r[0];
            qep[1] = qep_r[1];
            qblock[0] = qblock_r[0];
            qblock[1] = qblock_r[1];
            err = err_r;
        }
    }

    return err;
}

void block_compressor_bc7::enc_mode45_candidate(mode45_parameters* best_candidate, float* best_err, int mode, int rotation, int swap) const
{
    int bits = 2;
    int abits = g_bc7_modes[mode].index2_bits;
    int aepbits = g_bc7_modes[mode].alpha_bits;

    if (swap == 1) // mode 4 only
    {
        bits = 3;
        abits = 2;
    }

    float candidate_block[64];

    for (int k = 0; k < 16; k++)
    {
        for (int p = 0; p < 3; p++)
            candidate_block[k + p * 16] = m_block[k + p * 16];

        if (rotation < 3)
        {
            // apply channel rotation
            if (m_settings->channels == 4) candidate_block[k + rotation * 16] = m_block[k + 3 * 16];
            if (m_settings->channels == 3) candidate_block[k + rotation * 16] = 255;
        }
        candidate_block[k + 3 * 16] = 0;
    }

    bc7_endpoints ep = {};
    block_segment(&ep, candidate_block, 0xFFFFFFFF, 3);

    bc7_qendpoints qep = {};
    ep_quant_dequant(&qep, &ep, mode, 3);

    uint32_t qblock[2];
    float err = block_quant(qblock, candidate_block, bits, &ep, 0, 3);

    // refine
    for (int i = 0; i < m_settings->refineIterations[mode]; i++)
    {
        bc7_endpoints ep_r = {};
        opt_endpoints(&ep_r, candidate_block, bits, qblock, 0xFFFFFFFF, 3);

        bc7_qendpoints qep_r = {};
        uint32_t qblock_r[2];
        ep_quant_dequant(&qep_r, &ep_r, mode, 3);
        float err_r = block_quant(qblock_r, candidate_block, bits, &ep_r, 0, 3);

        if (err_r <= err)
        {
            qep = qep_r;
            qblock[0] = qblock_r[0];
            qblock[1] = qblock_r[1];
            err = err_r;
        }
    }

    float channel_data[16];
    for (int k = 0; k < 16; k++)
        channel_data[k] = m_block[k + rotation * 16];

    // encoding selected channel
    int aqep[2];
    uint32_t aqblock[2];
    err += opt_channel(aqblock, aqep, channel_data, abits, aepbits);

    if (err < *best_err)
    {
        best_candidate->qep = qep;
        best_candidate->qblock[0] = qblock[0];
        best_candidate->qblock[1] = qblock[1];
        best_candidate->aqep[0] = aqep[0];
        best_candidate->aqep[1] = aqep[1];
        best_candidate->aqblock[0] = aqblock[0];
        best_candidate->aqblock[1] = aqblock[1];
        best_candidate->rotation = rotation;
        best_candidate->swap = swap;
        *best_err = err;
    }
}

void block_compressor_bc7::enc_mode45()
{
    mode45_parameters best_candidate = {};
    float best_err = m_best_err;

    int channel0 = m_settings->mode45_channel0;

    if (m_settings->mode_selection[4])
    {
        for (int p = channel0; p < m_settings->channels; p++)
        {
            enc_mode45_candidate(&best_candidate, &best_err, 4, p, 0);
            enc_mode45_candidate(&best_candidate, &best_err, 4, p, 1);
        }

        if (best_err < m_best_err)
        {
            m_best_err = best_err;
            code_mode45(best_candidate, 4);
        }
    }

    if (m_settings->mode_selection[5])
    {
        for (int p = channel0; p < m_settings->channels; p++)
        {
            enc_mode45_candidate(&best_candidate, &best_err, 5, p, 0);
        }

        if (best_err < m_best_err)
        {
            m_best_err = best_err;
            code_mode45(best_candidate, 5);
        }
    }
}

void block_compressor_bc7::enc_mode6()
{
    const int mode = 6;
    const int bits = 4;
    int channels = m_settings->channels;

    bc7_endpoints ep = {};
    block_segment(&ep, m_block, 0xFFFFFFFF, channels);

    if (channels == 3)
    {
        ep.v[0][3] = 255;
        ep.v[1][3] = 255;
    }

    bc7_qendpoints qep = {};
    ep_quant_dequant(&qep, &ep, mode, channels);

    uint32_t qblock[2];
    float err = block_quant(qblock, m_block, bits, &ep, 0, channels);

    // refine
    for (int i = 0; i < m_settings->refineIterations[mode]; i++)
    {
        bc7_endpoints ep_r = {};
        opt_endpoints(&ep_r, m_block, bits, qblock, 0xFFFFFFFF, channels);

        if (channels == 3)
        {
            ep_r.v[0][3] = 255;
            ep_r.v[1][3] = 255;
        }

        bc7_qendpoints qep_r = {};
        uint32_t qblock_r[2];
        ep_quant_dequant(&qep_r, &ep_r, mode, channels);
        float err_r = block_quant(qblock_r, m_block, bits, &ep_r, 0, channels);

        if (err_r <= err)
        {
            qep = qep_r;
            qblock[0] = qblock_r[0];
            qblock[1] = qblock_r[1];
            err = err_r;
        }
    }

    if (err < m_best_err)
    {
        m_best_err = err;
        code_mode6(&qep, qblock);
    }
}

///////////////////////////
//   bitstream output

void block_compressor_bc7::code_qblock(const uint32_t qblock[2], int bits, uint32_t flips)
{
    uint32_t levels = 1u << bits;
    uint32_t flips_shifted = flips;

    for (int k1 = 0; k1 < 2; k1++)
    {
        uint32_t qbits_shifted = qblock[k1];
        for (int k2 = 0; k2 < 8; k2++)
        {
            uint32_t q = qbits_shifted & 15;
            if (flips_shifted & 1) q = (levels - 1) - q;

            // texel 0 is always a fixup texel
            if (k1 == 0 && k2 == 0) m_writer.put_bits(bits - 1, q);
            else m_writer.put_bits(bits, q);

            qbits_shifted >>= 4;
            flips_shifted >>= 1;
        }
    }
}

void block_compressor_bc7::code_adjust_skip_mode01237(int mode, int part_id)
{
    const bc7_mode_info& info = g_bc7_modes[mode];
    int bits = info.index_bits;
    int pairs = info.subsets;

    int skips[3];
    get_skips(skips, part_id);

    // remove the later fixup bit first so the earlier offset stays valid
    if (pairs > 2 && skips[1] < skips[2]) std::swap(skips[1], skips[2]);

    for (int j = 1; j < pairs; j++)
        m_writer.shl_1bit_from(128 + (pairs - 1) - (15 - skips[j]) * bits);
}

void block_compressor_bc7::code_mode01237(bc7_qendpoints qep[3], const uint32_t qblock[2], int part_id, int mode)
{
    const bc7_mode_info& info = g_bc7_modes[mode];
    int pairs = info.subsets;
    int channels = info.alpha_bits ? 4 : 3;
    int pbit_shift = (info.pbits != BC7_PBIT_NONE) ? 1 : 0;

    uint32_t flips = apply_swap_mode01237(qep, qblock, mode, part_id);

    m_writer.clear();

    m_writer.put_bits(mode + 1, 1u << mode);
    m_writer.put_bits(info.partition_bits, uint32_t(part_id) & ((1u << info.partition_bits) - 1));

    // endpoints, channel major
    for (int p = 0; p < channels; p++)
    {
        int ep_bits = (p == 3) ? info.alpha_bits : info.color_bits;
        for (int j = 0; j < pairs * 2; j++)
            m_writer.put_bits(ep_bits, uint32_t(qep[j / 2].v[j % 2][p]) >> pbit_shift);
    }

    // p-bits
    if (info.pbits == BC7_PBIT_SHARED)
    {
        for (int j = 0; j < pairs; j++)
            m_writer.put_bits(1, uint32_t(qep[j].v[0][0]) & 1);
    }
    if (info.pbits == BC7_PBIT_UNIQUE)
    {
        for (int j = 0; j < pairs * 2; j++)
            m_writer.put_bits(1, uint32_t(qep[j / 2].v[j % 2][0]) & 1);
    }

    code_qblock(qblock, info.index_bits, flips);
    code_adjust_skip_mode01237(mode, part_id);
}

void block_compressor_bc7::code_mode45(const mode45_parameters& params, int mode)
{
    const bc7_mode_info& info = g_bc7_modes[mode];

    bc7_qendpoints qep = params.qep;
    uint32_t qblock[2] = { params.qblock[0], params.qblock[1] };
    int aqep[2] = { params.aqep[0], params.aqep[1] };
    uint32_t aqblock[2] = { params.aqblock[0], params.aqblock[1] };
    int rotation = params.rotation;
    int swap = params.swap;

    int bits = 2;
    int abits = info.index2_bits;

    if (swap == 0)
    {
        apply_swap_mode456(&qep, qblock, bits);
        apply_swap_mode456(aqep, aqblock, abits);
    }
    else
    {
        // color indices travel in the second stream
        std::swap(qblock[0], aqblock[0]);
        std::swap(qblock[1], aqblock[1]);

        apply_swap_mode456(aqep, qblock, bits);
        apply_swap_mode456(&qep, aqblock, abits);
    }

    m_writer.clear();

    m_writer.put_bits(mode + 1, 1u << mode);
    m_writer.put_bits(info.rotation_bits, uint32_t(rotation + 1) & 3);

    if (info.selector_bits)
        m_writer.put_bits(1, uint32_t(swap));

    for (int p = 0; p < 3; p++)
    {
        m_writer.put_bits(info.color_bits, uint32_t(qep.v[0][p]));
        m_writer.put_bits(info.color_bits, uint32_t(qep.v[1][p]));
    }

    m_writer.put_bits(info.alpha_bits, uint32_t(aqep[0]));
    m_writer.put_bits(info.alpha_bits, uint32_t(aqep[1]));

    code_qblock(qblock, bits, 0);
    code_qblock(aqblock, abits, 0);
}

void block_compressor_bc7::code_mode6(bc7_qendpoints* qep, uint32_t qblock[2])
{
    apply_swap_mode456(qep, qblock, 4);

    m_writer.clear();

    m_writer.put_bits(7, 64);

    for (int p = 0; p < 4; p++)
    {
        m_writer.put_bits(7, uint32_t(qep->v[0][p]) >> 1);
        m_writer.put_bits(7, uint32_t(qep->v[1][p]) >> 1);
    }

    m_writer.put_bits(1, uint32_t(qep->v[0][0]) & 1);
    m_writer.put_bits(1, uint32_t(qep->v[1][0]) & 1);

    code_qblock(qblock, 4, 0);
}

} // namespace bc7comp
