#include "bc7_pca.h"

#include <algorithm>
#include <cfloat>
#include <cmath>

namespace bc7comp {

static inline float sq(float v)
{
    return v * v;
}

static void ssymv3(float a[4], const bc7_covar& covar, const float b[4])
{
    const float* c = covar.c;
    a[0] = c[0] * b[0] + c[1] * b[1] + c[2] * b[2];
    a[1] = c[1] * b[0] + c[4] * b[1] + c[5] * b[2];
    a[2] = c[2] * b[0] + c[5] * b[1] + c[7] * b[2];
}

static void ssymv4(float a[4], const bc7_covar& covar, const float b[4])
{
    const float* c = covar.c;
    a[0] = c[0] * b[0] + c[1] * b[1] + c[2] * b[2] + c[3] * b[3];
    a[1] = c[1] * b[0] + c[4] * b[1] + c[5] * b[2] + c[6] * b[3];
    a[2] = c[2] * b[0] + c[5] * b[1] + c[7] * b[2] + c[8] * b[3];
    a[3] = c[3] * b[0] + c[6] * b[1] + c[8] * b[2] + c[9] * b[3];
}

void compute_stats_masked(bc7_stats* stats, const float block[64], uint32_t mask, int channels)
{
    float* s = stats->s;
    for (int i = 0; i < 15; i++) s[i] = 0;

    uint32_t mask_shifted = mask << 1;
    for (int k = 0; k < 16; k++)
    {
        mask_shifted >>= 1;
        float flag = float(mask_shifted & 1);

        float rgba[4] = { 0, 0, 0, 0 };
        for (int p = 0; p < channels; p++) rgba[p] = block[k + p * 16] * flag;
        s[14] += flag;

        s[10] += rgba[0];
        s[11] += rgba[1];
        s[12] += rgba[2];

        s[0] += rgba[0] * rgba[0];
        s[1] += rgba[0] * rgba[1];
        s[2] += rgba[0] * rgba[2];

        s[4] += rgba[1] * rgba[1];
        s[5] += rgba[1] * rgba[2];

        s[7] += rgba[2] * rgba[2];

        if (channels == 4)
        {
            s[13] += rgba[3];
            s[3] += rgba[0] * rgba[3];
            s[6] += rgba[1] * rgba[3];
            s[8] += rgba[2] * rgba[3];
            s[9] += rgba[3] * rgba[3];
        }
    }
}

void covar_from_stats(bc7_covar* covar, const bc7_stats& stats, int channels)
{
    const float* s = stats.s;
    float* c = covar->c;
    for (int i = 0; i < 10; i++) c[i] = 0;

    c[0] = s[0] - s[10] * s[10] / s[14];
    c[1] = s[1] - s[10] * s[11] / s[14];
    c[2] = s[2] - s[10] * s[12] / s[14];

    c[4] = s[4] - s[11] * s[11] / s[14];
    c[5] = s[5] - s[11] * s[12] / s[14];

    c[7] = s[7] - s[12] * s[12] / s[14];

    if (channels == 4)
    {
        c[3] = s[3] - s[10] * s[13] / s[14];
        c[6] = s[6] - s[11] * s[13] / s[14];
        c[8] = s[8] - s[12] * s[13] / s[14];
        c[9] = s[9] - s[13] * s[13] / s[14];
    }
}

void compute_axis(float axis[4], const bc7_covar& covar, int power_iterations, int channels)
{
    float vec[4] = { 1, 1, 1, 1 };

    for (int i = 0; i < power_iterations; i++)
    {
        if (channels == 3) ssymv3(axis, covar, vec);
        if (channels == 4) ssymv4(axis, covar, vec);

        for (int p = 0; p < channels; p++) vec[p] = axis[p];

        if (i % 2 == 1) // renormalize every other iteration
        {
            float norm_sq = 0;
            for (int p = 0; p < channels; p++)
                norm_sq += axis[p] * axis[p];

            float rnorm = 1.0f / std::sqrt(norm_sq);
            for (int p = 0; p < channels; p++) vec[p] *= rnorm;
        }
    }

    for (int p = 0; p < channels; p++) axis[p] = vec[p];
}

float get_pca_bound(const bc7_covar& covar, int channels)
{
    const int power_iterations = 4; // quite approximative, but enough for bounding

    bc7_covar scaled = covar;
    const float inv_var = 1.0f / (256 * 256);
    for (int i = 0; i < 10; i++) scaled.c[i] *= inv_var;

    const float eps = sq(0.001f);
    scaled.c[0] += eps;
    scaled.c[4] += eps;
    scaled.c[7] += eps;

    float axis[4] = { 0, 0, 0, 0 };
    compute_axis(axis, scaled, power_iterations, channels);

    float vec[4] = { 0, 0, 0, 0 };
    if (channels == 3) ssymv3(vec, scaled, axis);
    if (channels == 4) ssymv4(vec, scaled, axis);

    float sq_sum = 0.0f;
    for (int p = 0; p < channels; p++) sq_sum += sq(vec[p]);
    float lambda = std::sqrt(sq_sum);

    float bound = scaled.c[0] + scaled.c[4] + scaled.c[7];
    if (channels == 4) bound += scaled.c[9];
    bound -= lambda;

    return std::max(bound, 0.0f);
}

float block_pca_bound_split(const float block[64], uint32_t mask, const bc7_stats& full_stats, int channels)
{
    bc7_stats stats;
    compute_stats_masked(&stats, block, mask, channels);

    bc7_covar covar1;
    covar_from_stats(&covar1, stats, channels);

    for (int i = 0; i < 15; i++)
        stats.s[i] = full_stats.s[i] - stats.s[i];

    bc7_covar covar2;
    covar_from_stats(&covar2, stats, channels);

    float bound = 0;
    bound += get_pca_bound(covar1, channels);
    bound += get_pca_bound(covar2, channels);

    return std::sqrt(bound) * 256;
}

void block_pca_axis(float axis[4], float dc[4], const float block[64], uint32_t mask, int channels)
{
    const int power_iterations = 8; // 4 not enough for HQ

    bc7_stats stats;
    compute_stats_masked(&stats, block, mask, channels);

    for (int p = 0; p < channels; p++)
        dc[p] = stats.s[10 + p] / stats.s[14];

    bc7_covar covar;
    covar_from_stats(&covar, stats, channels);

    const float inv_var = 1.0f / (256 * 256);
    for (int i = 0; i < 10; i++) covar.c[i] *= inv_var;

    const float eps = sq(0.001f);
    covar.c[0] += eps;
    covar.c[4] += eps;
    covar.c[7] += eps;
    covar.c[9] += eps;

    compute_axis(axis, covar, power_iterations, channels);
}

static void block_segment_core(bc7_endpoints* ep, const float block[64], uint32_t mask, int channels)
{
    float axis[4] = { 0, 0, 0, 0 };
    float dc[4] = { 0, 0, 0, 0 };
    block_pca_axis(axis, dc, block, mask, channels);

    float ext[2] = { FLT_MAX, -FLT_MAX };

    // find min/max
    uint32_t mask_shifted = mask << 1;
    for (int k = 0; k < 16; k++)
    {
        mask_shifted >>= 1;
        if ((mask_shifted & 1) == 0) continue;

        float dot = 0;
        for (int p = 0; p < channels; p++)
            dot += axis[p] * (block[16 * p + k] - dc[p]);

        ext[0] = std::min(ext[0], dot);
        ext[1] = std::max(ext[1], dot);
    }

    // create some distance if the endpoints collapse
    if (ext[1] - ext[0] < 1.0f)
    {
        ext[0] -= 0.5f;
        ext[1] += 0.5f;
    }

    for (int i = 0; i < 2; i++)
    for (int p = 0; p < channels; p++)
    {
        ep->v[i][p] = ext[i] * axis[p] + dc[p];
    }
}

void block_segment(bc7_endpoints* ep, const float block[64], uint32_t mask, int channels)
{
    block_segment_core(ep, block, mask, channels);

    for (int i = 0; i < 2; i++)
    for (int p = 0; p < channels; p++)
    {
        ep->v[i][p] = std::min(std::max(ep->v[i][p], 0.0f), 255.0f);
    }
}

void opt_endpoints(bc7_endpoints* ep, const float block[64], int bits, const uint32_t qblock[2], uint32_t mask, int channels)
{
    int levels = 1 << bits;

    float atb1[4] = { 0, 0, 0, 0 };
    float sum_q = 0;
    float sum_qq = 0;
    float sum[5] = { 0, 0, 0, 0, 0 };

    uint32_t mask_shifted = mask << 1;
    for (int k1 = 0; k1 < 2; k1++)
    {
        uint32_t qbits_shifted = qblock[k1];
        for (int k2 = 0; k2 < 8; k2++)
        {
            int k = k1 * 8 + k2;
            float q = float(int(qbits_shifted & 15));
            qbits_shifted >>= 4;

            mask_shifted >>= 1;
            if ((mask_shifted & 1) == 0) continue;

            int x = (levels - 1) - int(q);

            sum_q += q;
            sum_qq += q * q;

            sum[4] += 1;
            for (int p = 0; p < channels; p++) sum[p] += block[k + p * 16];
            for (int p = 0; p < channels; p++) atb1[p] += x * block[k + p * 16];
        }
    }

    float atb2[4] = { 0, 0, 0, 0 };
    for (int p = 0; p < channels; p++)
    {
        atb2[p] = (levels - 1) * sum[p] - atb1[p];
    }

    float cxx = sum[4] * sq(float(levels - 1)) - 2 * (levels - 1) * sum_q + sum_qq;
    float cyy = sum_qq;
    float cxy = (levels - 1) * sum_q - sum_qq;
    float det = cxx * cyy - cxy * cxy;

    if (std::fabs(det) < 0.001f)
    {
        // flatten
        for (int p = 0; p < channels; p++)
        {
            ep->v[0][p] = sum[p] / sum[4];
            ep->v[1][p] = ep->v[0][p];
        }
        return;
    }

    float scale = (levels - 1) / det;
    for (int p = 0; p < channels; p++)
    {
        ep->v[0][p] = (atb1[p] * cyy - atb2[p] * cxy) * scale;
        ep->v[1][p] = (atb2[p] * cxx - atb1[p] * cxy) * scale;
    }
}

void channel_opt_endpoints(float ep[2], const float channel_block[16], int bits, const uint32_t qblock[2])
{
    int levels = 1 << bits;

    float atb1 = 0;
    float sum_q = 0;
    float sum_qq = 0;
    float sum = 0;

    for (int k1 = 0; k1 < 2; k1++)
    {
        uint32_t qbits_shifted = qblock[k1];
        for (int k2 = 0; k2 < 8; k2++)
        {
            int k = k1 * 8 + k2;
            float q = float(int(qbits_shifted & 15));
            qbits_shifted >>= 4;

            int x = (levels - 1) - int(q);

            sum_q += q;
            sum_qq += q * q;

            sum += channel_block[k];
            atb1 += x * channel_block[k];
        }
    }

    float atb2 = (levels - 1) * sum - atb1;

    float cxx = 16 * sq(float(levels - 1)) - 2 * (levels - 1) * sum_q + sum_qq;
    float cyy = sum_qq;
    float cxy = (levels - 1) * sum_q - sum_qq;
    float det = cxx * cyy - cxy * cxy;

    if (std::fabs(det) < 0.001f)
    {
        ep[0] = sum / 16;
        ep[1] = ep[0];
        return;
    }

    float scale = (levels - 1) / det;
    ep[0] = (atb1 * cyy - atb2 * cxy) * scale;
    ep[1] = (atb2 * cxx - atb1 * cxy) * scale;

    ep[0] = std::min(std::max(ep[0], 0.0f), 255.0f);
    ep[1] = std::min(std::max(ep[1], 0.0f), 255.0f);
}

} // namespace bc7comp
