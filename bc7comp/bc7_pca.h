#pragma once

#include <cstdint>

namespace bc7comp {

// Block layout used by the optimizer: planar channels, texel k of channel p
// at block[p * 16 + k].

// Endpoint pair of one subset, v[endpoint][channel].
struct bc7_endpoints
{
    float v[2][4];
};

struct bc7_qendpoints
{
    int v[2][4];
};

// Masked first and second moments:
// [0..9] second moments in covariance order, [10..13] sums, [14] texel count.
struct bc7_stats
{
    float s[15];
};

// Upper triangle of a symmetric 4x4 matrix:
// 0 1 2 3
//   4 5 6
//     7 8
//       9
struct bc7_covar
{
    float c[10];
};

void compute_stats_masked(bc7_stats* stats, const float block[64], uint32_t mask, int channels);
void covar_from_stats(bc7_covar* covar, const bc7_stats& stats, int channels);
void compute_axis(float axis[4], const bc7_covar& covar, int power_iterations, int channels);

float get_pca_bound(const bc7_covar& covar, int channels);
float block_pca_bound_split(const float block[64], uint32_t mask, const bc7_stats& full_stats, int channels);
void block_pca_axis(float axis[4], float dc[4], const float block[64], uint32_t mask, int channels);

// Principal axis segmentation of the masked texels, clamped to [0, 255].
void block_segment(bc7_endpoints* ep, const float block[64], uint32_t mask, int channels);

// Least squares endpoints for a fixed index assignment (4 bits per texel in qblock).
void opt_endpoints(bc7_endpoints* ep, const float block[64], int bits, const uint32_t qblock[2], uint32_t mask, int channels);
void channel_opt_endpoints(float ep[2], const float channel_block[16], int bits, const uint32_t qblock[2]);

} // namespace bc7comp
