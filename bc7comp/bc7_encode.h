#pragma once

#include "bc7_bits.h"
#include "bc7_pca.h"
#include "bc7comp.h"

#include <cstddef>
#include <cstdint>

namespace bc7comp {

struct mode45_parameters
{
    bc7_qendpoints qep;
    uint32_t qblock[2];
    int aqep[2];
    uint32_t aqblock[2];
    int rotation;
    int swap;
};

float block_quant(uint32_t qblock[2], const float block[64], int bits, const bc7_endpoints ep[], uint32_t pattern, int channels);
void ep_quant_dequant(bc7_qendpoints qep[], bc7_endpoints ep[], int mode, int channels);
void partial_sort_list(int list[], int length, int partial_count);

// Searches the enabled modes for one 4x4 block and keeps the lowest error encoding.
class block_compressor_bc7
{
public:
    explicit block_compressor_bc7(const bc7_enc_settings* settings);

    void load_block_interleaved_rgba(const uint8_t* pixels, size_t stride);
    void compress_block();

    float best_err() const { return m_best_err; }
    void store(uint8_t out[16]) const { m_writer.store(out); }

private:
    void compute_opaque_err();

    void enc_mode01237(int mode, const int part_list[64], int part_count);
    float enc_mode01237_part_fast(bc7_qendpoints qep[3], uint32_t qblock[2], int part_id, int mode) const;
    float refine_mode01237(bc7_qendpoints qep[3], uint32_t qblock[2], float err, int part_id, int mode) const;
    void enc_mode02();
    void enc_mode13();
    void enc_mode7();
    void enc_mode45();
    void enc_mode45_candidate(mode45_parameters* best_candidate, float* best_err, int mode, int rotation, int swap) const;
    void enc_mode6();

    float opt_channel(uint32_t qblock[2], int qep[2], const float channel_block[16], int bits, int epbits) const;

    void code_mode01237(bc7_qendpoints qep[3], const uint32_t qblock[2], int part_id, int mode);
    void code_mode45(const mode45_parameters& params, int mode);
    void code_mode6(bc7_qendpoints* qep, uint32_t qblock[2]);
    void code_qblock(const uint32_t qblock[2], int bits, uint32_t flips);
    void code_adjust_skip_mode01237(int mode, int part_id);

    const bc7_enc_settings* m_settings;
    float m_block[64];
    float m_opaque_err;
    float m_best_err;
    bit_writer m_writer;
};

} // namespace bc7comp
