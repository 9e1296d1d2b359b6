#pragma once

#include <cstdint>
#include <cstring>

namespace bc7comp {

// Reads a 128-bit block LSB first.
struct bit_reader
{
    uint64_t low;
    uint64_t high;

    explicit bit_reader(const uint8_t data[16])
    {
        low = 0;
        high = 0;
        for (int i = 7; i >= 0; i--) {
            low = (low << 8) | data[i];
            high = (high << 8) | data[8 + i];
        }
    }

    // 1 <= num_bits <= 32
    uint32_t read_bits(uint32_t num_bits)
    {
        uint64_t mask = (uint64_t(1) << num_bits) - 1;
        uint32_t bits = uint32_t(low & mask);
        low >>= num_bits;
        // low bits of high move into the top of low
        low |= (high & mask) << (64 - num_bits);
        high >>= num_bits;
        return bits;
    }

    uint32_t read_bit() { return read_bits(1); }
};

// 160 bits of output scratch. The top word only catches overflow while
// fixup bits are still in the stream.
struct bit_writer
{
    uint32_t data[5];
    uint32_t pos;

    bit_writer() { clear(); }

    void clear()
    {
        memset(data, 0, sizeof(data));
        pos = 0;
    }

    void put_bits(uint32_t bits, uint32_t v)
    {
        data[pos / 32] |= v << (pos % 32);
        if (pos % 32 + bits > 32)
        {
            data[pos / 32 + 1] |= v >> (32 - pos % 32);
        }
        pos += bits;
    }

    // Deletes the bit at offset from_bits - 1 by shifting every higher bit
    // down by one. Only offsets in (64, 128] are used.
    void shl_1bit_from(uint32_t from_bits)
    {
        if (from_bits < 96)
        {
            uint32_t shifted = (data[2] >> 1) | (data[3] << 31);
            uint32_t mask = ((1u << (from_bits - 64)) - 1) >> 1;
            data[2] = (mask & data[2]) | (~mask & shifted);
            data[3] = (data[3] >> 1) | (data[4] << 31);
            data[4] = data[4] >> 1;
        }
        else if (from_bits < 128)
        {
            uint32_t shifted = (data[3] >> 1) | (data[4] << 31);
            uint32_t mask = ((1u << (from_bits - 96)) - 1) >> 1;
            data[3] = (mask & data[3]) | (~mask & shifted);
            data[4] = data[4] >> 1;
        }
    }

    void store(uint8_t dst[16]) const
    {
        for (int i = 0; i < 4; i++)
        {
            dst[i * 4 + 0] = uint8_t(data[i]);
            dst[i * 4 + 1] = uint8_t(data[i] >> 8);
            dst[i * 4 + 2] = uint8_t(data[i] >> 16);
            dst[i * 4 + 3] = uint8_t(data[i] >> 24);
        }
    }
};

} // namespace bc7comp
