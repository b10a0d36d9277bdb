//
// Grayscale quantization and row packing
//

#include <bitfont/pixel/pixel_packer.hh>
#include <failsafe/failsafe.hh>

namespace bitfont {

    bit_depth bit_depth_from_bits(int bits) {
        switch (bits) {
            case 1:
                return bit_depth::one;
            case 2:
                return bit_depth::two;
            case 4:
                return bit_depth::four;
            default:
                THROW_INVALID_ARG("Unsupported bits per pixel:", bits, "(expected 1, 2 or 4)");
        }
    }

    std::uint8_t quantize(std::uint8_t sample, bit_depth depth) noexcept {
        switch (depth) {
            case bit_depth::one:
                return sample < 128 ? 1 : 0;
            case bit_depth::two:
                if (sample < 0x44) return 3;
                if (sample < 0x66) return 2;
                if (sample < 0xAA) return 1;
                return 0;
            case bit_depth::four:
                return static_cast <std::uint8_t>((255u - sample) >> 4);
        }
        return 0;
    }

    std::size_t packed_row_bytes(std::size_t width, bit_depth depth) noexcept {
        return (width * bits_of(depth) + 7u) / 8u;
    }

    std::size_t packed_glyph_bytes(std::uint16_t dimension, bit_depth depth) noexcept {
        return static_cast <std::size_t>(dimension) * packed_row_bytes(dimension, depth);
    }

    void pack_codes(std::span <const std::uint8_t> codes, bit_depth depth, std::vector <std::uint8_t>& out) {
        const unsigned bits = bits_of(depth);
        const std::uint8_t mask = max_code(depth);

        unsigned accumulator = 0;
        unsigned filled = 0;
        for (const std::uint8_t code : codes) {
            accumulator |= static_cast <unsigned>(code & mask) << filled;
            filled += bits;
            if (filled >= 8) {
                out.push_back(static_cast <std::uint8_t>(accumulator));
                accumulator = 0;
                filled = 0;
            }
        }

        // Rows never share a byte
        if (filled > 0) {
            out.push_back(static_cast <std::uint8_t>(accumulator));
        }
    }

    void pack_row(std::span <const std::uint8_t> samples, bit_depth depth, std::vector <std::uint8_t>& out) {
        std::vector <std::uint8_t> codes;
        codes.reserve(samples.size());
        for (const std::uint8_t sample : samples) {
            codes.push_back(quantize(sample, depth));
        }
        pack_codes(codes, depth, out);
    }

    std::vector <std::uint8_t> pack_raster(const grayscale_raster& raster, bit_depth depth) {
        std::vector <std::uint8_t> out;
        out.reserve(packed_glyph_bytes(raster.dimension(), depth));
        for (std::uint16_t y = 0; y < raster.dimension(); ++y) {
            pack_row(raster.row(y), depth, out);
        }
        return out;
    }
}
