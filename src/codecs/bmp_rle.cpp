#include "bmp_format.hpp"

#include <array>
#include <string>

namespace winbmp {

namespace {

// Escape codes following a zero count byte
constexpr std::uint8_t RLE_END_OF_LINE = 0;
constexpr std::uint8_t RLE_END_OF_BITMAP = 1;
constexpr std::uint8_t RLE_DELTA = 2;

enum class rle_state {
    opcode,         // read the next (count, value) pair
    encoded_run,    // emit count copies of value
    escape,         // count was zero, value selects the escape
    literal_run,    // value indices follow verbatim
    delta,          // two bytes of cursor offset follow
    finished
};

// Cursor is (x, y) in stored row order; linear position y * width + x.
// Pixels past the end of a row are dropped until the next row change.
class rle_machine {
public:
    rle_machine(source_reader& in, compression_kind kind, int width, int rows,
                std::span<std::uint8_t> indices)
        : in_(in),
          nibbles_(kind == compression_kind::rle4),
          width_(static_cast<std::uint64_t>(width)),
          rows_(static_cast<std::uint64_t>(rows)),
          indices_(indices) {}

    void run() {
        rle_state state = rle_state::opcode;
        while (state != rle_state::finished) {
            state = step(state);
        }
    }

private:
    rle_state step(rle_state state) {
        switch (state) {
            case rle_state::opcode:      return read_opcode();
            case rle_state::encoded_run: return emit_run();
            case rle_state::escape:      return read_escape();
            case rle_state::literal_run: return emit_literals();
            case rle_state::delta:       return apply_delta();
            case rle_state::finished:    break;
        }
        return rle_state::finished;
    }

    [[nodiscard]] std::uint64_t position() const noexcept {
        return y_ * width_ + x_;
    }

    [[nodiscard]] bool complete() const noexcept {
        return position() >= width_ * rows_;
    }

    rle_state read_opcode() {
        if (complete()) {
            return rle_state::finished;
        }
        count_ = in_.read_u8("RLE data");
        value_ = in_.read_u8("RLE data");
        return count_ != 0 ? rle_state::encoded_run : rle_state::escape;
    }

    rle_state emit_run() {
        const std::uint8_t hi = (value_ >> 4) & 0x0F;
        const std::uint8_t lo = value_ & 0x0F;
        for (int i = 0; i < count_; i++) {
            if (nibbles_) {
                emit((i % 2 == 0) ? hi : lo);
            } else {
                emit(value_);
            }
        }
        return rle_state::opcode;
    }

    rle_state read_escape() {
        switch (value_) {
            case RLE_END_OF_LINE:
                x_ = 0;
                y_++;
                return rle_state::opcode;
            case RLE_END_OF_BITMAP:
                if (!complete()) {
                    throw_format("RLE end of bitmap at pixel " + std::to_string(position()) +
                                 " of " + std::to_string(width_ * rows_));
                }
                return rle_state::finished;
            case RLE_DELTA:
                return rle_state::delta;
            default:
                return rle_state::literal_run;
        }
    }

    rle_state emit_literals() {
        // value_ indices, padded to a 16-bit boundary
        const std::size_t byte_count = nibbles_ ? (value_ + 1u) / 2 : value_;
        std::array<std::uint8_t, 256> bytes{};
        in_.read_exact(std::span(bytes).first(byte_count), "RLE literal run");

        for (int i = 0; i < value_; i++) {
            if (nibbles_) {
                const std::uint8_t b = bytes[static_cast<std::size_t>(i / 2)];
                emit(static_cast<std::uint8_t>((i % 2 == 0) ? (b >> 4) & 0x0F : b & 0x0F));
            } else {
                emit(bytes[static_cast<std::size_t>(i)]);
            }
        }

        if (byte_count & 1) {
            in_.read_u8("RLE literal padding");
        }
        return rle_state::opcode;
    }

    rle_state apply_delta() {
        const std::uint64_t dx = in_.read_u8("RLE delta");
        const std::uint64_t dy = in_.read_u8("RLE delta");
        const std::uint64_t x = x_ + dx;
        const std::uint64_t y = y_ + dy;

        if (x > width_) {
            throw_format("RLE delta moves past the end of the row");
        }
        if (y * width_ + x > width_ * rows_) {
            throw_format("RLE delta moves past the end of the image");
        }

        x_ = x;
        y_ = y;
        return rle_state::opcode;
    }

    void emit(std::uint8_t index) {
        if (x_ < width_ && y_ < rows_) {
            indices_[static_cast<std::size_t>(y_ * width_ + x_)] = index;
            x_++;
        }
    }

    source_reader& in_;
    bool nibbles_;
    std::uint64_t width_;
    std::uint64_t rows_;
    std::span<std::uint8_t> indices_;

    std::uint64_t x_ = 0;
    std::uint64_t y_ = 0;
    std::uint8_t count_ = 0;
    std::uint8_t value_ = 0;
};

} // namespace

void expand_rle(source_reader& in, compression_kind kind, int width, int rows,
                std::span<std::uint8_t> indices) {
    if (kind != compression_kind::rle4 && kind != compression_kind::rle8) {
        throw_format("Not an RLE compression method");
    }
    if (width < 0 || rows < 0 ||
        indices.size() < static_cast<std::size_t>(width) * static_cast<std::size_t>(rows)) {
        throw_format("RLE output buffer does not match the image size");
    }

    rle_machine machine(in, kind, width, rows, indices);
    machine.run();
}

} // namespace winbmp
