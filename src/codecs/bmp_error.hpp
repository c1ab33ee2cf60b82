#pragma once

#include <winbmp/stream.hpp>
#include <winbmp/types.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace winbmp {

// Raised inside the codec and converted to codec_result at the entry points
class codec_exception : public std::runtime_error {
public:
    codec_exception(codec_error kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] codec_error kind() const noexcept { return kind_; }

private:
    codec_error kind_;
};

[[noreturn]] inline void throw_format(const std::string& message) {
    throw codec_exception(codec_error::invalid_format, message);
}

[[noreturn]] inline void throw_unsupported(const std::string& message) {
    throw codec_exception(codec_error::unsupported, message);
}

[[noreturn]] inline void throw_io(const std::string& message) {
    throw codec_exception(codec_error::io_error, message);
}

// ============================================================================
// Buffered reader over a byte_source
// ============================================================================

// End of data is reported as a format error (truncation), transport
// failures as io_error.
class source_reader {
public:
    explicit source_reader(byte_source& src)
        : src_(src) {}

    void read_exact(std::span<std::uint8_t> dst, const char* what) {
        std::size_t done = drain(dst);
        while (done < dst.size()) {
            const auto rest = dst.subspan(done);
            if (rest.size() >= buffer_.size()) {
                std::size_t got = 0;
                if (!src_.read(rest, got)) {
                    throw_io(std::string("Read failed: ") + what);
                }
                if (got == 0) {
                    throw_format(std::string("Unexpected end of data: ") + what);
                }
                done += got;
            } else {
                refill(what);
                done += drain(rest);
            }
        }
    }

    std::uint8_t read_u8(const char* what) {
        if (pos_ == len_) {
            refill(what);
        }
        return buffer_[pos_++];
    }

    void seek(std::uint64_t offset) {
        pos_ = len_ = 0;
        if (!src_.seek(offset)) {
            throw_io("Seek failed");
        }
    }

    [[nodiscard]] std::uint64_t tell() const {
        return src_.tell() - (len_ - pos_);
    }

    [[nodiscard]] std::optional<std::uint64_t> size() const {
        return src_.size();
    }

private:
    std::size_t drain(std::span<std::uint8_t> dst) {
        const std::size_t n = std::min(dst.size(), len_ - pos_);
        if (n > 0) {
            std::memcpy(dst.data(), buffer_.data() + pos_, n);
            pos_ += n;
        }
        return n;
    }

    void refill(const char* what) {
        std::size_t got = 0;
        if (!src_.read(buffer_, got)) {
            throw_io(std::string("Read failed: ") + what);
        }
        if (got == 0) {
            throw_format(std::string("Unexpected end of data: ") + what);
        }
        pos_ = 0;
        len_ = got;
    }

    byte_source& src_;
    std::array<std::uint8_t, 4096> buffer_{};
    std::size_t pos_ = 0;
    std::size_t len_ = 0;
};

} // namespace winbmp
