#ifndef WINBMP_STREAM_HPP_
#define WINBMP_STREAM_HPP_

#include <winbmp/winbmp_export.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <utility>
#include <vector>

namespace winbmp {

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Abstract sequential, seekable reader.
 * The codec only pulls bytes through this interface, so callers can decode
 * from memory, files, or any other transport.
 *
 * Offsets are relative to the first byte of the BMP stream.
 */
class WINBMP_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Read up to dst.size() bytes.
     * A short count without failure means the end of the data was reached.
     * @param dst Destination buffer
     * @param bytes_read Number of bytes stored in dst
     * @return false if the underlying transport failed
     */
    virtual bool read(std::span<std::uint8_t> dst, std::size_t& bytes_read) = 0;

    /**
     * Move the read position.
     * @param offset Absolute offset from the start of the stream
     * @return false if the underlying transport failed
     */
    virtual bool seek(std::uint64_t offset) = 0;

    /**
     * Current read position.
     */
    [[nodiscard]] virtual std::uint64_t tell() const = 0;

    /**
     * Total stream length, if the source knows it.
     */
    [[nodiscard]] virtual std::optional<std::uint64_t> size() const { return std::nullopt; }
};

// ============================================================================
// Byte Sink Interface
// ============================================================================

class WINBMP_EXPORT byte_sink {
public:
    virtual ~byte_sink() = default;

    /**
     * Append bytes.
     * @return false if the underlying transport failed
     */
    virtual bool write(std::span<const std::uint8_t> src) = 0;
};

// ============================================================================
// Memory Implementations
// ============================================================================

/**
 * Reads from a caller-owned buffer. The buffer must outlive the source.
 */
class WINBMP_EXPORT memory_source : public byte_source {
public:
    explicit memory_source(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    bool read(std::span<std::uint8_t> dst, std::size_t& bytes_read) override;
    bool seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() const override { return pos_; }
    [[nodiscard]] std::optional<std::uint64_t> size() const override { return data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::uint64_t pos_ = 0;
};

/**
 * Appends to an owned growable buffer.
 */
class WINBMP_EXPORT memory_sink : public byte_sink {
public:
    bool write(std::span<const std::uint8_t> src) override;

    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return data_; }
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// Stream Implementations
// ============================================================================

/**
 * Reads from a binary std::istream.
 * The stream position at construction is treated as offset 0.
 */
class WINBMP_EXPORT stream_source : public byte_source {
public:
    explicit stream_source(std::istream& in);

    bool read(std::span<std::uint8_t> dst, std::size_t& bytes_read) override;
    bool seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() const override;
    [[nodiscard]] std::optional<std::uint64_t> size() const override { return size_; }

private:
    std::istream& in_;
    std::streamoff base_ = 0;
    std::optional<std::uint64_t> size_;
};

/**
 * Writes to a binary std::ostream.
 */
class WINBMP_EXPORT stream_sink : public byte_sink {
public:
    explicit stream_sink(std::ostream& out) noexcept
        : out_(out) {}

    bool write(std::span<const std::uint8_t> src) override;

private:
    std::ostream& out_;
};

} // namespace winbmp

#endif // WINBMP_STREAM_HPP_
