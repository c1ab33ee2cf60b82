#include <winbmp/stream.hpp>

#include <algorithm>
#include <cstring>

namespace winbmp {

// ============================================================================
// memory_source / memory_sink
// ============================================================================

bool memory_source::read(std::span<std::uint8_t> dst, std::size_t& bytes_read) {
    bytes_read = 0;
    if (pos_ >= data_.size() || dst.empty()) {
        return true;
    }

    const std::size_t available = data_.size() - static_cast<std::size_t>(pos_);
    bytes_read = std::min(available, dst.size());
    std::memcpy(dst.data(), data_.data() + pos_, bytes_read);
    pos_ += bytes_read;
    return true;
}

bool memory_source::seek(std::uint64_t offset) {
    // Seeking past the end is allowed; subsequent reads return no data
    pos_ = offset;
    return true;
}

bool memory_sink::write(std::span<const std::uint8_t> src) {
    data_.insert(data_.end(), src.begin(), src.end());
    return true;
}

// ============================================================================
// stream_source / stream_sink
// ============================================================================

stream_source::stream_source(std::istream& in)
    : in_(in) {
    base_ = in_.tellg();
    if (base_ < 0) {
        base_ = 0;
        return;
    }

    in_.seekg(0, std::ios::end);
    const std::streamoff end = in_.tellg();
    if (end >= base_) {
        size_ = static_cast<std::uint64_t>(end - base_);
    }
    in_.clear();
    in_.seekg(base_, std::ios::beg);
}

bool stream_source::read(std::span<std::uint8_t> dst, std::size_t& bytes_read) {
    bytes_read = 0;
    if (dst.empty()) {
        return true;
    }

    in_.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    bytes_read = static_cast<std::size_t>(in_.gcount());

    if (in_.bad()) {
        return false;
    }
    if (in_.eof()) {
        // Short read at end of data; keep the stream usable for seeking
        in_.clear();
    }
    return true;
}

bool stream_source::seek(std::uint64_t offset) {
    in_.clear();
    in_.seekg(base_ + static_cast<std::streamoff>(offset), std::ios::beg);
    return !in_.fail();
}

std::uint64_t stream_source::tell() const {
    const std::streamoff pos = in_.tellg();
    return pos < base_ ? 0 : static_cast<std::uint64_t>(pos - base_);
}

bool stream_sink::write(std::span<const std::uint8_t> src) {
    out_.write(reinterpret_cast<const char*>(src.data()), static_cast<std::streamsize>(src.size()));
    return out_.good();
}

} // namespace winbmp
