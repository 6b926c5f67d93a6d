#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hotline::ipc
{

// ─── Wire primitives ─────────────────────────────────────────────────────────
// Fixed big-endian layout, no padding:
//   int32 / int64   : two's complement, most significant byte first
//   bool            : 1 byte, nonzero = true
//   utf             : uint16 byte length, then modified UTF-8 bytes
//   block           : int32 byte length, then raw bytes

static constexpr size_t MAX_UTF_BYTES  = 0xFFFF;
static constexpr size_t MAX_BLOCK_SIZE = 16 * 1024 * 1024;   // 16 MiB

enum class ReadStatus
{
    Ok,
    Closed,      // stream ended cleanly before the first byte of a primitive
    Truncated,   // stream ended in the middle of a primitive
    Malformed,   // bytes arrived but do not decode
    TimedOut,    // receive timeout set on the socket expired
    IoError,
};

const char* to_string(ReadStatus status);

// Source of exactly-sized reads. Implemented by Connection and BufferSource.
class ByteSource
{
   public:
    virtual ~ByteSource() = default;

    // Fill `buf` with exactly `len` bytes or report why not.
    virtual ReadStatus read_exact(uint8_t* buf, size_t len) = 0;
};

// ByteSource over a caller-owned byte buffer.
class BufferSource : public ByteSource
{
   public:
    explicit BufferSource(std::span<const uint8_t> data) : data_(data) {}

    ReadStatus read_exact(uint8_t* buf, size_t len) override;

    size_t remaining() const { return data_.size() - pos_; }
    size_t position() const { return pos_; }

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

// ─── Modified UTF-8 ──────────────────────────────────────────────────────────
// U+0000 travels as C0 80 and supplementary characters as two 3-byte
// surrogates. Both return std::nullopt on ill-formed input.

std::optional<std::string> to_modified_utf8(std::string_view utf8);
std::optional<std::string> from_modified_utf8(std::string_view mutf8);

// ─── WireReader ──────────────────────────────────────────────────────────────
// Decodes primitives from a ByteSource. The first failure is sticky: every
// later read returns std::nullopt, the stream position is no longer trusted.

class WireReader
{
   public:
    explicit WireReader(ByteSource& source) : source_(source) {}

    std::optional<int32_t>              read_i32();
    std::optional<int64_t>              read_i64();
    std::optional<bool>                 read_bool();
    std::optional<std::string>          read_utf();
    std::optional<std::vector<uint8_t>> read_block();
    std::optional<std::vector<uint8_t>> read_bytes(size_t len);

    bool       ok() const { return status_ == ReadStatus::Ok; }
    ReadStatus status() const { return status_; }

   private:
    bool fill(uint8_t* buf, size_t len);
    void fail(ReadStatus status);

    ByteSource& source_;
    ReadStatus  status_ = ReadStatus::Ok;
};

// ─── WireWriter ──────────────────────────────────────────────────────────────
// Accumulates one outgoing unit (a request or a response) for a single write.

class WireWriter
{
   public:
    void put_i32(int32_t val);
    void put_i64(int64_t val);
    void put_bool(bool val);

    // Returns false, leaving the buffer untouched, if `text` is not valid
    // UTF-8 or its modified encoding exceeds MAX_UTF_BYTES.
    [[nodiscard]] bool put_utf(std::string_view text);

    // int32 length prefix followed by the bytes.
    void put_block(std::span<const uint8_t> bytes);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }
    size_t                      size() const { return buf_.size(); }
    bool                        empty() const { return buf_.empty(); }
    void                        clear() { buf_.clear(); }

   private:
    std::vector<uint8_t> buf_;
};

}   // namespace hotline::ipc
