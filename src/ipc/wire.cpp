#include "wire.hpp"

#include <cstring>

namespace hotline::ipc
{

// ─── Big-endian helpers ──────────────────────────────────────────────────────

static void write_u16_be(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

static void write_u32_be(std::vector<uint8_t>& buf, uint32_t v)
{
    for (int i = 3; i >= 0; --i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static void write_u64_be(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 7; i >= 0; --i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_be(const uint8_t* p)
{
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

static uint32_t read_u32_be(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

static uint64_t read_u64_be(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v = (v << 8) | p[i];
    return v;
}

const char* to_string(ReadStatus status)
{
    switch (status)
    {
        case ReadStatus::Ok:
            return "ok";
        case ReadStatus::Closed:
            return "closed";
        case ReadStatus::Truncated:
            return "truncated";
        case ReadStatus::Malformed:
            return "malformed";
        case ReadStatus::TimedOut:
            return "timed out";
        case ReadStatus::IoError:
            return "io error";
    }
    return "unknown";
}

// ─── BufferSource ────────────────────────────────────────────────────────────

ReadStatus BufferSource::read_exact(uint8_t* buf, size_t len)
{
    if (len == 0)
        return ReadStatus::Ok;
    if (remaining() == 0)
        return ReadStatus::Closed;
    if (remaining() < len)
    {
        pos_ = data_.size();
        return ReadStatus::Truncated;
    }
    std::memcpy(buf, data_.data() + pos_, len);
    pos_ += len;
    return ReadStatus::Ok;
}

// ─── Modified UTF-8 ──────────────────────────────────────────────────────────

namespace
{

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

bool is_surrogate(uint32_t u)
{
    return u >= 0xD800 && u <= 0xDFFF;
}

void put_three_byte(std::string& out, uint32_t unit)
{
    out.push_back(static_cast<char>(0xE0 | (unit >> 12)));
    out.push_back(static_cast<char>(0x80 | ((unit >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (unit & 0x3F)));
}

void put_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        put_three_byte(out, cp);
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Strict UTF-8 decode of one code point at `i`; advances `i`.
std::optional<uint32_t> next_code_point(std::string_view s, size_t& i)
{
    auto     b0  = static_cast<uint8_t>(s[i]);
    size_t   len = 0;
    uint32_t cp  = 0;
    uint32_t min = 0;

    if (b0 < 0x80)
    {
        ++i;
        return b0;
    }
    if ((b0 & 0xE0) == 0xC0)
    {
        len = 2;
        cp  = b0 & 0x1F;
        min = 0x80;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        len = 3;
        cp  = b0 & 0x0F;
        min = 0x800;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        len = 4;
        cp  = b0 & 0x07;
        min = 0x10000;
    }
    else
    {
        return std::nullopt;
    }

    if (i + len > s.size())
        return std::nullopt;
    for (size_t k = 1; k < len; ++k)
    {
        auto b = static_cast<uint8_t>(s[i + k]);
        if ((b & 0xC0) != 0x80)
            return std::nullopt;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || is_surrogate(cp))
        return std::nullopt;

    i += len;
    return cp;
}

}   // namespace

std::optional<std::string> to_modified_utf8(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size())
    {
        auto cp = next_code_point(utf8, i);
        if (!cp)
            return std::nullopt;

        if (*cp == 0)
        {
            out.push_back(static_cast<char>(0xC0));
            out.push_back(static_cast<char>(0x80));
        }
        else if (*cp < 0x10000)
        {
            put_utf8(out, *cp);
        }
        else
        {
            uint32_t v = *cp - 0x10000;
            put_three_byte(out, 0xD800 + (v >> 10));
            put_three_byte(out, 0xDC00 + (v & 0x3FF));
        }
    }
    return out;
}

std::optional<std::string> from_modified_utf8(std::string_view mutf8)
{
    // Decode into UTF-16 units first so surrogate pairs can be joined.
    std::vector<uint16_t> units;
    units.reserve(mutf8.size());

    size_t i = 0;
    while (i < mutf8.size())
    {
        auto b0 = static_cast<uint8_t>(mutf8[i]);
        if (b0 < 0x80)
        {
            units.push_back(b0);
            i += 1;
        }
        else if ((b0 & 0xE0) == 0xC0)
        {
            if (i + 1 >= mutf8.size())
                return std::nullopt;
            auto b1 = static_cast<uint8_t>(mutf8[i + 1]);
            if ((b1 & 0xC0) != 0x80)
                return std::nullopt;
            units.push_back(static_cast<uint16_t>(((b0 & 0x1F) << 6) | (b1 & 0x3F)));
            i += 2;
        }
        else if ((b0 & 0xF0) == 0xE0)
        {
            if (i + 2 >= mutf8.size())
                return std::nullopt;
            auto b1 = static_cast<uint8_t>(mutf8[i + 1]);
            auto b2 = static_cast<uint8_t>(mutf8[i + 2]);
            if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80)
                return std::nullopt;
            units.push_back(
                static_cast<uint16_t>(((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F)));
            i += 3;
        }
        else
        {
            return std::nullopt;
        }
    }

    std::string out;
    out.reserve(units.size());
    for (size_t k = 0; k < units.size(); ++k)
    {
        uint32_t u = units[k];
        if (u >= 0xD800 && u <= 0xDBFF && k + 1 < units.size() && units[k + 1] >= 0xDC00
            && units[k + 1] <= 0xDFFF)
        {
            uint32_t cp = 0x10000 + ((u - 0xD800) << 10) + (units[k + 1] - 0xDC00);
            put_utf8(out, cp);
            ++k;
        }
        else if (is_surrogate(u))
        {
            // Unpaired surrogates have no UTF-8 form.
            put_utf8(out, REPLACEMENT_CHAR);
        }
        else
        {
            put_utf8(out, u);
        }
    }
    return out;
}

// ─── WireReader ──────────────────────────────────────────────────────────────

void WireReader::fail(ReadStatus status)
{
    if (status_ == ReadStatus::Ok)
        status_ = status;
}

bool WireReader::fill(uint8_t* buf, size_t len)
{
    if (status_ != ReadStatus::Ok)
        return false;
    auto st = source_.read_exact(buf, len);
    if (st != ReadStatus::Ok)
    {
        fail(st);
        return false;
    }
    return true;
}

std::optional<int32_t> WireReader::read_i32()
{
    uint8_t buf[4];
    if (!fill(buf, sizeof(buf)))
        return std::nullopt;
    return static_cast<int32_t>(read_u32_be(buf));
}

std::optional<int64_t> WireReader::read_i64()
{
    uint8_t buf[8];
    if (!fill(buf, sizeof(buf)))
        return std::nullopt;
    return static_cast<int64_t>(read_u64_be(buf));
}

std::optional<bool> WireReader::read_bool()
{
    uint8_t b = 0;
    if (!fill(&b, 1))
        return std::nullopt;
    return b != 0;
}

std::optional<std::vector<uint8_t>> WireReader::read_bytes(size_t len)
{
    if (status_ != ReadStatus::Ok)
        return std::nullopt;
    if (len > MAX_BLOCK_SIZE)
    {
        fail(ReadStatus::Malformed);
        return std::nullopt;
    }

    std::vector<uint8_t> out(len);
    if (len == 0)
        return out;

    auto st = source_.read_exact(out.data(), len);
    if (st != ReadStatus::Ok)
    {
        // The length prefix was already consumed, so a clean close here is
        // still a cut in the middle of a primitive.
        fail(st == ReadStatus::Closed ? ReadStatus::Truncated : st);
        return std::nullopt;
    }
    return out;
}

std::optional<std::string> WireReader::read_utf()
{
    uint8_t len_buf[2];
    if (!fill(len_buf, sizeof(len_buf)))
        return std::nullopt;

    auto raw = read_bytes(read_u16_be(len_buf));
    if (!raw)
        return std::nullopt;

    auto text = from_modified_utf8(
        std::string_view(reinterpret_cast<const char*>(raw->data()), raw->size()));
    if (!text)
    {
        fail(ReadStatus::Malformed);
        return std::nullopt;
    }
    return text;
}

std::optional<std::vector<uint8_t>> WireReader::read_block()
{
    auto len = read_i32();
    if (!len)
        return std::nullopt;
    if (*len < 0)
    {
        fail(ReadStatus::Malformed);
        return std::nullopt;
    }
    return read_bytes(static_cast<size_t>(*len));
}

// ─── WireWriter ──────────────────────────────────────────────────────────────

void WireWriter::put_i32(int32_t val)
{
    write_u32_be(buf_, static_cast<uint32_t>(val));
}

void WireWriter::put_i64(int64_t val)
{
    write_u64_be(buf_, static_cast<uint64_t>(val));
}

void WireWriter::put_bool(bool val)
{
    buf_.push_back(val ? 1 : 0);
}

bool WireWriter::put_utf(std::string_view text)
{
    auto encoded = to_modified_utf8(text);
    if (!encoded || encoded->size() > MAX_UTF_BYTES)
        return false;
    write_u16_be(buf_, static_cast<uint16_t>(encoded->size()));
    buf_.insert(buf_.end(), encoded->begin(), encoded->end());
    return true;
}

void WireWriter::put_block(std::span<const uint8_t> bytes)
{
    write_u32_be(buf_, static_cast<uint32_t>(bytes.size()));
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

}   // namespace hotline::ipc
