#include "rg/core/util/BlobCodecs.hpp"
#include "rg/core/util/Errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <iterator>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>

#include <zlib.h>
#include <zstd.h>

#if defined(__SSE4_2__)
#include <nmmintrin.h>
#endif

namespace rg {

namespace {

constexpr std::uint32_t kCastagnoli = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> makeCrcTable()
{
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t n = 0; n < table.size(); ++n) {
        std::uint32_t r = n;
        for (int bit = 0; bit < 8; ++bit)
            r = (r & 1u) ? (r >> 1) ^ kCastagnoli : r >> 1;
        table[n] = r;
    }
    return table;
}

constexpr auto kCrcTable = makeCrcTable();

int levelFrom(const nlohmann::json& entry, int fallback)
{
    auto cfg = entry.find("configuration");
    if (cfg == entry.end())
        return fallback;
    if (!cfg->is_object())
        throw ConfigError(std::format("codec '{}': configuration must be an object",
                                      entry["name"].get<std::string>()));
    auto lvl = cfg->find("level");
    if (lvl == cfg->end())
        return fallback;
    if (!lvl->is_number_integer())
        throw ConfigError("codec level must be an integer");
    return lvl->get<int>();
}

struct ZstdCCtxFree {
    void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
};
struct ZstdDCtxFree {
    void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); }
};

constexpr std::size_t kGrowStep = 64 * 1024;

} // namespace

std::uint32_t crc32c(ByteView data)
{
    std::uint32_t crc = ~0u;
    std::size_t i = 0;
#if defined(__SSE4_2__)
    std::uint64_t acc = crc;
    for (; i + 8 <= data.size(); i += 8) {
        std::uint64_t word;
        std::memcpy(&word, data.data() + i, sizeof(word));
        acc = _mm_crc32_u64(acc, word);
    }
    crc = static_cast<std::uint32_t>(acc);
#endif
    for (; i < data.size(); ++i)
        crc = kCrcTable[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    return ~crc;
}

// ============ gzip ============

GzipCodec::GzipCodec(int level) : _level(level)
{
    if (level < 0 || level > 9)
        throw ConfigError(std::format("gzip level {} outside [0, 9]", level));
}

nlohmann::json GzipCodec::toJson() const
{
    return {{"name", std::string(name())}, {"configuration", {{"level", _level}}}};
}

Bytes GzipCodec::encode(ByteView in) const
{
    if (in.size() > std::numeric_limits<uInt>::max())
        throw std::runtime_error("gzip: blob too large");

    z_stream zs{};
    // 16 + MAX_WBITS writes a gzip header and trailer
    if (deflateInit2(&zs, _level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("gzip: cannot initialise deflate");

    Bytes out(deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    const auto written = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
        throw std::runtime_error(std::format("gzip: deflate returned {}", rc));
    out.resize(written);
    return out;
}

Bytes GzipCodec::decode(ByteView in, std::optional<std::size_t> sizeHint) const
{
    z_stream zs{};
    // 32 + MAX_WBITS accepts gzip and zlib streams
    if (inflateInit2(&zs, 32 + MAX_WBITS) != Z_OK)
        throw std::runtime_error("gzip: cannot initialise inflate");

    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());

    // The buffer grows with the data actually inflated, never past one byte
    // beyond the hint, so a bad hint cannot force a large allocation.
    Bytes out;
    int rc = Z_OK;
    while (rc == Z_OK) {
        const std::size_t have = zs.total_out;
        if (sizeHint && have > *sizeHint)
            break;
        std::size_t step = kGrowStep;
        if (sizeHint && *sizeHint - have < step)
            step = *sizeHint - have + 1;
        out.resize(have + step);
        zs.next_out = out.data() + have;
        zs.avail_out = static_cast<uInt>(step);
        rc = inflate(&zs, Z_NO_FLUSH);
    }
    const auto produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END)
        throw CorruptChunkError(std::format("gzip: inflate stopped with {} after {} bytes", rc, produced));
    if (sizeHint && produced != *sizeHint)
        throw CorruptChunkError(std::format("gzip: inflated {} bytes, expected {}", produced, *sizeHint));
    out.resize(produced);
    return out;
}

// ============ zstd ============

ZstdCodec::ZstdCodec(int level) : _level(level)
{
    if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel())
        throw ConfigError(std::format("zstd level {} outside [{}, {}]", level, ZSTD_minCLevel(), ZSTD_maxCLevel()));
}

nlohmann::json ZstdCodec::toJson() const
{
    return {{"name", std::string(name())}, {"configuration", {{"level", _level}}}};
}

Bytes ZstdCodec::encode(ByteView in) const
{
    std::unique_ptr<ZSTD_CCtx, ZstdCCtxFree> ctx(ZSTD_createCCtx());
    if (!ctx)
        throw std::bad_alloc();

    Bytes out(ZSTD_compressBound(in.size()));
    const std::size_t n = ZSTD_compressCCtx(ctx.get(), out.data(), out.size(), in.data(), in.size(), _level);
    if (ZSTD_isError(n))
        throw std::runtime_error(std::format("zstd: {}", ZSTD_getErrorName(n)));
    out.resize(n);
    return out;
}

Bytes ZstdCodec::decode(ByteView in, std::optional<std::size_t> sizeHint) const
{
    // Frames written by encode() always record their content size.
    const auto framed = ZSTD_getFrameContentSize(in.data(), in.size());
    if (framed == ZSTD_CONTENTSIZE_ERROR || framed == ZSTD_CONTENTSIZE_UNKNOWN)
        throw CorruptChunkError("zstd: frame does not record its content size");
    if (sizeHint && framed != *sizeHint)
        throw CorruptChunkError(std::format("zstd: frame holds {} bytes, expected {}", framed, *sizeHint));

    std::unique_ptr<ZSTD_DCtx, ZstdDCtxFree> ctx(ZSTD_createDCtx());
    if (!ctx)
        throw std::bad_alloc();

    // Streamed so that the buffer follows the data, not the header's claim.
    ZSTD_inBuffer src{in.data(), in.size(), 0};
    Bytes out;
    std::size_t produced = 0;
    for (;;) {
        if (produced == out.size()) {
            const std::size_t left = static_cast<std::size_t>(framed) - out.size();
            out.resize(out.size() + (left < kGrowStep ? left + 1 : kGrowStep));
        }
        ZSTD_outBuffer dst{out.data(), out.size(), produced};
        const std::size_t consumedBefore = src.pos;
        const std::size_t rc = ZSTD_decompressStream(ctx.get(), &dst, &src);
        if (ZSTD_isError(rc))
            throw CorruptChunkError(std::format("zstd: {}", ZSTD_getErrorName(rc)));
        const bool progressed = dst.pos != produced || src.pos != consumedBefore;
        produced = dst.pos;
        if (produced > framed)
            throw CorruptChunkError(std::format("zstd: frame holds more than the {} bytes it declares", framed));
        if (rc == 0)
            break;
        if (!progressed || (src.pos == src.size && produced < out.size()))
            throw CorruptChunkError(std::format("zstd: frame truncated after {} bytes", produced));
    }
    if (produced != framed)
        throw CorruptChunkError(std::format("zstd: decompressed {} bytes, frame declares {}", produced, framed));
    out.resize(produced);
    return out;
}

// ============ crc32c ============

nlohmann::json Crc32cCodec::toJson() const
{
    return {{"name", std::string(name())}};
}

Bytes Crc32cCodec::encode(ByteView in) const
{
    const std::uint32_t crc = crc32c(in);
    Bytes out(in.begin(), in.end());
    for (int shift = 24; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>(crc >> shift));
    return out;
}

Bytes Crc32cCodec::decode(ByteView in, std::optional<std::size_t>) const
{
    if (in.size() < 4)
        throw CorruptChunkError(std::format("crc32c: {} bytes cannot hold a checksum", in.size()));

    const ByteView body = in.first(in.size() - 4);
    std::uint32_t stored = 0;
    for (auto b : in.last(4))
        stored = (stored << 8) | b;

    const std::uint32_t actual = crc32c(body);
    if (stored != actual)
        throw CorruptChunkError(std::format("crc32c: stored {:08x}, computed {:08x}", stored, actual));
    return Bytes(body.begin(), body.end());
}

// ============ pipeline ============

std::unique_ptr<BlobCodec> makeCodec(const nlohmann::json& entry)
{
    if (!entry.is_object())
        throw ConfigError("codec entry must be an object");
    auto it = entry.find("name");
    if (it == entry.end() || !it->is_string())
        throw ConfigError("codec entry needs a string 'name'");

    const auto name = it->get<std::string>();
    if (name == "gzip")
        return std::make_unique<GzipCodec>(levelFrom(entry, 6));
    if (name == "zstd")
        return std::make_unique<ZstdCodec>(levelFrom(entry, 3));
    if (name == "crc32c")
        return std::make_unique<Crc32cCodec>();
    throw ConfigError("unknown codec '" + name + "'");
}

CodecPipeline CodecPipeline::fromJson(const nlohmann::json& stages)
{
    CodecPipeline pipeline;
    if (stages.is_null())
        return pipeline;
    if (!stages.is_array())
        throw ConfigError("'codecs' must be an array");
    for (const auto& entry : stages)
        pipeline.append(makeCodec(entry));
    return pipeline;
}

nlohmann::json CodecPipeline::toJson() const
{
    auto stages = nlohmann::json::array();
    for (const auto& codec : _stages)
        stages.push_back(codec->toJson());
    return stages;
}

Bytes CodecPipeline::encode(const Bytes& raw) const
{
    Bytes data = raw;
    for (const auto& codec : _stages)
        data = codec->encode(data);
    return data;
}

Bytes CodecPipeline::decode(const Bytes& stored, std::size_t rawLen) const
{
    Bytes data = stored;
    for (auto it = _stages.rbegin(); it != _stages.rend(); ++it) {
        // Only the first stage's output size is known in advance.
        const bool innermost = std::next(it) == _stages.rend();
        data = (*it)->decode(data, innermost ? std::optional<std::size_t>(rawLen) : std::nullopt);
    }
    if (data.size() != rawLen)
        throw CorruptChunkError(std::format("decoded blob is {} bytes, expected {}", data.size(), rawLen));
    return data;
}

}  // namespace rg
