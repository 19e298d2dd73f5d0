#pragma once

/**
 * @file BlobCodecs.hpp
 * @brief Byte transforms applied to chunk blobs before they reach disk.
 *
 * A pipeline is configured as a JSON array of
 * {"name": ..., "configuration": {...}} entries. Stages run front to back
 * when storing and back to front when loading.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rg {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

class BlobCodec
{
public:
    virtual ~BlobCodec() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual nlohmann::json toJson() const = 0;

    virtual Bytes encode(ByteView in) const = 0;
    // sizeHint is the decoded size when the caller knows it.
    // Throws CorruptChunkError for input this stage did not produce.
    virtual Bytes decode(ByteView in, std::optional<std::size_t> sizeHint) const = 0;
};

// Deflate with a gzip wrapper.
class GzipCodec final : public BlobCodec
{
public:
    explicit GzipCodec(int level = 6);

    [[nodiscard]] std::string_view name() const override { return "gzip"; }
    [[nodiscard]] nlohmann::json toJson() const override;
    Bytes encode(ByteView in) const override;
    Bytes decode(ByteView in, std::optional<std::size_t> sizeHint) const override;

    [[nodiscard]] int level() const { return _level; }

private:
    int _level;
};

class ZstdCodec final : public BlobCodec
{
public:
    explicit ZstdCodec(int level = 3);

    [[nodiscard]] std::string_view name() const override { return "zstd"; }
    [[nodiscard]] nlohmann::json toJson() const override;
    Bytes encode(ByteView in) const override;
    Bytes decode(ByteView in, std::optional<std::size_t> sizeHint) const override;

    [[nodiscard]] int level() const { return _level; }

private:
    int _level;
};

// Trailing 4-byte CRC32C (Castagnoli), big-endian.
class Crc32cCodec final : public BlobCodec
{
public:
    [[nodiscard]] std::string_view name() const override { return "crc32c"; }
    [[nodiscard]] nlohmann::json toJson() const override;
    Bytes encode(ByteView in) const override;
    Bytes decode(ByteView in, std::optional<std::size_t> sizeHint) const override;
};

std::uint32_t crc32c(ByteView data);

/// Build one stage from its JSON entry. Throws ConfigError.
std::unique_ptr<BlobCodec> makeCodec(const nlohmann::json& entry);

class CodecPipeline
{
public:
    CodecPipeline() = default;
    CodecPipeline(CodecPipeline&&) noexcept = default;
    CodecPipeline& operator=(CodecPipeline&&) noexcept = default;

    static CodecPipeline fromJson(const nlohmann::json& stages);
    [[nodiscard]] nlohmann::json toJson() const;

    void append(std::unique_ptr<BlobCodec> codec) { _stages.push_back(std::move(codec)); }
    [[nodiscard]] std::size_t size() const { return _stages.size(); }
    [[nodiscard]] bool empty() const { return _stages.empty(); }

    Bytes encode(const Bytes& raw) const;

    /// @throws CorruptChunkError if a stage rejects the data or the result is not rawLen bytes
    Bytes decode(const Bytes& stored, std::size_t rawLen) const;

private:
    std::vector<std::unique_ptr<BlobCodec>> _stages;
};

}  // namespace rg
