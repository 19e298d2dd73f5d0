#pragma once

#include <xtensor/containers/xtensor.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <variant>
#include <vector>

namespace rg {

enum class ChunkEncoding : std::uint8_t {
    Uniform = 0,
    Dense = 1,
    Sparse = 2,
};

const char* encodingName(ChunkEncoding e);

// Cell type tag written into chunk blobs.
template<typename T> struct CellType;
template<> struct CellType<std::int32_t> { static constexpr std::uint8_t tag = 1; static constexpr const char* name = "int32"; };
template<> struct CellType<float>        { static constexpr std::uint8_t tag = 2; static constexpr const char* name = "float32"; };
template<> struct CellType<double>       { static constexpr std::uint8_t tag = 3; static constexpr const char* name = "float64"; };

/**
 * @brief Fixed-size rectangular block of cells in one of three encodings.
 *
 * Uniform holds a single value for every cell, Dense a full row-major array,
 * Sparse a default value plus an ordered map of the cells that differ from it.
 * The logical dimensions never depend on the encoding.
 *
 * A Uniform chunk is promoted the first time a write disagrees with its
 * value. Promotion builds the new representation completely before it
 * replaces the old one, so a failed allocation leaves the chunk untouched.
 */
template<typename T>
class Chunk
{
public:
    struct Uniform {
        T value;
    };
    struct Dense {
        xt::xtensor<T, 2> values;
    };
    struct Sparse {
        T fill;
        std::map<std::uint32_t, T> values;  // offset = row * cols + col
    };

    Chunk(int rows, int cols, T value);

    [[nodiscard]] int rows() const { return _rows; }
    [[nodiscard]] int cols() const { return _cols; }
    [[nodiscard]] std::size_t cellCount() const { return std::size_t(_rows) * std::size_t(_cols); }
    [[nodiscard]] ChunkEncoding encoding() const;

    [[nodiscard]] T get(int r, int c) const;

    // True if writing v at (r, c) requires a promotion first.
    [[nodiscard]] bool wouldPromote(int r, int c, T v) const;

    /**
     * @brief Write v at (r, c) and return the previous value.
     *
     * A Uniform chunk receiving a different value is promoted to @p promoteTo
     * (Dense or Sparse) before the write is applied.
     */
    T set(int r, int c, T v, ChunkEncoding promoteTo);

    // Bulk-construction write used by Grid::initCell. Same effect on the cell as set().
    T initialize(int r, int c, T v, ChunkEncoding promoteTo) { return set(r, c, v, promoteTo); }

    // Convert to target, preserving every cell value. Uniform is not a valid target.
    void promote(ChunkEncoding target);

    // Sparse chunk whose footprint has grown past the Dense footprint.
    [[nodiscard]] bool prefersDense() const;

    [[nodiscard]] std::size_t memoryBytes() const;
    // Footprint of this chunk once converted to target.
    [[nodiscard]] std::size_t bytesAs(ChunkEncoding target) const;

    template<typename F>
    void forEach(F&& fn) const
    {
        if (auto* u = std::get_if<Uniform>(&_rep)) {
            for (int r = 0; r < _rows; ++r)
                for (int c = 0; c < _cols; ++c)
                    fn(r, c, u->value);
        } else if (auto* d = std::get_if<Dense>(&_rep)) {
            for (int r = 0; r < _rows; ++r)
                for (int c = 0; c < _cols; ++c)
                    fn(r, c, d->values(r, c));
        } else {
            const auto& s = std::get<Sparse>(_rep);
            auto it = s.values.begin();
            std::uint32_t off = 0;
            for (int r = 0; r < _rows; ++r) {
                for (int c = 0; c < _cols; ++c, ++off) {
                    if (it != s.values.end() && it->first == off) {
                        fn(r, c, it->second);
                        ++it;
                    } else {
                        fn(r, c, s.fill);
                    }
                }
            }
        }
    }

    std::vector<std::uint8_t> serialize() const;

    /**
     * @brief Rebuild a chunk from a blob written by serialize().
     * @throws CorruptChunkError if the blob is malformed or does not describe
     *         a rows x cols chunk of cell type T
     */
    static Chunk deserialize(const std::vector<std::uint8_t>& blob, int rows, int cols);

private:
    Chunk(int rows, int cols, std::variant<Uniform, Dense, Sparse> rep);

    std::uint32_t offset(int r, int c) const { return std::uint32_t(r) * std::uint32_t(_cols) + std::uint32_t(c); }

    int _rows;
    int _cols;
    std::variant<Uniform, Dense, Sparse> _rep;
};

constexpr std::uint32_t CHUNK_BLOB_MAGIC = 0x5247434B; // "RGCK"
constexpr std::uint32_t CHUNK_BLOB_VERSION = 1;

} // namespace rg
