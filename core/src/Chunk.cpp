#include "rg/core/types/Chunk.hpp"
#include "rg/core/util/Errors.hpp"

#include <arpa/inet.h>

#include <cstring>
#include <stdexcept>
#include <string>

namespace rg {

const char* encodingName(ChunkEncoding e)
{
    switch (e) {
        case ChunkEncoding::Uniform: return "uniform";
        case ChunkEncoding::Dense:   return "dense";
        case ChunkEncoding::Sparse:  return "sparse";
    }
    return "unknown";
}

namespace {

// Approximate per-entry cost of a std::map node (three pointers, colour, key, value).
template<typename T>
constexpr std::size_t kSparseEntryBytes = 4 * sizeof(void*) + sizeof(std::uint32_t) + sizeof(T);

// Blob header: magic, version, encoding, cell type, rows, cols
constexpr std::size_t kHeaderBytes = 4 + 4 + 1 + 1 + 4 + 4;

class BlobWriter
{
public:
    explicit BlobWriter(std::size_t reserve) { _buf.reserve(reserve); }

    void u8(std::uint8_t v) { _buf.push_back(v); }
    void u32(std::uint32_t v)
    {
        std::uint32_t n = htonl(v);
        raw(&n, sizeof(n));
    }
    template<typename T>
    void value(T v) { raw(&v, sizeof(T)); }
    void raw(const void* p, std::size_t n)
    {
        auto* b = static_cast<const std::uint8_t*>(p);
        _buf.insert(_buf.end(), b, b + n);
    }

    std::vector<std::uint8_t> take() { return std::move(_buf); }

private:
    std::vector<std::uint8_t> _buf;
};

class BlobReader
{
public:
    explicit BlobReader(const std::vector<std::uint8_t>& blob) : _blob(blob) {}

    std::uint8_t u8()
    {
        need(1);
        return _blob[_pos++];
    }
    std::uint32_t u32()
    {
        std::uint32_t n;
        raw(&n, sizeof(n));
        return ntohl(n);
    }
    template<typename T>
    T value()
    {
        T v;
        raw(&v, sizeof(T));
        return v;
    }
    void raw(void* out, std::size_t n)
    {
        need(n);
        std::memcpy(out, _blob.data() + _pos, n);
        _pos += n;
    }
    std::size_t remaining() const { return _blob.size() - _pos; }

private:
    void need(std::size_t n) const
    {
        if (remaining() < n) {
            throw CorruptChunkError("truncated blob (" + std::to_string(_blob.size()) + " bytes)");
        }
    }

    const std::vector<std::uint8_t>& _blob;
    std::size_t _pos = 0;
};

} // namespace

template<typename T>
Chunk<T>::Chunk(int rows, int cols, T value)
    : _rows(rows), _cols(cols), _rep(Uniform{value})
{
}

template<typename T>
Chunk<T>::Chunk(int rows, int cols, std::variant<Uniform, Dense, Sparse> rep)
    : _rows(rows), _cols(cols), _rep(std::move(rep))
{
}

template<typename T>
ChunkEncoding Chunk<T>::encoding() const
{
    return static_cast<ChunkEncoding>(_rep.index());
}

template<typename T>
T Chunk<T>::get(int r, int c) const
{
    if (auto* u = std::get_if<Uniform>(&_rep))
        return u->value;
    if (auto* d = std::get_if<Dense>(&_rep))
        return d->values(r, c);
    const auto& s = std::get<Sparse>(_rep);
    auto it = s.values.find(offset(r, c));
    return it == s.values.end() ? s.fill : it->second;
}

template<typename T>
bool Chunk<T>::wouldPromote(int, int, T v) const
{
    auto* u = std::get_if<Uniform>(&_rep);
    return u && !(u->value == v);
}

template<typename T>
T Chunk<T>::set(int r, int c, T v, ChunkEncoding promoteTo)
{
    if (auto* u = std::get_if<Uniform>(&_rep)) {
        if (u->value == v)
            return v;
        promote(promoteTo);
    }

    if (auto* d = std::get_if<Dense>(&_rep)) {
        T prev = d->values(r, c);
        d->values(r, c) = v;
        return prev;
    }

    auto& s = std::get<Sparse>(_rep);
    const std::uint32_t off = offset(r, c);
    auto it = s.values.find(off);
    T prev = it == s.values.end() ? s.fill : it->second;
    if (v == s.fill) {
        if (it != s.values.end())
            s.values.erase(it);
    } else if (it != s.values.end()) {
        it->second = v;
    } else {
        s.values.emplace(off, v);
    }
    return prev;
}

template<typename T>
void Chunk<T>::promote(ChunkEncoding target)
{
    if (target == ChunkEncoding::Uniform) {
        throw std::invalid_argument("Chunk::promote: Uniform is not a promotion target");
    }
    if (encoding() == target)
        return;

    if (target == ChunkEncoding::Dense) {
        typename xt::xtensor<T, 2>::shape_type shape = {std::size_t(_rows), std::size_t(_cols)};
        if (auto* u = std::get_if<Uniform>(&_rep)) {
            Dense dense{xt::xtensor<T, 2>(shape, u->value)};
            _rep = std::move(dense);
        } else {
            const auto& s = std::get<Sparse>(_rep);
            Dense dense{xt::xtensor<T, 2>(shape, s.fill)};
            for (const auto& [off, v] : s.values)
                dense.values(off / std::uint32_t(_cols), off % std::uint32_t(_cols)) = v;
            _rep = std::move(dense);
        }
        return;
    }

    // Sparse
    if (auto* u = std::get_if<Uniform>(&_rep)) {
        _rep = Sparse{u->value, {}};
        return;
    }
    throw std::invalid_argument("Chunk::promote: cannot convert dense chunk to sparse");
}

template<typename T>
bool Chunk<T>::prefersDense() const
{
    auto* s = std::get_if<Sparse>(&_rep);
    return s && memoryBytes() > bytesAs(ChunkEncoding::Dense);
}

template<typename T>
std::size_t Chunk<T>::memoryBytes() const
{
    return bytesAs(encoding());
}

template<typename T>
std::size_t Chunk<T>::bytesAs(ChunkEncoding target) const
{
    switch (target) {
        case ChunkEncoding::Uniform:
            return sizeof(Chunk<T>);
        case ChunkEncoding::Dense:
            return sizeof(Chunk<T>) + cellCount() * sizeof(T);
        case ChunkEncoding::Sparse: {
            auto* s = std::get_if<Sparse>(&_rep);
            std::size_t n = s ? s->values.size() : 0;
            return sizeof(Chunk<T>) + n * kSparseEntryBytes<T>;
        }
    }
    return sizeof(Chunk<T>);
}

template<typename T>
std::vector<std::uint8_t> Chunk<T>::serialize() const
{
    BlobWriter w(kHeaderBytes + memoryBytes());
    w.u32(CHUNK_BLOB_MAGIC);
    w.u32(CHUNK_BLOB_VERSION);
    w.u8(static_cast<std::uint8_t>(encoding()));
    w.u8(CellType<T>::tag);
    w.u32(std::uint32_t(_rows));
    w.u32(std::uint32_t(_cols));

    if (auto* u = std::get_if<Uniform>(&_rep)) {
        w.value(u->value);
    } else if (auto* d = std::get_if<Dense>(&_rep)) {
        w.raw(d->values.data(), d->values.size() * sizeof(T));
    } else {
        const auto& s = std::get<Sparse>(_rep);
        w.value(s.fill);
        w.u32(std::uint32_t(s.values.size()));
        for (const auto& [off, v] : s.values) {
            w.u32(off);
            w.value(v);
        }
    }
    return w.take();
}

template<typename T>
Chunk<T> Chunk<T>::deserialize(const std::vector<std::uint8_t>& blob, int rows, int cols)
{
    BlobReader r(blob);

    const std::uint32_t magic = r.u32();
    if (magic != CHUNK_BLOB_MAGIC) {
        throw CorruptChunkError("magic mismatch");
    }
    const std::uint32_t version = r.u32();
    if (version != CHUNK_BLOB_VERSION) {
        throw CorruptChunkError("unsupported blob version " + std::to_string(version));
    }
    const std::uint8_t enc = r.u8();
    if (enc > static_cast<std::uint8_t>(ChunkEncoding::Sparse)) {
        throw CorruptChunkError("unknown encoding tag " + std::to_string(enc));
    }
    const std::uint8_t dtype = r.u8();
    if (dtype != CellType<T>::tag) {
        throw CorruptChunkError("cell type tag " + std::to_string(dtype) +
                                " does not match " + CellType<T>::name);
    }
    const std::uint32_t blobRows = r.u32();
    const std::uint32_t blobCols = r.u32();
    if (blobRows != std::uint32_t(rows) || blobCols != std::uint32_t(cols)) {
        throw CorruptChunkError("dimensions " + std::to_string(blobRows) + "x" + std::to_string(blobCols) +
                                " do not match expected " + std::to_string(rows) + "x" + std::to_string(cols));
    }

    const std::size_t cells = std::size_t(rows) * std::size_t(cols);
    std::variant<Uniform, Dense, Sparse> rep{Uniform{T{}}};

    switch (static_cast<ChunkEncoding>(enc)) {
        case ChunkEncoding::Uniform:
            rep = Uniform{r.value<T>()};
            break;
        case ChunkEncoding::Dense: {
            if (r.remaining() != cells * sizeof(T)) {
                throw CorruptChunkError("dense payload is " + std::to_string(r.remaining()) +
                                        " bytes, expected " + std::to_string(cells * sizeof(T)));
            }
            typename xt::xtensor<T, 2>::shape_type shape = {std::size_t(rows), std::size_t(cols)};
            Dense dense{xt::xtensor<T, 2>::from_shape(shape)};
            r.raw(dense.values.data(), cells * sizeof(T));
            rep = std::move(dense);
            break;
        }
        case ChunkEncoding::Sparse: {
            Sparse sparse{r.value<T>(), {}};
            const std::uint32_t n = r.u32();
            if (n > cells) {
                throw CorruptChunkError("sparse entry count " + std::to_string(n) + " exceeds cell count");
            }
            std::int64_t last = -1;
            for (std::uint32_t i = 0; i < n; ++i) {
                const std::uint32_t off = r.u32();
                const T v = r.value<T>();
                if (off >= cells || std::int64_t(off) <= last) {
                    throw CorruptChunkError("sparse offset " + std::to_string(off) + " out of order or range");
                }
                last = off;
                sparse.values.emplace_hint(sparse.values.end(), off, v);
            }
            rep = std::move(sparse);
            break;
        }
    }

    if (r.remaining() != 0) {
        throw CorruptChunkError(std::to_string(r.remaining()) + " trailing bytes");
    }
    return Chunk(rows, cols, std::move(rep));
}

template class Chunk<std::int32_t>;
template class Chunk<float>;
template class Chunk<double>;

} // namespace rg
