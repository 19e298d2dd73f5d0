#pragma once

#include "rg/core/types/BlobStore.hpp"
#include "rg/core/util/EvictionRegistry.hpp"
#include "rg/core/util/MemoryProbe.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace rg_test {

// Free memory = base - resident chunk bytes, with base adjustable from the test.
class ControlledProbe : public rg::MemoryProbe
{
public:
    explicit ControlledProbe(std::shared_ptr<std::size_t> base) : _base(std::move(base)) {}

    std::size_t freeBytes(const rg::EvictionRegistry& registry) const override
    {
        const std::size_t used = registry.residentBytes();
        return used >= *_base ? 0 : *_base - used;
    }

private:
    std::shared_ptr<std::size_t> _base;
};

inline constexpr std::size_t kPlenty = std::size_t(1) << 40;

struct RegistryFixture {
    std::shared_ptr<std::size_t> base = std::make_shared<std::size_t>(kPlenty);
    std::shared_ptr<rg::MemoryBlobStore> store = std::make_shared<rg::MemoryBlobStore>();
    rg::EvictionRegistry registry;

    explicit RegistryFixture(rg::RegistryConfig cfg = {})
        : registry(cfg, store, std::make_unique<ControlledProbe>(base))
    {
    }

    // Leave exactly `missing` bytes of headroom short of the threshold.
    void squeeze(std::size_t missing)
    {
        *base = registry.residentBytes() + registry.config().memoryThreshold - missing;
    }
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir
{
public:
    explicit TempDir(const std::string& tag)
    {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        _path = std::filesystem::temp_directory_path() /
                ("rg_test_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return _path; }

private:
    std::filesystem::path _path;
};

} // namespace rg_test
