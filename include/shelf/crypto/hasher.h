#pragma once

#include <shelf/core/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace shelf::crypto {

/**
 * Digest algorithms understood by the manifest. The catalog service publishes MD5.
 */
enum class HashAlgo { Md5, Sha256 };

const char* algoName(HashAlgo algo) noexcept;
std::optional<HashAlgo> parseAlgo(std::string_view name) noexcept;

/**
 * Declared content hash: algorithm + lower-case hex digest.
 * Persisted as "<algo>:<hex>", e.g. "md5:d41d8cd98f00b204e9800998ecf8427e".
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex;

    bool operator==(const Checksum&) const = default;

    std::string toString() const;
    static std::optional<Checksum> parse(std::string_view text);
};

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Streams the file through the digest in fixed-size blocks
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    [[nodiscard]] virtual HashAlgo algo() const noexcept = 0;

    // Progress callback support (bytes hashed, total bytes)
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;
    virtual void setProgressCallback(ProgressCallback callback) = 0;
};

// OpenSSL EVP implementation
class EvpHasher : public IContentHasher {
public:
    explicit EvpHasher(HashAlgo algo);
    ~EvpHasher() override;

    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;
    EvpHasher(EvpHasher&&) noexcept;
    EvpHasher& operator=(EvpHasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    [[nodiscard]] HashAlgo algo() const noexcept override { return algo_; }

    void setProgressCallback(ProgressCallback callback) override;

    // One-shot hashing of an in-memory buffer
    static std::string hash(HashAlgo algo, std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    HashAlgo algo_;
};

// Factory function
std::unique_ptr<IContentHasher> createHasher(HashAlgo algo);

} // namespace shelf::crypto
