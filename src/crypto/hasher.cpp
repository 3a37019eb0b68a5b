#include <shelf/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace shelf::crypto {

namespace {

const EVP_MD* digestFor(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return EVP_md5();
}

std::string toHex(const unsigned char* data, unsigned int len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

} // namespace

const char* algoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha256:
            return "sha256";
    }
    return "md5";
}

std::optional<HashAlgo> parseAlgo(std::string_view name) noexcept {
    if (name == "md5")
        return HashAlgo::Md5;
    if (name == "sha256")
        return HashAlgo::Sha256;
    return std::nullopt;
}

std::string Checksum::toString() const {
    std::string out(algoName(algo));
    out.push_back(':');
    out.append(hex);
    return out;
}

std::optional<Checksum> Checksum::parse(std::string_view text) {
    // A bare digest is what the catalog service hands out; it is MD5.
    std::string_view hexPart = text;
    HashAlgo algo = HashAlgo::Md5;
    if (auto colon = text.find(':'); colon != std::string_view::npos) {
        auto parsed = parseAlgo(text.substr(0, colon));
        if (!parsed)
            return std::nullopt;
        algo = *parsed;
        hexPart = text.substr(colon + 1);
    }

    const std::size_t expected = algo == HashAlgo::Md5 ? 32 : 64;
    if (hexPart.size() != expected)
        return std::nullopt;

    Checksum out;
    out.algo = algo;
    out.hex.reserve(hexPart.size());
    for (unsigned char c : hexPart) {
        if (!std::isxdigit(c))
            return std::nullopt;
        out.hex.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

struct EvpHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ProgressCallback progressCallback;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

EvpHasher::EvpHasher(HashAlgo algo) : pImpl(std::make_unique<Impl>()), algo_(algo) {
    init();
}

EvpHasher::~EvpHasher() = default;

EvpHasher::EvpHasher(EvpHasher&&) noexcept = default;
EvpHasher& EvpHasher::operator=(EvpHasher&&) noexcept = default;

void EvpHasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, digestFor(algo_), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void EvpHasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string EvpHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }
    return toHex(digest.data(), digestLen);
}

Result<std::string> EvpHasher::hashFile(const std::filesystem::path& path) {
    std::error_code ec;
    const auto total = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "Cannot stat " + path.string() + ": " + ec.message()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FilesystemError, "Cannot open " + path.string()};
    }

    try {
        init();
        std::array<char, 64 * 1024> buffer{};
        std::uint64_t processed = 0;
        while (file) {
            file.read(buffer.data(), buffer.size());
            const auto got = file.gcount();
            if (got <= 0)
                break;
            update(std::as_bytes(std::span(buffer.data(), static_cast<std::size_t>(got))));
            processed += static_cast<std::uint64_t>(got);
            if (pImpl->progressCallback) {
                pImpl->progressCallback(processed, total);
            }
        }
        if (file.bad()) {
            return Error{ErrorCode::FilesystemError, "Read failed for " + path.string()};
        }
        return finalize();
    } catch (const std::exception& e) {
        spdlog::error("Digest of {} failed: {}", path.string(), e.what());
        return Error{ErrorCode::Unknown, e.what()};
    }
}

void EvpHasher::setProgressCallback(ProgressCallback callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string EvpHasher::hash(HashAlgo algo, std::span<const std::byte> data) {
    EvpHasher hasher(algo);
    hasher.update(data);
    return hasher.finalize();
}

std::unique_ptr<IContentHasher> createHasher(HashAlgo algo) {
    return std::make_unique<EvpHasher>(algo);
}

} // namespace shelf::crypto
