#include "relay/upload/checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace relay::upload {
namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

Result<DigestContext, UploadError> make_md5_context() {
    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Err(UploadError(UploadErrorKind::Io, "Failed to create EVP_MD_CTX"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err(UploadError(UploadErrorKind::Io, "EVP_DigestInit_ex failed"));
    }
    return Ok(std::move(ctx));
}

Result<std::string, UploadError> finish_hex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &length) != 1) {
        return Err(UploadError(UploadErrorKind::Io, "EVP_DigestFinal_ex failed"));
    }
    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(out[i]);
    }
    return Ok(hex.str());
}

} // namespace

Result<std::string, UploadError> ChecksumComputer::digest(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(UploadError(UploadErrorKind::Io, "Failed to open for checksum: " + path.string()));
    }

    auto ctx = make_md5_context();
    if (ctx.is_error()) {
        return Err(ctx.error());
    }

    char buffer[kReadBlockSize];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.value().get(), buffer, count) != 1) {
            return Err(UploadError(UploadErrorKind::Io, "EVP_DigestUpdate failed"));
        }
    }
    if (input.bad()) {
        return Err(UploadError(UploadErrorKind::Io, "Failed to read for checksum: " + path.string()));
    }

    return finish_hex(ctx.value().get());
}

Result<std::string, UploadError> ChecksumComputer::digest(const std::uint8_t* data, std::size_t length) const {
    auto ctx = make_md5_context();
    if (ctx.is_error()) {
        return Err(ctx.error());
    }
    if (length > 0 && EVP_DigestUpdate(ctx.value().get(), data, length) != 1) {
        return Err(UploadError(UploadErrorKind::Io, "EVP_DigestUpdate failed"));
    }
    return finish_hex(ctx.value().get());
}

} // namespace relay::upload
