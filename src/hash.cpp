#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

namespace {
    std::vector<unsigned char> calculate_digest(const fs::path& file_path, const EVP_MD* md) {
        std::ifstream file(file_path, std::ios::binary);
        if (!file) {
            throw PkgcdnException(string_format("error.open_file_failed", file_path.string()));
        }

        EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
        if (!md_ctx) {
            throw PkgcdnException(get_string("error.openssl_ctx_failed"));
        }

        if (EVP_DigestInit_ex(md_ctx.get(), md, nullptr) != 1) {
            throw PkgcdnException(get_string("error.openssl_init_failed"));
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer))) {
            if (EVP_DigestUpdate(md_ctx.get(), buffer, file.gcount()) != 1) {
                throw PkgcdnException(get_string("error.openssl_update_failed"));
            }
        }
        if (file.gcount() > 0) { // Handle the last chunk
            if (EVP_DigestUpdate(md_ctx.get(), buffer, file.gcount()) != 1) {
                throw PkgcdnException(get_string("error.openssl_update_failed"));
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len;
        if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
            throw PkgcdnException(get_string("error.openssl_final_failed"));
        }
        return std::vector<unsigned char>(hash, hash + hash_len);
    }

    std::string to_hex(const std::vector<unsigned char>& digest) {
        std::stringstream ss;
        for (unsigned char byte : digest) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
        return ss.str();
    }

    std::string to_base64(const std::vector<unsigned char>& digest) {
        std::string out(4 * ((digest.size() + 2) / 3), '\0');
        int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), digest.data(), static_cast<int>(digest.size()));
        out.resize(len);
        return out;
    }

    const EVP_MD* digest_for(const std::string& algorithm) {
        if (algorithm == "sha512") return EVP_sha512();
        if (algorithm == "sha384") return EVP_sha384();
        if (algorithm == "sha256") return EVP_sha256();
        if (algorithm == "sha1") return EVP_sha1();
        return nullptr;
    }

    // True if any supported hash in the SRI string matches. False if none
    // matches. std::nullopt if the string names no supported algorithm.
    std::optional<bool> check_integrity(const fs::path& file_path, const std::string& integrity) {
        std::istringstream entries(integrity);
        std::string entry;
        bool checked = false;
        while (entries >> entry) {
            size_t dash = entry.find('-');
            if (dash == std::string::npos) continue;
            const EVP_MD* md = digest_for(entry.substr(0, dash));
            if (!md) continue;

            std::string expected = entry.substr(dash + 1);
            size_t options = expected.find('?');
            if (options != std::string::npos) expected.resize(options);

            checked = true;
            if (to_base64(calculate_digest(file_path, md)) == expected) return true;
        }
        if (!checked) return std::nullopt;
        return false;
    }
}

std::string calculate_sha1(const fs::path& file_path) {
    return to_hex(calculate_digest(file_path, EVP_sha1()));
}

void verify_tarball(const fs::path& file_path, const std::string& integrity, const std::string& shasum) {
    if (!integrity.empty()) {
        auto result = check_integrity(file_path, integrity);
        if (result.has_value()) {
            if (!*result) throw UpstreamError(string_format("error.integrity_mismatch", file_path.filename().string()));
            return;
        }
        log_warning(string_format("warning.unsupported_integrity", integrity));
    }

    if (!shasum.empty() && calculate_sha1(file_path) != shasum) {
        throw UpstreamError(string_format("error.shasum_mismatch", file_path.filename().string()));
    }
}
