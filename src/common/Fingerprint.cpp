#include "common/Fingerprint.h"
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace emis {

std::string Fingerprint::sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(hash[i]);
    }
    return hex_stream.str();
}

std::string Fingerprint::of(const std::map<std::string, std::string>& params) {
    std::ostringstream query_stream;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) query_stream << "&";
        query_stream << key << "=" << value;
        first = false;
    }
    return sha256Hex(query_stream.str());
}

std::string Fingerprint::shortId(const std::map<std::string, std::string>& params) {
    return of(params).substr(0, 12);
}

} // namespace emis
