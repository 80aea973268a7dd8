#pragma once

#include <string>
#include <map>

namespace emis {

// Stable content hashes used to version cache artifacts.
class Fingerprint {
public:
    // SHA-256 over "k1=v1&k2=v2..." (keys in map order), lowercase hex
    static std::string of(const std::map<std::string, std::string>& params);

    // First 12 hex chars of of(params); short enough for file names
    static std::string shortId(const std::map<std::string, std::string>& params);

    static std::string sha256Hex(const std::string& data);
};

} // namespace emis
