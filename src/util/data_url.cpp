#include "util/data_url.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace devsnap::util {

std::optional<std::vector<uint8_t>> base64_decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }
    if (input.empty()) {
        return std::vector<uint8_t>{};
    }

    std::vector<uint8_t> out(input.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                            static_cast<int>(input.size()));
    if (n < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::optional<DecodedDataUrl> decode_data_url(const std::string& url) {
    static const std::string scheme = "data:";
    static const std::string marker = ";base64,";

    if (url.size() < scheme.size() ||
        !std::equal(scheme.begin(), scheme.end(), url.begin(),
                    [](char a, char b) { return a == std::tolower(static_cast<unsigned char>(b)); })) {
        return std::nullopt;
    }

    auto pos = url.find(marker, scheme.size());
    if (pos == std::string::npos || pos == scheme.size()) {
        return std::nullopt;
    }

    auto bytes = base64_decode(url.substr(pos + marker.size()));
    if (!bytes) {
        return std::nullopt;
    }

    DecodedDataUrl decoded;
    decoded.mime_type = url.substr(scheme.size(), pos - scheme.size());
    decoded.bytes = std::move(*bytes);
    return decoded;
}

} // namespace devsnap::util
