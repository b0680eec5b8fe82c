#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devsnap::util {

struct DecodedDataUrl {
    std::string mime_type;
    std::vector<uint8_t> bytes;
};

// Decode standard base64 (padding required, whitespace not allowed)
std::optional<std::vector<uint8_t>> base64_decode(const std::string& input);

// Decode "data:<mime>;base64,<payload>". nullopt if the URL is not in that form.
std::optional<DecodedDataUrl> decode_data_url(const std::string& url);

} // namespace devsnap::util
