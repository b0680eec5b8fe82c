#pragma once
#include <string>

namespace devsnap::util {

// Random (version 4) UUID drawn from the OpenSSL CSPRNG, e.g.
// "3f2b8c1e-9a4d-4e7f-b1c2-0d9e8f7a6b5c". Returns an empty string if the
// generator cannot be seeded.
std::string generate_request_id();

} // namespace devsnap::util
