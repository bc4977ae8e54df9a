// SPDX-License-Identifier: MIT

// lib/stream/random_bytes.hpp
#pragma once

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstddef>
#include <expected>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

// Fill `out` from OpenSSL's CSPRNG. A failed draw is an error carrying
// `code`; there is no weaker fallback source.
inline std::expected<void, Error> FillRandomBytes(unsigned char* out, size_t len,
                                                  ErrorCode code, std::string_view what) {
    if (RAND_bytes(out, static_cast<int>(len)) == 1) {
        return {};
    }
    unsigned long err = ERR_get_error();
    char buf[256] = "unknown error";
    if (err != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
    }
    return std::unexpected(Error{code, fmt::format("Could not generate {}: {}", what, buf)});
}

}  // namespace jsonl_pipe
