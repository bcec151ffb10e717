#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec.hpp"
#include "error.hpp"

// Encoded as “$s0$<params>$<base64 salt>$<base64 derived>”, where
// <params> is the lower case hex of (log2(N) << 16 | r << 8 | p).
struct SCryptParams
{
    // N, a power of 2.
    uint64_t work_factor = 32768;
    // r, the block size.
    uint32_t resources = 8;
    // p
    uint32_t parallelization = 1;
    // Length of the derived key in bytes.
    size_t derived_length = 32;

    bool operator==(const SCryptParams& rhs) const = default;
};

struct SCryptArtifact
{
    SCryptParams params;
    Bytes salt;
    Bytes derived;
};

E<void> validate(const SCryptParams& params);
E<std::string> derive(const SCryptParams& params, std::string_view secret,
                      const Bytes& salt);
E<bool> verify(const SCryptParams& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);
// 128 * N * r * p
uint64_t requiredMemory(const SCryptParams& params);

// Pack N, r and p into a single integer. N must be a power of 2 and r
// and p must fit in a byte.
uint64_t packSCryptParams(const SCryptParams& params);
// The inverse of packSCryptParams(). The derived length is not part
// of the packed value and is left at its default.
E<SCryptParams> unpackSCryptParams(uint64_t packed);

bool isSCrypt(std::string_view encoded);
E<SCryptArtifact> parseSCrypt(std::string_view encoded);
