#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec.hpp"
#include "error.hpp"

// Plain PBKDF2 encodes only the derived key in Base64. The salt has
// to be stored and supplied separately.
struct PBKDF2Params
{
    enum Hmac
    {
        SHA1,
        SHA224,
        SHA256,
        SHA384,
        SHA512,
    };

    Hmac hmac = SHA512;
    uint32_t iterations = 310000;
    // Length of the derived key in bits.
    uint32_t length = 512;

    bool operator==(const PBKDF2Params& rhs) const = default;
};

// Same derivation as PBKDF2Params, encoded as
// “$<hmac code>$<iterations << 32 | length>$<base64 salt>$<base64 key>”,
// so it can be checked without a separate salt.
struct CompressedPBKDF2Params : PBKDF2Params
{
    bool operator==(const CompressedPBKDF2Params& rhs) const = default;
};

struct CompressedPBKDF2Artifact
{
    CompressedPBKDF2Params params;
    Bytes salt;
    Bytes derived;
};

// Accepts “SHA256” as well as “PBKDF2WithHmacSHA256”, in any case.
std::optional<PBKDF2Params::Hmac> hmacFromName(std::string_view name);
std::string_view hmacName(PBKDF2Params::Hmac hmac);
// 1 for SHA1 up to 5 for SHA512.
int hmacCode(PBKDF2Params::Hmac hmac);

E<void> validate(const PBKDF2Params& params);
E<std::string> derive(const PBKDF2Params& params, std::string_view secret,
                      const Bytes& salt);
E<bool> verify(const PBKDF2Params& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);
uint64_t requiredMemory(const PBKDF2Params& params);

E<std::string> derive(const CompressedPBKDF2Params& params,
                      std::string_view secret, const Bytes& salt);
E<bool> verify(const CompressedPBKDF2Params& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);

bool isCompressedPBKDF2(std::string_view encoded);
E<CompressedPBKDF2Artifact> parseCompressedPBKDF2(std::string_view encoded);
