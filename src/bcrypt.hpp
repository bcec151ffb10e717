#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec.hpp"
#include "error.hpp"

// The modular crypt format “$2b$10$<22 chars salt><31 chars hash>”.
struct BCryptParams
{
    // One of a, b, y.
    char minor = 'b';
    // The cost is 2^rounds.
    uint32_t rounds = 10;

    bool operator==(const BCryptParams& rhs) const = default;
};

// BCrypt only takes 16 bytes of salt, no more, no less.
constexpr size_t BCRYPT_SALT_LENGTH = 16;

E<void> validate(const BCryptParams& params);
E<std::string> derive(const BCryptParams& params, std::string_view secret,
                      const Bytes& salt);
E<bool> verify(const BCryptParams& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);
uint64_t requiredMemory(const BCryptParams& params);

// Whether “encoded” claims to be a BCrypt hash, judging from the
// prefix alone.
bool isBCrypt(std::string_view encoded);
E<BCryptParams> bcryptParamsFromEncoded(std::string_view encoded);
