#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec.hpp"
#include "error.hpp"

// PHC string format:
// “$argon2id$v=19$m=15360,t=2,p=1$<base64 salt>$<base64 hash>”, with
// unpadded Base64.
struct Argon2Params
{
    enum Type
    {
        D,
        I,
        ID,
    };

    // In KiB.
    uint32_t memory = 15360;
    uint32_t iterations = 2;
    uint32_t parallelism = 1;
    // Length of the raw hash in bytes.
    uint32_t length = 32;
    Type type = ID;
    // 0x10 or 0x13.
    uint32_t version = 0x13;

    bool operator==(const Argon2Params& rhs) const = default;
};

struct Argon2Artifact
{
    Argon2Params params;
    Bytes salt;
    Bytes derived;
};

constexpr size_t ARGON2_MIN_SALT_LENGTH_BYTES = 8;

// “d”, “i”, “id”, optionally prefixed with “argon2”, in any case.
std::optional<Argon2Params::Type> argon2TypeFromName(std::string_view name);
std::string_view argon2TypeName(Argon2Params::Type type);

E<void> validate(const Argon2Params& params);
E<std::string> derive(const Argon2Params& params, std::string_view secret,
                      const Bytes& salt);
E<bool> verify(const Argon2Params& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);
uint64_t requiredMemory(const Argon2Params& params);

bool isArgon2(std::string_view encoded);
E<Argon2Artifact> parseArgon2(std::string_view encoded);
