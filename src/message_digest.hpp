#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec.hpp"
#include "error.hpp"

// A single pass of a message digest over the salted secret, encoded
// as lower case hex. This is only here to verify and migrate away
// from legacy hashes. The salt is not part of the encoding.
struct MessageDigestParams
{
    enum Algorithm
    {
        MD5,
        SHA1,
        SHA224,
        SHA256,
        SHA384,
        SHA512,
        SHA3_256,
        SHA3_512,
    };

    enum SaltOption
    {
        PREPEND,
        APPEND,
    };

    Algorithm algorithm = SHA512;
    SaltOption salt_option = APPEND;

    bool operator==(const MessageDigestParams& rhs) const = default;
};

// Accepts names like “SHA-256”, “sha256” and “SHA3-512”.
std::optional<MessageDigestParams::Algorithm>
digestAlgorithmFromName(std::string_view name);
std::string_view digestAlgorithmName(MessageDigestParams::Algorithm algorithm);
std::optional<MessageDigestParams::SaltOption>
saltOptionFromName(std::string_view name);
// Size of the digest in bytes.
size_t digestSize(MessageDigestParams::Algorithm algorithm);

E<void> validate(const MessageDigestParams& params);
E<std::string> derive(const MessageDigestParams& params,
                      std::string_view secret, const Bytes& salt);
// Without a salt, the secret is digested as is.
E<bool> verify(const MessageDigestParams& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt);
uint64_t requiredMemory(const MessageDigestParams& params);
