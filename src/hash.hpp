#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "argon2.hpp"
#include "bcrypt.hpp"
#include "codec.hpp"
#include "error.hpp"
#include "message_digest.hpp"
#include "pbkdf2.hpp"
#include "salt_generator.hpp"
#include "scrypt.hpp"

constexpr size_t DEFAULT_SALT_LENGTH = 64;

class Hash;

// One hashing function with one set of parameters. A strategy only
// exists with valid parameters, and never changes after creation, so
// it can be copied around and shared between threads freely.
class HashingStrategy
{
public:
    using Params = std::variant<BCryptParams, SCryptParams, PBKDF2Params,
                                CompressedPBKDF2Params, Argon2Params,
                                MessageDigestParams>;

    // Fails with InvalidParametersError if “params” is outside of the
    // domain of the algorithm. The salt generator and the salt length
    // are used by hash(plain). BCrypt always uses 16 bytes of salt.
    static E<HashingStrategy> create(
        Params params,
        std::shared_ptr<const SaltGeneratorInterface> salt_generator =
        SaltGenerator::shared(),
        size_t salt_length = DEFAULT_SALT_LENGTH);

    // Recover the strategy that produced “encoded”. Only works for
    // the self-describing formats (BCrypt, SCrypt, compressed PBKDF2
    // and Argon2).
    static E<HashingStrategy> fromEncoded(
        std::string_view encoded,
        std::shared_ptr<const SaltGeneratorInterface> salt_generator =
        SaltGenerator::shared(),
        size_t salt_length = DEFAULT_SALT_LENGTH);

    // Hash with a freshly generated salt.
    E<Hash> hash(std::string_view plain) const;
    E<Hash> hash(std::string_view plain, const Bytes& salt) const;

    // A mismatch is false. A hash of another algorithm is false. A
    // hash of this algorithm that cannot be parsed is a FormatError.
    E<bool> check(std::string_view plain, std::string_view encoded) const;
    // For the formats that do not carry the salt (PBKDF2 and message
    // digests). For the others, “salt” has to be the salt in
    // “encoded”, otherwise the check fails.
    E<bool> check(std::string_view plain, std::string_view encoded,
                  const Bytes& salt) const;

    // Roughly how much memory one derivation needs.
    uint64_t requiredWorkingMemoryBytes() const;

    const Params& params() const { return parameters; }
    std::string_view name() const;
    size_t saltLength() const;
    Bytes generateSalt() const;
    Bytes generateSalt(size_t length) const;

    // The salt generator does not take part in the comparison.
    bool operator==(const HashingStrategy& rhs) const
    {
        return parameters == rhs.parameters &&
            salt_length == rhs.salt_length;
    }

private:
    HashingStrategy(Params params,
                    std::shared_ptr<const SaltGeneratorInterface> gen,
                    size_t salt_length);

    E<bool> checkWith(std::string_view plain, std::string_view encoded,
                      const std::optional<Bytes>& salt) const;

    Params parameters;
    std::shared_ptr<const SaltGeneratorInterface> salt_generator;
    size_t salt_length;
};

// The result of hashing a password. The pepper is never part of it.
class Hash
{
public:
    Hash(std::string encoded, Bytes salt, HashingStrategy strategy);

    // The string to store.
    const std::string& encoded() const { return encoded_hash; }
    const Bytes& salt() const { return raw_salt; }
    const HashingStrategy& strategy() const { return hashing_strategy; }

    bool operator==(const Hash& rhs) const = default;

private:
    std::string encoded_hash;
    Bytes raw_salt;
    HashingStrategy hashing_strategy;
};
