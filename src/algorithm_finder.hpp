#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "salt_generator.hpp"

// Turns the configuration into hashing strategies. Anything not set
// in the configuration takes the default value of the parameter
// structs. Every function returns a ConfigurationError if the
// configuration has a value that does not make sense, including a
// parameter set that the algorithm rejects.
class AlgorithmFinder
{
public:
    AlgorithmFinder();
    explicit AlgorithmFinder(
        Configuration config,
        std::shared_ptr<const SaltGeneratorInterface> salt_generator =
        SaltGenerator::shared());

    E<HashingStrategy> bcrypt() const;
    E<HashingStrategy> scrypt() const;
    E<HashingStrategy> pbkdf2() const;
    E<HashingStrategy> compressedPBKDF2() const;
    E<HashingStrategy> argon2() const;
    E<HashingStrategy> messageDigest() const;

    // Names are the ones from HashingStrategy::name(), in any case.
    E<HashingStrategy> byName(std::string_view name) const;
    // The algorithm under “hash.default”, Argon2 if not set.
    E<HashingStrategy> defaultStrategy() const;

    // The value of “global.pepper”.
    std::optional<std::string> pepper() const;
    // The value of “global.salt.length”.
    E<size_t> saltLength() const;
    std::shared_ptr<const SaltGeneratorInterface> saltGenerator() const
    {
        return salt_generator;
    }

private:
    E<HashingStrategy> strategyFrom(HashingStrategy::Params params) const;
    E<PBKDF2Params> pbkdf2Params() const;

    Configuration config;
    std::shared_ptr<const SaltGeneratorInterface> salt_generator;
};
