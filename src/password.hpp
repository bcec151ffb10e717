// Usage:
//
//   Password password(finder);
//   E<Hash> h = password.hash("secret").addPepper().withArgon2();
//   E<bool> ok = password.check("secret", h->encoded()).addPepper()
//       .withArgon2();
//   E<HashUpdate> update = password.check("secret", old_hash)
//       .andUpdate().with(*old_strategy, *new_strategy);
//
// The builders keep a pointer to the finder, so the finder has to
// outlive them.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "algorithm_finder.hpp"
#include "codec.hpp"
#include "error.hpp"
#include "hash.hpp"

struct HashUpdate
{
    bool verified = false;
    // Only there if verified.
    std::optional<Hash> hash;
};

class HashBuilder
{
public:
    HashBuilder(const AlgorithmFinder& finder, std::string plain);

    HashBuilder& addSalt(Bytes salt);
    HashBuilder& addSalt(std::string_view salt);
    // Let the strategy generate the salt, with its own salt length.
    HashBuilder& addRandomSalt();
    HashBuilder& addRandomSalt(size_t length);
    HashBuilder& addPepper(std::string_view pepper);
    // Use the configured pepper, if any.
    HashBuilder& addPepper();

    E<Hash> with(const HashingStrategy& strategy) const;
    E<Hash> withBCrypt() const;
    E<Hash> withSCrypt() const;
    E<Hash> withPBKDF2() const;
    E<Hash> withCompressedPBKDF2() const;
    E<Hash> withArgon2() const;
    E<Hash> withMessageDigest() const;

private:
    E<Hash> withFound(E<HashingStrategy> strategy) const;

    const AlgorithmFinder* finder;
    std::string plain;
    std::optional<Bytes> salt;
    std::optional<std::string> pepper;
};

class HashUpdater;

class HashChecker
{
public:
    HashChecker(const AlgorithmFinder& finder,
                std::optional<std::string> plain, std::string hashed);

    HashChecker& addPepper(std::string_view pepper);
    HashChecker& addPepper();
    // Only needed for the formats that do not embed the salt.
    HashChecker& addSalt(Bytes salt);
    HashChecker& addSalt(std::string_view salt);

    // False without touching the strategy if there is no plain text.
    E<bool> with(const HashingStrategy& strategy) const;
    E<bool> withBCrypt() const;
    E<bool> withSCrypt() const;
    E<bool> withPBKDF2() const;
    E<bool> withCompressedPBKDF2() const;
    E<bool> withArgon2() const;
    E<bool> withMessageDigest() const;

    // Rehash with the same plain text, salt and pepper after a
    // successful check.
    HashUpdater andUpdate() const;

    const std::optional<std::string>& plainText() const { return plain; }
    const std::optional<Bytes>& salt() const { return check_salt; }
    const std::optional<std::string>& pepper() const { return check_pepper; }

private:
    E<bool> withFound(E<HashingStrategy> strategy) const;

    const AlgorithmFinder* finder;
    std::optional<std::string> plain;
    std::string hashed;
    std::optional<Bytes> check_salt;
    std::optional<std::string> check_pepper;
};

class HashUpdater
{
public:
    HashUpdater(const AlgorithmFinder& finder, HashChecker checker);

    HashUpdater& addNewSalt(Bytes salt);
    HashUpdater& addNewSalt(std::string_view salt);
    HashUpdater& addNewRandomSalt();
    HashUpdater& addNewRandomSalt(size_t length);
    HashUpdater& addNewPepper(std::string_view pepper);
    HashUpdater& addNewPepper();

    // Check with “check_strategy”, and only if that succeeds, hash
    // again with “update_strategy”.
    E<HashUpdate> with(const HashingStrategy& check_strategy,
                       const HashingStrategy& update_strategy) const;
    E<HashUpdate> with(const HashingStrategy& strategy) const;
    E<HashUpdate> withBCrypt() const;
    E<HashUpdate> withSCrypt() const;
    E<HashUpdate> withPBKDF2() const;
    E<HashUpdate> withCompressedPBKDF2() const;
    E<HashUpdate> withArgon2() const;
    E<HashUpdate> withMessageDigest() const;

private:
    E<HashUpdate> withFound(E<HashingStrategy> strategy) const;

    const AlgorithmFinder* finder;
    HashChecker checker;
    HashBuilder builder;
};

// Entry point of the builders.
class Password
{
public:
    explicit Password(const AlgorithmFinder& f) : finder(f) {}

    HashBuilder hash(std::string_view plain) const;
    HashChecker check(std::optional<std::string> plain,
                      std::string_view hashed) const;

private:
    const AlgorithmFinder& finder;
};
