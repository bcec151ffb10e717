#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "hash.hpp"
#include "utils.hpp"

namespace {

struct NameVisitor
{
    std::string_view operator()(const BCryptParams&) const
    {
        return "bcrypt";
    }
    std::string_view operator()(const SCryptParams&) const
    {
        return "scrypt";
    }
    std::string_view operator()(const PBKDF2Params&) const
    {
        return "pbkdf2";
    }
    std::string_view operator()(const CompressedPBKDF2Params&) const
    {
        return "compressed-pbkdf2";
    }
    std::string_view operator()(const Argon2Params&) const
    {
        return "argon2";
    }
    std::string_view operator()(const MessageDigestParams&) const
    {
        return "message-digest";
    }
};

E<HashingStrategy::Params> paramsFromEncoded(std::string_view encoded)
{
    if(isBCrypt(encoded))
    {
        ASSIGN_OR_RETURN(BCryptParams params, bcryptParamsFromEncoded(encoded));
        return params;
    }
    if(isSCrypt(encoded))
    {
        ASSIGN_OR_RETURN(SCryptArtifact artifact, parseSCrypt(encoded));
        return artifact.params;
    }
    if(isArgon2(encoded))
    {
        ASSIGN_OR_RETURN(Argon2Artifact artifact, parseArgon2(encoded));
        return artifact.params;
    }
    if(isCompressedPBKDF2(encoded))
    {
        ASSIGN_OR_RETURN(CompressedPBKDF2Artifact artifact,
                         parseCompressedPBKDF2(encoded));
        return artifact.params;
    }
    return std::unexpected(formatError(
        "Cannot tell the algorithm from the encoded hash"));
}

} // namespace

HashingStrategy::HashingStrategy(
    Params params, std::shared_ptr<const SaltGeneratorInterface> gen,
    size_t salt_len)
        : parameters(std::move(params)), salt_generator(std::move(gen)),
          salt_length(salt_len)
{
}

E<HashingStrategy> HashingStrategy::create(
    Params params, std::shared_ptr<const SaltGeneratorInterface> salt_generator,
    size_t salt_length)
{
    DO_OR_RETURN(std::visit([](const auto& p) { return validate(p); }, params));
    if(salt_generator == nullptr)
    {
        return std::unexpected(invalidParametersError(
            "A hashing strategy needs a salt generator"));
    }
    if(std::holds_alternative<Argon2Params>(params) &&
       salt_length < ARGON2_MIN_SALT_LENGTH_BYTES)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Argon2 needs a salt of at least {} bytes, got salt length {}",
            ARGON2_MIN_SALT_LENGTH_BYTES, salt_length)));
    }
    return HashingStrategy(std::move(params), std::move(salt_generator),
                           salt_length);
}

E<HashingStrategy> HashingStrategy::fromEncoded(
    std::string_view encoded,
    std::shared_ptr<const SaltGeneratorInterface> salt_generator,
    size_t salt_length)
{
    ASSIGN_OR_RETURN(Params params, paramsFromEncoded(encoded));
    auto strategy = create(std::move(params), std::move(salt_generator),
                           salt_length);
    if(!strategy.has_value() &&
       std::holds_alternative<InvalidParametersError>(strategy.error()))
    {
        return std::unexpected(formatError(
            "Encoded hash has invalid parameters: " +
            errorMsg(strategy.error())));
    }
    return strategy;
}

E<Hash> HashingStrategy::hash(std::string_view plain) const
{
    return hash(plain, generateSalt());
}

E<Hash> HashingStrategy::hash(std::string_view plain, const Bytes& salt) const
{
    auto encoded = std::visit([&](const auto& p) {
        return derive(p, plain, salt);
    }, parameters);
    if(!encoded.has_value())
    {
        spdlog::debug("Failed to hash with {}: {}", name(),
                      errorMsg(encoded.error()));
        return std::unexpected(encoded.error());
    }
    return Hash(*std::move(encoded), salt, *this);
}

E<bool> HashingStrategy::check(std::string_view plain,
                               std::string_view encoded) const
{
    return checkWith(plain, encoded, std::nullopt);
}

E<bool> HashingStrategy::check(std::string_view plain,
                               std::string_view encoded,
                               const Bytes& salt) const
{
    return checkWith(plain, encoded, salt);
}

E<bool> HashingStrategy::checkWith(std::string_view plain,
                                   std::string_view encoded,
                                   const std::optional<Bytes>& salt) const
{
    return std::visit([&](const auto& p) {
        return verify(p, plain, encoded, salt);
    }, parameters);
}

uint64_t HashingStrategy::requiredWorkingMemoryBytes() const
{
    return std::visit([](const auto& p) { return requiredMemory(p); },
                      parameters);
}

std::string_view HashingStrategy::name() const
{
    return std::visit(NameVisitor(), parameters);
}

size_t HashingStrategy::saltLength() const
{
    if(std::holds_alternative<BCryptParams>(parameters))
    {
        return BCRYPT_SALT_LENGTH;
    }
    return salt_length;
}

Bytes HashingStrategy::generateSalt() const
{
    return generateSalt(saltLength());
}

Bytes HashingStrategy::generateSalt(size_t length) const
{
    return salt_generator->generate(length);
}

Hash::Hash(std::string encoded, Bytes salt, HashingStrategy strategy)
        : encoded_hash(std::move(encoded)), raw_salt(std::move(salt)),
          hashing_strategy(std::move(strategy))
{
}
