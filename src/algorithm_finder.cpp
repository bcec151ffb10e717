#include <format>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "algorithm_finder.hpp"
#include "utils.hpp"

namespace {

// Turn a parse failure of a named value into a ConfigurationError.
template<typename T>
E<T> requireName(const std::optional<T>& value, const std::string& key,
                 const std::string& name)
{
    if(!value.has_value())
    {
        return std::unexpected(configurationError(std::format(
            "Unknown value for {}: {}", key, name)));
    }
    return *value;
}

} // namespace

AlgorithmFinder::AlgorithmFinder()
        : AlgorithmFinder(Configuration())
{
}

AlgorithmFinder::AlgorithmFinder(
    Configuration conf, std::shared_ptr<const SaltGeneratorInterface> gen)
        : config(std::move(conf)), salt_generator(std::move(gen))
{
}

E<HashingStrategy> AlgorithmFinder::strategyFrom(
    HashingStrategy::Params params) const
{
    ASSIGN_OR_RETURN(size_t length, saltLength());
    auto strategy = HashingStrategy::create(std::move(params), salt_generator,
                                            length);
    if(!strategy.has_value())
    {
        spdlog::warn("Configured hashing parameters are invalid: {}",
                     errorMsg(strategy.error()));
        return std::unexpected(configurationError(
            "Invalid hashing parameters in configuration: " +
            errorMsg(strategy.error())));
    }
    return strategy;
}

E<HashingStrategy> AlgorithmFinder::bcrypt() const
{
    BCryptParams params;
    if(auto minor = config.get("hash.bcrypt.minor"); minor.has_value())
    {
        if(minor->size() != 1)
        {
            return std::unexpected(configurationError(
                "Invalid value for hash.bcrypt.minor: " + *minor));
        }
        params.minor = (*minor)[0];
    }
    ASSIGN_OR_RETURN(params.rounds, config.getNumber<uint32_t>(
        "hash.bcrypt.rounds", params.rounds));
    return strategyFrom(params);
}

E<HashingStrategy> AlgorithmFinder::scrypt() const
{
    SCryptParams params;
    ASSIGN_OR_RETURN(params.work_factor, config.getNumber<uint64_t>(
        "hash.scrypt.workfactor", params.work_factor));
    ASSIGN_OR_RETURN(params.resources, config.getNumber<uint32_t>(
        "hash.scrypt.resources", params.resources));
    ASSIGN_OR_RETURN(params.parallelization, config.getNumber<uint32_t>(
        "hash.scrypt.parallelization", params.parallelization));
    ASSIGN_OR_RETURN(params.derived_length, config.getNumber<size_t>(
        "hash.scrypt.length", params.derived_length));
    return strategyFrom(params);
}

E<PBKDF2Params> AlgorithmFinder::pbkdf2Params() const
{
    PBKDF2Params params;
    if(auto name = config.get("hash.pbkdf2.algorithm"); name.has_value())
    {
        ASSIGN_OR_RETURN(params.hmac, requireName(
            hmacFromName(*name), "hash.pbkdf2.algorithm", *name));
    }
    ASSIGN_OR_RETURN(params.iterations, config.getNumber<uint32_t>(
        "hash.pbkdf2.iterations", params.iterations));
    ASSIGN_OR_RETURN(params.length, config.getNumber<uint32_t>(
        "hash.pbkdf2.length", params.length));
    return params;
}

E<HashingStrategy> AlgorithmFinder::pbkdf2() const
{
    ASSIGN_OR_RETURN(PBKDF2Params params, pbkdf2Params());
    return strategyFrom(params);
}

E<HashingStrategy> AlgorithmFinder::compressedPBKDF2() const
{
    ASSIGN_OR_RETURN(PBKDF2Params params, pbkdf2Params());
    CompressedPBKDF2Params compressed;
    static_cast<PBKDF2Params&>(compressed) = params;
    return strategyFrom(compressed);
}

E<HashingStrategy> AlgorithmFinder::argon2() const
{
    Argon2Params params;
    ASSIGN_OR_RETURN(params.memory, config.getNumber<uint32_t>(
        "hash.argon2.memory", params.memory));
    ASSIGN_OR_RETURN(params.iterations, config.getNumber<uint32_t>(
        "hash.argon2.iterations", params.iterations));
    ASSIGN_OR_RETURN(params.parallelism, config.getNumber<uint32_t>(
        "hash.argon2.parallelism", params.parallelism));
    ASSIGN_OR_RETURN(params.length, config.getNumber<uint32_t>(
        "hash.argon2.length", params.length));
    if(auto name = config.get("hash.argon2.type"); name.has_value())
    {
        ASSIGN_OR_RETURN(params.type, requireName(
            argon2TypeFromName(*name), "hash.argon2.type", *name));
    }
    ASSIGN_OR_RETURN(params.version, config.getNumber<uint32_t>(
        "hash.argon2.version", params.version));
    return strategyFrom(params);
}

E<HashingStrategy> AlgorithmFinder::messageDigest() const
{
    MessageDigestParams params;
    if(auto name = config.get("hash.md.algorithm"); name.has_value())
    {
        ASSIGN_OR_RETURN(params.algorithm, requireName(
            digestAlgorithmFromName(*name), "hash.md.algorithm", *name));
    }
    if(auto name = config.get("hash.md.salt.option"); name.has_value())
    {
        ASSIGN_OR_RETURN(params.salt_option, requireName(
            saltOptionFromName(*name), "hash.md.salt.option", *name));
    }
    return strategyFrom(params);
}

E<HashingStrategy> AlgorithmFinder::byName(std::string_view name) const
{
    std::string n(strip(name));
    toLower(n);
    if(n == "bcrypt") return bcrypt();
    if(n == "scrypt") return scrypt();
    if(n == "pbkdf2") return pbkdf2();
    if(n == "compressed-pbkdf2") return compressedPBKDF2();
    if(n == "argon2") return argon2();
    if(n == "message-digest") return messageDigest();
    return std::unexpected(configurationError(
        "Unknown hashing algorithm: " + std::string(name)));
}

E<HashingStrategy> AlgorithmFinder::defaultStrategy() const
{
    return byName(config.get("hash.default", "argon2"));
}

std::optional<std::string> AlgorithmFinder::pepper() const
{
    return config.get("global.pepper");
}

E<size_t> AlgorithmFinder::saltLength() const
{
    return config.getNumber<size_t>("global.salt.length", DEFAULT_SALT_LENGTH);
}
