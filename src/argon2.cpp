#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include <argon2.h>
#include <spdlog/spdlog.h>

#include "argon2.hpp"
#include "codec.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace {

argon2_type toLibraryType(Argon2Params::Type type)
{
    switch(type)
    {
    case Argon2Params::D: return Argon2_d;
    case Argon2Params::I: return Argon2_i;
    case Argon2Params::ID: return Argon2_id;
    }
    std::unreachable();
}

std::string describe(const Argon2Params& params)
{
    return std::format("{}, m={}, t={}, p={}, length={}, version={}",
                       argon2TypeName(params.type), params.memory,
                       params.iterations, params.parallelism, params.length,
                       params.version);
}

E<Bytes> runArgon2(const Argon2Params& params, std::string_view secret,
                   const Bytes& salt, size_t length)
{
    if(salt.size() < ARGON2_MIN_SALT_LENGTH_BYTES)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Argon2 needs a salt of at least {} bytes, got {}",
            ARGON2_MIN_SALT_LENGTH_BYTES, salt.size())));
    }
    Bytes derived(length);
    int rc = argon2_hash(params.iterations, params.memory, params.parallelism,
                         secret.data(), secret.size(), salt.data(),
                         salt.size(), derived.data(), derived.size(),
                         nullptr, 0, toLibraryType(params.type),
                         params.version);
    if(rc != ARGON2_OK)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Argon2 failed with {}: {}", describe(params),
            argon2_error_message(rc))));
    }
    return derived;
}

// Parse “m=15360,t=2,p=1”.
E<void> parseCosts(std::string_view field, Argon2Params& params)
{
    auto costs = split(field, ',');
    if(costs.size() != 3)
    {
        return std::unexpected(formatError(
            "Argon2 hash should have 3 cost parameters"));
    }
    const std::array<std::pair<std::string_view, uint32_t*>, 3> expected = {{
        {"m=", &params.memory},
        {"t=", &params.iterations},
        {"p=", &params.parallelism},
    }};
    for(size_t i = 0; i < costs.size(); i++)
    {
        if(!costs[i].starts_with(expected[i].first))
        {
            return std::unexpected(formatError(
                "Unexpected Argon2 cost parameter " + std::string(costs[i])));
        }
        auto value = strToNumber<uint32_t>(
            costs[i].substr(expected[i].first.size()));
        if(!value.has_value())
        {
            return std::unexpected(formatError(
                "Invalid Argon2 cost parameter " + std::string(costs[i])));
        }
        *expected[i].second = *value;
    }
    return {};
}

} // namespace

std::optional<Argon2Params::Type> argon2TypeFromName(std::string_view name)
{
    std::string n(name);
    toLower(n);
    if(n.starts_with("argon2"))
    {
        n = n.substr(std::string_view("argon2").size());
    }
    if(n == "d") return Argon2Params::D;
    if(n == "i") return Argon2Params::I;
    if(n == "id") return Argon2Params::ID;
    return std::nullopt;
}

std::string_view argon2TypeName(Argon2Params::Type type)
{
    switch(type)
    {
    case Argon2Params::D: return "argon2d";
    case Argon2Params::I: return "argon2i";
    case Argon2Params::ID: return "argon2id";
    }
    std::unreachable();
}

E<void> validate(const Argon2Params& params)
{
    if(params.type < Argon2Params::D || params.type > Argon2Params::ID)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unknown Argon2 type {}", static_cast<int>(params.type))));
    }
    if(params.version != ARGON2_VERSION_10 &&
       params.version != ARGON2_VERSION_13)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unsupported Argon2 version {}", params.version)));
    }
    if(params.iterations < ARGON2_MIN_TIME)
    {
        return std::unexpected(invalidParametersError(
            "Argon2 needs at least 1 iteration, got " + describe(params)));
    }
    if(params.parallelism < ARGON2_MIN_LANES ||
       params.parallelism > ARGON2_MAX_LANES)
    {
        return std::unexpected(invalidParametersError(
            "Argon2 parallelism out of range, got " + describe(params)));
    }
    // At least 8 KiB per lane.
    if(static_cast<uint64_t>(params.memory) <
       8 * static_cast<uint64_t>(params.parallelism))
    {
        return std::unexpected(invalidParametersError(
            "Argon2 memory is too small for the parallelism, got " +
            describe(params)));
    }
    if(params.length < ARGON2_MIN_OUTLEN)
    {
        return std::unexpected(invalidParametersError(
            "Argon2 output is too short, got " + describe(params)));
    }
    return {};
}

E<std::string> derive(const Argon2Params& params, std::string_view secret,
                      const Bytes& salt)
{
    DO_OR_RETURN(validate(params));
    ASSIGN_OR_RETURN(Bytes derived,
                     runArgon2(params, secret, salt, params.length));
    return std::format("${}$v={}$m={},t={},p={}${}${}",
                       argon2TypeName(params.type), params.version,
                       params.memory, params.iterations, params.parallelism,
                       base64EncodeUnpadded(salt),
                       base64EncodeUnpadded(derived));
}

E<bool> verify(const Argon2Params&, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    if(!isArgon2(encoded))
    {
        return false;
    }
    ASSIGN_OR_RETURN(Argon2Artifact artifact, parseArgon2(encoded));
    if(salt.has_value() && !constantTimeEquals(*salt, artifact.salt))
    {
        return false;
    }
    ASSIGN_OR_RETURN(Bytes derived,
                     runArgon2(artifact.params, secret, artifact.salt,
                               artifact.derived.size()));
    return constantTimeEquals(derived, artifact.derived);
}

uint64_t requiredMemory(const Argon2Params& params)
{
    return static_cast<uint64_t>(params.memory) * 1024;
}

bool isArgon2(std::string_view encoded)
{
    return encoded.starts_with("$argon2");
}

E<Argon2Artifact> parseArgon2(std::string_view encoded)
{
    // “”, type, [version,] costs, salt, hash. Hashes from version 0x10
    // may not carry the version field.
    auto fields = split(encoded, '$');
    if(fields.size() != 5 && fields.size() != 6)
    {
        return std::unexpected(formatError(std::format(
            "Argon2 hash should have 5 or 6 fields, got {}", fields.size())));
    }

    Argon2Artifact artifact;
    auto type = argon2TypeFromName(fields[1]);
    if(!type.has_value())
    {
        return std::unexpected(formatError(
            "Unknown Argon2 type " + std::string(fields[1])));
    }
    artifact.params.type = *type;

    size_t next = 2;
    if(fields.size() == 6)
    {
        if(!fields[2].starts_with("v="))
        {
            return std::unexpected(formatError("Missing Argon2 version"));
        }
        auto version = strToNumber<uint32_t>(fields[2].substr(2));
        if(!version.has_value())
        {
            return std::unexpected(formatError(
                "Invalid Argon2 version " + std::string(fields[2])));
        }
        artifact.params.version = *version;
        next = 3;
    }
    else
    {
        artifact.params.version = ARGON2_VERSION_10;
    }

    DO_OR_RETURN(parseCosts(fields[next], artifact.params));
    ASSIGN_OR_RETURN(artifact.salt, base64DecodeUnpadded(fields[next + 1]));
    if(artifact.salt.size() < ARGON2_MIN_SALT_LENGTH_BYTES)
    {
        return std::unexpected(formatError(std::format(
            "Argon2 hash has a salt of {} bytes, needs at least {}",
            artifact.salt.size(), ARGON2_MIN_SALT_LENGTH_BYTES)));
    }
    ASSIGN_OR_RETURN(artifact.derived, base64DecodeUnpadded(fields[next + 2]));
    artifact.params.length = static_cast<uint32_t>(artifact.derived.size());
    if(auto ok = validate(artifact.params); !ok.has_value())
    {
        spdlog::debug("Rejecting Argon2 hash: {}", errorMsg(ok.error()));
        return std::unexpected(formatError(
            "Argon2 hash has invalid parameters: " + errorMsg(ok.error())));
    }
    return artifact;
}
