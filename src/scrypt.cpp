#include <bit>
#include <cstdint>
#include <format>
#include <limits>
#include <new>
#include <string>

#include <cryptopp/cryptlib.h>
#include <cryptopp/scrypt.h>

#include "codec.hpp"
#include "error.hpp"
#include "scrypt.hpp"
#include "utils.hpp"

namespace {

constexpr std::string_view PREFIX = "$s0$";

std::string describe(const SCryptParams& params)
{
    return std::format("N={}, r={}, p={}", params.work_factor,
                       params.resources, params.parallelization);
}

// Position of the only set bit. N has been validated to be a power
// of 2 at this point.
uint32_t log2OfPowerOf2(uint64_t n)
{
    return static_cast<uint32_t>(std::countr_zero(n));
}

E<Bytes> runSCrypt(const SCryptParams& params, std::string_view secret,
                   const Bytes& salt, size_t length)
{
    Bytes derived(length);
    try
    {
        CryptoPP::Scrypt scrypt;
        scrypt.DeriveKey(
            derived.data(), derived.size(),
            reinterpret_cast<const CryptoPP::byte*>(secret.data()),
            secret.size(), salt.data(), salt.size(), params.work_factor,
            params.resources, params.parallelization);
    }
    catch(const CryptoPP::Exception& e)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Invalid SCrypt specification with salt={}, {}: {}",
            hexEncode(salt), describe(params), e.what())));
    }
    catch(const std::bad_alloc&)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Not enough memory for SCrypt with salt={}, {}",
            hexEncode(salt), describe(params))));
    }
    return derived;
}

} // namespace

E<void> validate(const SCryptParams& params)
{
    if(params.work_factor < 2 || !std::has_single_bit(params.work_factor))
    {
        return std::unexpected(invalidParametersError(
            "SCrypt work factor must be a power of 2 greater than 1, got " +
            describe(params)));
    }
    if(params.resources < 1 || params.resources > 255 ||
       params.parallelization < 1 || params.parallelization > 255)
    {
        return std::unexpected(invalidParametersError(
            "SCrypt r and p must be within [1, 255], got " +
            describe(params)));
    }
    if(static_cast<uint64_t>(params.resources) * params.parallelization >=
       (uint64_t(1) << 30))
    {
        return std::unexpected(invalidParametersError(
            "SCrypt r * p is too large, got " + describe(params)));
    }
    // r * p < 2^30, so the divisor cannot overflow.
    const uint64_t block_bytes = 128 * static_cast<uint64_t>(params.resources) *
        params.parallelization;
    if(params.work_factor > std::numeric_limits<size_t>::max() / block_bytes)
    {
        return std::unexpected(invalidParametersError(
            "SCrypt memory requirement overflows, got " + describe(params)));
    }
    if(params.derived_length == 0)
    {
        return std::unexpected(invalidParametersError(
            "SCrypt derived length must be positive"));
    }
    return {};
}

E<std::string> derive(const SCryptParams& params, std::string_view secret,
                      const Bytes& salt)
{
    if(auto ok = validate(params); !ok.has_value())
    {
        return std::unexpected(invalidParametersError(std::format(
            "{} (salt={})", errorMsg(ok.error()), hexEncode(salt))));
    }
    ASSIGN_OR_RETURN(Bytes derived,
                     runSCrypt(params, secret, salt, params.derived_length));
    return std::format("{}{:x}${}${}", PREFIX, packSCryptParams(params),
                       base64Encode(salt), base64Encode(derived));
}

E<bool> verify(const SCryptParams&, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    if(!isSCrypt(encoded))
    {
        return false;
    }
    ASSIGN_OR_RETURN(SCryptArtifact artifact, parseSCrypt(encoded));
    if(salt.has_value() && !constantTimeEquals(*salt, artifact.salt))
    {
        return false;
    }
    ASSIGN_OR_RETURN(Bytes derived,
                     runSCrypt(artifact.params, secret, artifact.salt,
                               artifact.derived.size()));
    return constantTimeEquals(derived, artifact.derived);
}

uint64_t requiredMemory(const SCryptParams& params)
{
    return 128 * params.work_factor * params.resources *
        params.parallelization;
}

uint64_t packSCryptParams(const SCryptParams& params)
{
    return static_cast<uint64_t>(log2OfPowerOf2(params.work_factor)) << 16 |
        static_cast<uint64_t>(params.resources) << 8 |
        params.parallelization;
}

E<SCryptParams> unpackSCryptParams(uint64_t packed)
{
    SCryptParams params;
    params.parallelization = packed & 0xff;
    params.resources = (packed >> 8) & 0xff;
    const uint64_t log2_n = packed >> 16;
    if(log2_n < 1 || log2_n > 63)
    {
        return std::unexpected(formatError(std::format(
            "SCrypt log2(N) out of range: {}", log2_n)));
    }
    params.work_factor = uint64_t(1) << log2_n;
    if(auto ok = validate(params); !ok.has_value())
    {
        return std::unexpected(formatError(
            "SCrypt hash has invalid parameters: " + errorMsg(ok.error())));
    }
    return params;
}

bool isSCrypt(std::string_view encoded)
{
    return encoded.starts_with(PREFIX);
}

E<SCryptArtifact> parseSCrypt(std::string_view encoded)
{
    // “”, “s0”, params, salt, derived
    auto fields = split(encoded, '$');
    if(fields.size() != 5 || fields[1] != "s0")
    {
        return std::unexpected(formatError(std::format(
            "SCrypt hash should have 5 fields, got {}", fields.size())));
    }
    auto packed = strToNumber<uint64_t>(fields[2], 16);
    if(!packed.has_value())
    {
        return std::unexpected(formatError(
            "Invalid SCrypt parameter field: " + errorMsg(packed.error())));
    }

    SCryptArtifact artifact;
    ASSIGN_OR_RETURN(artifact.params, unpackSCryptParams(*packed));
    ASSIGN_OR_RETURN(artifact.salt, base64Decode(fields[3]));
    ASSIGN_OR_RETURN(artifact.derived, base64Decode(fields[4]));
    if(artifact.derived.empty())
    {
        return std::unexpected(formatError("SCrypt hash has no derived key"));
    }
    artifact.params.derived_length = artifact.derived.size();
    return artifact;
}
