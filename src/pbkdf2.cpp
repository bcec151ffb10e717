#include <cctype>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include <cryptopp/cryptlib.h>
#include <cryptopp/pwdbased.h>
#include <cryptopp/sha.h>
#include <spdlog/spdlog.h>

#include "codec.hpp"
#include "error.hpp"
#include "pbkdf2.hpp"
#include "utils.hpp"

namespace {

template<typename HashType>
void deriveWith(const PBKDF2Params& params, std::string_view secret,
                const Bytes& salt, Bytes& derived)
{
    CryptoPP::PKCS5_PBKDF2_HMAC<HashType> kdf;
    kdf.DeriveKey(derived.data(), derived.size(), 0,
                  reinterpret_cast<const CryptoPP::byte*>(secret.data()),
                  secret.size(), salt.data(), salt.size(), params.iterations);
}

E<Bytes> runPBKDF2(const PBKDF2Params& params, std::string_view secret,
                   const Bytes& salt, size_t length)
{
    Bytes derived(length);
    try
    {
        switch(params.hmac)
        {
        case PBKDF2Params::SHA1:
            deriveWith<CryptoPP::SHA1>(params, secret, salt, derived);
            break;
        case PBKDF2Params::SHA224:
            deriveWith<CryptoPP::SHA224>(params, secret, salt, derived);
            break;
        case PBKDF2Params::SHA256:
            deriveWith<CryptoPP::SHA256>(params, secret, salt, derived);
            break;
        case PBKDF2Params::SHA384:
            deriveWith<CryptoPP::SHA384>(params, secret, salt, derived);
            break;
        case PBKDF2Params::SHA512:
            deriveWith<CryptoPP::SHA512>(params, secret, salt, derived);
            break;
        }
    }
    catch(const CryptoPP::Exception& e)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Invalid PBKDF2 specification with {}, iterations={}, "
            "length={}: {}", hmacName(params.hmac), params.iterations,
            params.length, e.what())));
    }
    return derived;
}

bool isAllDigits(std::string_view s)
{
    if(s.empty())
    {
        return false;
    }
    for(char c: s)
    {
        if(!std::isdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<PBKDF2Params::Hmac> hmacFromName(std::string_view name)
{
    std::string n(name);
    toLower(n);
    if(n.starts_with("pbkdf2withhmac"))
    {
        n = n.substr(std::string_view("pbkdf2withhmac").size());
    }
    if(n == "sha1") return PBKDF2Params::SHA1;
    if(n == "sha224") return PBKDF2Params::SHA224;
    if(n == "sha256") return PBKDF2Params::SHA256;
    if(n == "sha384") return PBKDF2Params::SHA384;
    if(n == "sha512") return PBKDF2Params::SHA512;
    return std::nullopt;
}

std::string_view hmacName(PBKDF2Params::Hmac hmac)
{
    switch(hmac)
    {
    case PBKDF2Params::SHA1: return "PBKDF2WithHmacSHA1";
    case PBKDF2Params::SHA224: return "PBKDF2WithHmacSHA224";
    case PBKDF2Params::SHA256: return "PBKDF2WithHmacSHA256";
    case PBKDF2Params::SHA384: return "PBKDF2WithHmacSHA384";
    case PBKDF2Params::SHA512: return "PBKDF2WithHmacSHA512";
    }
    std::unreachable();
}

int hmacCode(PBKDF2Params::Hmac hmac)
{
    return static_cast<int>(hmac) + 1;
}

E<void> validate(const PBKDF2Params& params)
{
    if(params.hmac < PBKDF2Params::SHA1 || params.hmac > PBKDF2Params::SHA512)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unknown PBKDF2 HMAC {}", static_cast<int>(params.hmac))));
    }
    if(params.iterations < 1)
    {
        return std::unexpected(invalidParametersError(
            "PBKDF2 needs at least 1 iteration"));
    }
    if(params.length == 0 || params.length % 8 != 0)
    {
        return std::unexpected(invalidParametersError(std::format(
            "PBKDF2 length must be a positive multiple of 8 bits, got {}",
            params.length)));
    }
    return {};
}

E<std::string> derive(const PBKDF2Params& params, std::string_view secret,
                      const Bytes& salt)
{
    DO_OR_RETURN(validate(params));
    ASSIGN_OR_RETURN(Bytes derived,
                     runPBKDF2(params, secret, salt, params.length / 8));
    return base64Encode(derived);
}

E<bool> verify(const PBKDF2Params& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    if(!salt.has_value())
    {
        spdlog::debug("No salt to verify a PBKDF2 hash with.");
        return false;
    }
    // Base64 never has “$”, so this belongs to another algorithm.
    if(encoded.starts_with("$"))
    {
        return false;
    }
    DO_OR_RETURN(validate(params));
    ASSIGN_OR_RETURN(Bytes expected, base64Decode(encoded));
    if(expected.size() != params.length / 8)
    {
        return false;
    }
    ASSIGN_OR_RETURN(Bytes derived,
                     runPBKDF2(params, secret, *salt, expected.size()));
    return constantTimeEquals(derived, expected);
}

uint64_t requiredMemory(const PBKDF2Params& params)
{
    // Two HMAC states and the derived key.
    return 2 * 128 + params.length / 8;
}

E<std::string> derive(const CompressedPBKDF2Params& params,
                      std::string_view secret, const Bytes& salt)
{
    DO_OR_RETURN(validate(params));
    ASSIGN_OR_RETURN(Bytes derived,
                     runPBKDF2(params, secret, salt, params.length / 8));
    const uint64_t packed = static_cast<uint64_t>(params.iterations) << 32 |
        params.length;
    return std::format("${}${}${}${}", hmacCode(params.hmac), packed,
                       base64Encode(salt), base64Encode(derived));
}

E<bool> verify(const CompressedPBKDF2Params&, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    if(!isCompressedPBKDF2(encoded))
    {
        return false;
    }
    ASSIGN_OR_RETURN(CompressedPBKDF2Artifact artifact,
                     parseCompressedPBKDF2(encoded));
    if(salt.has_value() && !constantTimeEquals(*salt, artifact.salt))
    {
        return false;
    }
    ASSIGN_OR_RETURN(Bytes derived,
                     runPBKDF2(artifact.params, secret, artifact.salt,
                               artifact.derived.size()));
    return constantTimeEquals(derived, artifact.derived);
}

bool isCompressedPBKDF2(std::string_view encoded)
{
    if(!encoded.starts_with("$"))
    {
        return false;
    }
    auto end = encoded.find('$', 1);
    return end != std::string_view::npos &&
        isAllDigits(encoded.substr(1, end - 1));
}

E<CompressedPBKDF2Artifact> parseCompressedPBKDF2(std::string_view encoded)
{
    // “”, code, params, salt, derived
    auto fields = split(encoded, '$');
    if(fields.size() != 5)
    {
        return std::unexpected(formatError(std::format(
            "Compressed PBKDF2 hash should have 5 fields, got {}",
            fields.size())));
    }
    auto code = strToNumber<int>(fields[1]);
    if(!code.has_value() || *code < hmacCode(PBKDF2Params::SHA1) ||
       *code > hmacCode(PBKDF2Params::SHA512))
    {
        return std::unexpected(formatError(
            "Unknown PBKDF2 algorithm code " + std::string(fields[1])));
    }
    auto packed = strToNumber<uint64_t>(fields[2]);
    if(!packed.has_value())
    {
        return std::unexpected(formatError(
            "Invalid PBKDF2 parameter field: " + errorMsg(packed.error())));
    }

    CompressedPBKDF2Artifact artifact;
    artifact.params.hmac = static_cast<PBKDF2Params::Hmac>(*code - 1);
    artifact.params.iterations = static_cast<uint32_t>(*packed >> 32);
    artifact.params.length = static_cast<uint32_t>(*packed & 0xffffffff);
    if(auto ok = validate(artifact.params); !ok.has_value())
    {
        return std::unexpected(formatError(
            "PBKDF2 hash has invalid parameters: " + errorMsg(ok.error())));
    }
    ASSIGN_OR_RETURN(artifact.salt, base64Decode(fields[3]));
    ASSIGN_OR_RETURN(artifact.derived, base64Decode(fields[4]));
    if(artifact.derived.size() != artifact.params.length / 8)
    {
        return std::unexpected(formatError(
            "PBKDF2 derived key does not match the declared length"));
    }
    return artifact;
}
