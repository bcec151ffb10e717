#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#define CRYPTOPP_ENABLE_NAMESPACE_WEAK 1
#include <cryptopp/cryptlib.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/md5.h>
#include <cryptopp/sha.h>
#include <cryptopp/sha3.h>

#include "codec.hpp"
#include "error.hpp"
#include "message_digest.hpp"
#include "utils.hpp"

namespace {

template<typename HashType>
std::string hexDigestWith(const std::string& bytes)
{
    std::string digest;
    HashType hash;

    CryptoPP::StringSource _(
        bytes, true, new CryptoPP::HashFilter(
            hash, new CryptoPP::HexEncoder(
                new CryptoPP::StringSink(digest))));
    return toLower(digest);
}

std::string hexDigest(MessageDigestParams::Algorithm algorithm,
                      const std::string& bytes)
{
    switch(algorithm)
    {
    case MessageDigestParams::MD5:
        return hexDigestWith<CryptoPP::Weak::MD5>(bytes);
    case MessageDigestParams::SHA1:
        return hexDigestWith<CryptoPP::SHA1>(bytes);
    case MessageDigestParams::SHA224:
        return hexDigestWith<CryptoPP::SHA224>(bytes);
    case MessageDigestParams::SHA256:
        return hexDigestWith<CryptoPP::SHA256>(bytes);
    case MessageDigestParams::SHA384:
        return hexDigestWith<CryptoPP::SHA384>(bytes);
    case MessageDigestParams::SHA512:
        return hexDigestWith<CryptoPP::SHA512>(bytes);
    case MessageDigestParams::SHA3_256:
        return hexDigestWith<CryptoPP::SHA3_256>(bytes);
    case MessageDigestParams::SHA3_512:
        return hexDigestWith<CryptoPP::SHA3_512>(bytes);
    }
    std::unreachable();
}

std::string salted(const MessageDigestParams& params, std::string_view secret,
                   const Bytes& salt)
{
    std::string salt_str(salt.begin(), salt.end());
    if(params.salt_option == MessageDigestParams::PREPEND)
    {
        return salt_str + std::string(secret);
    }
    return std::string(secret) + salt_str;
}

E<std::string> digest(const MessageDigestParams& params,
                      std::string_view secret, const Bytes& salt)
{
    try
    {
        return hexDigest(params.algorithm, salted(params, secret, salt));
    }
    catch(const CryptoPP::Exception& e)
    {
        return std::unexpected(runtimeError(std::format(
            "Failed to digest with {}: {}",
            digestAlgorithmName(params.algorithm), e.what())));
    }
}

} // namespace

std::optional<MessageDigestParams::Algorithm>
digestAlgorithmFromName(std::string_view name)
{
    std::string n;
    for(char c: name)
    {
        if(c != '-' && c != '_')
        {
            n.push_back(c);
        }
    }
    toLower(n);
    if(n == "md5") return MessageDigestParams::MD5;
    if(n == "sha1") return MessageDigestParams::SHA1;
    if(n == "sha224") return MessageDigestParams::SHA224;
    if(n == "sha256") return MessageDigestParams::SHA256;
    if(n == "sha384") return MessageDigestParams::SHA384;
    if(n == "sha512") return MessageDigestParams::SHA512;
    if(n == "sha3256") return MessageDigestParams::SHA3_256;
    if(n == "sha3512") return MessageDigestParams::SHA3_512;
    return std::nullopt;
}

std::string_view digestAlgorithmName(MessageDigestParams::Algorithm algorithm)
{
    switch(algorithm)
    {
    case MessageDigestParams::MD5: return "MD5";
    case MessageDigestParams::SHA1: return "SHA-1";
    case MessageDigestParams::SHA224: return "SHA-224";
    case MessageDigestParams::SHA256: return "SHA-256";
    case MessageDigestParams::SHA384: return "SHA-384";
    case MessageDigestParams::SHA512: return "SHA-512";
    case MessageDigestParams::SHA3_256: return "SHA3-256";
    case MessageDigestParams::SHA3_512: return "SHA3-512";
    }
    std::unreachable();
}

std::optional<MessageDigestParams::SaltOption>
saltOptionFromName(std::string_view name)
{
    std::string n(name);
    toLower(n);
    if(n == "prepend") return MessageDigestParams::PREPEND;
    if(n == "append") return MessageDigestParams::APPEND;
    return std::nullopt;
}

size_t digestSize(MessageDigestParams::Algorithm algorithm)
{
    switch(algorithm)
    {
    case MessageDigestParams::MD5: return 16;
    case MessageDigestParams::SHA1: return 20;
    case MessageDigestParams::SHA224: return 28;
    case MessageDigestParams::SHA256: return 32;
    case MessageDigestParams::SHA384: return 48;
    case MessageDigestParams::SHA512: return 64;
    case MessageDigestParams::SHA3_256: return 32;
    case MessageDigestParams::SHA3_512: return 64;
    }
    std::unreachable();
}

E<void> validate(const MessageDigestParams& params)
{
    if(params.algorithm < MessageDigestParams::MD5 ||
       params.algorithm > MessageDigestParams::SHA3_512)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unknown message digest {}", static_cast<int>(params.algorithm))));
    }
    if(params.salt_option != MessageDigestParams::PREPEND &&
       params.salt_option != MessageDigestParams::APPEND)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unknown salt option {}", static_cast<int>(params.salt_option))));
    }
    return {};
}

E<std::string> derive(const MessageDigestParams& params,
                      std::string_view secret, const Bytes& salt)
{
    DO_OR_RETURN(validate(params));
    return digest(params, secret, salt);
}

E<bool> verify(const MessageDigestParams& params, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    DO_OR_RETURN(validate(params));
    // Modular crypt style hashes of the other algorithms.
    if(encoded.starts_with("$"))
    {
        return false;
    }
    if(encoded.size() % 2 != 0 ||
       !std::all_of(encoded.begin(), encoded.end(), [](unsigned char c)
       { return std::isxdigit(c); }))
    {
        return std::unexpected(formatError(std::format(
            "A {} hash should be in hex",
            digestAlgorithmName(params.algorithm))));
    }
    if(encoded.size() != digestSize(params.algorithm) * 2)
    {
        return false;
    }
    std::string expected(encoded);
    toLower(expected);
    ASSIGN_OR_RETURN(std::string actual,
                     digest(params, secret, salt.value_or(Bytes())));
    return constantTimeEquals(actual, expected);
}

uint64_t requiredMemory(const MessageDigestParams& params)
{
    return digestSize(params.algorithm);
}
