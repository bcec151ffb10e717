#include <cctype>
#include <string>
#include <string_view>

#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/misc.h>

#include "codec.hpp"
#include "error.hpp"

namespace {

bool isBase64Char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

template<typename Decoder>
Bytes decodeWith(std::string_view s)
{
    std::string decoded;
    CryptoPP::StringSource _(
        reinterpret_cast<const CryptoPP::byte*>(s.data()), s.size(), true,
        new Decoder(new CryptoPP::StringSink(decoded)));
    return toBytes(decoded);
}

} // namespace

std::string base64Encode(const Bytes& bytes)
{
    std::string encoded;
    CryptoPP::StringSource _(
        bytes.data(), bytes.size(), true, new CryptoPP::Base64Encoder(
            new CryptoPP::StringSink(encoded), false));
    return encoded;
}

E<Bytes> base64Decode(std::string_view s)
{
    if(s.size() % 4 != 0)
    {
        return std::unexpected(formatError(
            "Base64 string length is not a multiple of 4"));
    }
    size_t padding = 0;
    for(size_t i = 0; i < s.size(); i++)
    {
        if(s[i] == '=')
        {
            padding++;
            continue;
        }
        if(padding > 0 || !isBase64Char(s[i]))
        {
            return std::unexpected(formatError("Invalid Base64 string"));
        }
    }
    if(padding > 2)
    {
        return std::unexpected(formatError("Invalid Base64 padding"));
    }
    return decodeWith<CryptoPP::Base64Decoder>(s);
}

std::string base64EncodeUnpadded(const Bytes& bytes)
{
    std::string encoded = base64Encode(bytes);
    while(!encoded.empty() && encoded.back() == '=')
    {
        encoded.pop_back();
    }
    return encoded;
}

E<Bytes> base64DecodeUnpadded(std::string_view s)
{
    if(s.size() % 4 == 1 || s.find('=') != std::string_view::npos)
    {
        return std::unexpected(formatError("Invalid unpadded Base64 string"));
    }
    std::string padded(s);
    padded.append((4 - s.size() % 4) % 4, '=');
    return base64Decode(padded);
}

std::string hexEncode(const Bytes& bytes)
{
    std::string encoded;
    CryptoPP::StringSource _(
        bytes.data(), bytes.size(), true, new CryptoPP::HexEncoder(
            new CryptoPP::StringSink(encoded), false));
    return encoded;
}

E<Bytes> hexDecode(std::string_view s)
{
    if(s.size() % 2 != 0)
    {
        return std::unexpected(formatError("Odd number of hex digits"));
    }
    for(char c: s)
    {
        if(!std::isxdigit(static_cast<unsigned char>(c)))
        {
            return std::unexpected(formatError("Invalid hex string"));
        }
    }
    return decodeWith<CryptoPP::HexDecoder>(s);
}

bool constantTimeEquals(const Bytes& a, const Bytes& b)
{
    if(a.size() != b.size())
    {
        return false;
    }
    if(a.empty())
    {
        return true;
    }
    return CryptoPP::VerifyBufsEqual(a.data(), b.data(), a.size());
}

bool constantTimeEquals(std::string_view a, std::string_view b)
{
    if(a.size() != b.size())
    {
        return false;
    }
    if(a.empty())
    {
        return true;
    }
    return CryptoPP::VerifyBufsEqual(
        reinterpret_cast<const CryptoPP::byte*>(a.data()),
        reinterpret_cast<const CryptoPP::byte*>(b.data()), a.size());
}
