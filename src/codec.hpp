#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

using Bytes = std::vector<unsigned char>;

inline Bytes toBytes(std::string_view s)
{
    return Bytes(s.begin(), s.end());
}

// Standard alphabet with “=” padding.
std::string base64Encode(const Bytes& bytes);
// Strict decoding: any character outside of the alphabet, misplaced
// padding or a length that is not a multiple of 4 is a FormatError.
E<Bytes> base64Decode(std::string_view s);

// The unpadded flavor used by PHC strings (Argon2).
std::string base64EncodeUnpadded(const Bytes& bytes);
E<Bytes> base64DecodeUnpadded(std::string_view s);

// Lower case hex.
std::string hexEncode(const Bytes& bytes);
E<Bytes> hexDecode(std::string_view s);

// Compare in time that only depends on the lengths of the inputs.
bool constantTimeEquals(const Bytes& a, const Bytes& b);
bool constantTimeEquals(std::string_view a, std::string_view b);
