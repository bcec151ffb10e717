#include <cctype>
#include <cerrno>
#include <format>
#include <memory>
#include <string>
#include <system_error>

#include <crypt.h>
#include <spdlog/spdlog.h>

#include "bcrypt.hpp"
#include "codec.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace {

// “$2b$10$” plus 22 characters of salt.
constexpr size_t SETTING_LENGTH = 29;
constexpr size_t ENCODED_LENGTH = 60;

bool isBCryptBase64Char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '/';
}

E<std::string> makeSetting(const BCryptParams& params, const Bytes& salt)
{
    if(salt.size() != BCRYPT_SALT_LENGTH)
    {
        return std::unexpected(invalidParametersError(std::format(
            "BCrypt needs a salt of exactly {} bytes, got {}",
            BCRYPT_SALT_LENGTH, salt.size())));
    }
    const std::string prefix = std::format("$2{}$", params.minor);
    char setting[CRYPT_GENSALT_OUTPUT_SIZE];
    if(crypt_gensalt_rn(prefix.c_str(), params.rounds,
                        reinterpret_cast<const char*>(salt.data()),
                        static_cast<int>(salt.size()), setting,
                        sizeof(setting)) == nullptr)
    {
        return std::unexpected(invalidParametersError(std::format(
            "Failed to make BCrypt setting with minor={}, rounds={}: {}",
            params.minor, params.rounds,
            std::system_category().message(errno))));
    }
    return std::string(setting);
}

// Run the actual BCrypt with a “$2b$10$<salt>” setting or a full
// encoded hash, which libxcrypt treats the same.
E<std::string> runCrypt(std::string_view secret, const std::string& setting)
{
    const std::string phrase(secret);
    if(phrase.find('\0') != std::string::npos)
    {
        return std::unexpected(invalidParametersError(
            "BCrypt cannot take a secret with NUL characters"));
    }
    // crypt_data is big, and must be zeroed before first use.
    auto data = std::make_unique<crypt_data>();
    const char* result = crypt_rn(phrase.c_str(), setting.c_str(), data.get(),
                                  sizeof(crypt_data));
    if(result == nullptr || result[0] == '*')
    {
        return std::unexpected(invalidParametersError(std::format(
            "BCrypt failed with setting {}: {}",
            setting.substr(0, SETTING_LENGTH),
            std::system_category().message(errno))));
    }
    return std::string(result);
}

} // namespace

E<void> validate(const BCryptParams& params)
{
    if(params.minor != 'a' && params.minor != 'b' && params.minor != 'y')
    {
        return std::unexpected(invalidParametersError(std::format(
            "Unsupported BCrypt minor version {}", params.minor)));
    }
    if(params.rounds < 4 || params.rounds > 31)
    {
        return std::unexpected(invalidParametersError(std::format(
            "BCrypt rounds must be within [4, 31], got {}", params.rounds)));
    }
    return {};
}

E<std::string> derive(const BCryptParams& params, std::string_view secret,
                      const Bytes& salt)
{
    DO_OR_RETURN(validate(params));
    ASSIGN_OR_RETURN(std::string setting, makeSetting(params, salt));
    return runCrypt(secret, setting);
}

E<bool> verify(const BCryptParams&, std::string_view secret,
               std::string_view encoded, const std::optional<Bytes>& salt)
{
    if(!isBCrypt(encoded))
    {
        return false;
    }
    ASSIGN_OR_RETURN(BCryptParams params, bcryptParamsFromEncoded(encoded));
    if(salt.has_value())
    {
        // The supplied salt has to be the one in the hash.
        if(salt->size() != BCRYPT_SALT_LENGTH)
        {
            return false;
        }
        ASSIGN_OR_RETURN(std::string setting, makeSetting(params, *salt));
        if(!constantTimeEquals(std::string_view(setting),
                               encoded.substr(0, SETTING_LENGTH)))
        {
            return false;
        }
    }

    auto computed = runCrypt(secret, std::string(encoded));
    if(!computed.has_value())
    {
        spdlog::debug("BCrypt verification failed: {}",
                      errorMsg(computed.error()));
        return std::unexpected(computed.error());
    }
    return constantTimeEquals(std::string_view(*computed), encoded);
}

uint64_t requiredMemory(const BCryptParams&)
{
    // P-array and four S-boxes of Blowfish.
    return 18 * 4 + 4 * 256 * 4;
}

bool isBCrypt(std::string_view encoded)
{
    return encoded.size() >= 4 && encoded.starts_with("$2") &&
        std::isalpha(static_cast<unsigned char>(encoded[2])) &&
        encoded[3] == '$';
}

E<BCryptParams> bcryptParamsFromEncoded(std::string_view encoded)
{
    if(!isBCrypt(encoded))
    {
        return std::unexpected(formatError("Not a BCrypt hash"));
    }
    if(encoded.size() != ENCODED_LENGTH || encoded[6] != '$')
    {
        return std::unexpected(formatError("Malformed BCrypt hash"));
    }
    for(char c: encoded.substr(7))
    {
        if(!isBCryptBase64Char(c))
        {
            return std::unexpected(formatError(
                "Invalid character in BCrypt hash"));
        }
    }

    BCryptParams params;
    params.minor = encoded[2];
    auto rounds = strToNumber<uint32_t>(encoded.substr(4, 2));
    if(!rounds.has_value())
    {
        return std::unexpected(formatError("Invalid BCrypt cost field"));
    }
    params.rounds = *rounds;
    if(auto ok = validate(params); !ok.has_value())
    {
        return std::unexpected(formatError(
            "BCrypt hash has invalid parameters: " + errorMsg(ok.error())));
    }
    return params;
}
