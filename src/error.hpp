#pragma once

#include <expected>
#include <string>
#include <variant>

// Something went wrong in the environment (I/O, a library failure
// that is not about the parameters).
struct RuntimeError
{
    std::string msg;
};

// Algorithm parameters outside of the valid domain of the algorithm.
struct InvalidParametersError
{
    std::string msg;
};

// An encoded hash could not be parsed into its fields.
struct FormatError
{
    std::string msg;
};

// The configuration asks for something that does not exist or does
// not make sense.
struct ConfigurationError
{
    std::string msg;
};

using Error = std::variant<RuntimeError, InvalidParametersError, FormatError,
                           ConfigurationError>;

template<typename T>
using E = std::expected<T, Error>;

inline Error runtimeError(const std::string& msg)
{
    return RuntimeError{msg};
}

inline Error invalidParametersError(const std::string& msg)
{
    return InvalidParametersError{msg};
}

inline Error formatError(const std::string& msg)
{
    return FormatError{msg};
}

inline Error configurationError(const std::string& msg)
{
    return ConfigurationError{msg};
}

inline std::string errorMsg(const Error& e)
{
    return std::visit([](const auto& err) { return err.msg; }, e);
}

template<typename T>
bool isExpected(const E<T>& x)
{
    return x.has_value();
}
