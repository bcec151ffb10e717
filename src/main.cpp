#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "algorithm_finder.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "password.hpp"
#include "utils.hpp"

namespace {

constexpr int EXIT_MISMATCH = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_HASHING = 3;

// Whether the salt has to be kept next to the encoded hash.
bool embedsSalt(const HashingStrategy& strategy)
{
    return !std::holds_alternative<PBKDF2Params>(strategy.params()) &&
        !std::holds_alternative<MessageDigestParams>(strategy.params());
}

} // namespace

int main(int argc, char** argv)
{
    // Standard output is for the result.
    spdlog::set_default_logger(spdlog::stderr_color_mt("saltshaker"));
    cxxopts::Options cmd_options(
        "saltshaker", "Hash a password read from the standard input, or "
        "check it against an existing hash");
    cmd_options.add_options()
        ("c,config", "Config file", cxxopts::value<std::string>())
        ("a,algorithm", "One of bcrypt, scrypt, pbkdf2, compressed-pbkdf2,"
         " argon2, message-digest. Defaults to hash.default in the config"
         " file, or the algorithm of the hash to check.",
         cxxopts::value<std::string>())
        ("pepper", "Prepend the pepper from the config file to the password")
        ("salt", "Salt in hex. Needed to check a PBKDF2 or message digest"
         " hash.", cxxopts::value<std::string>())
        ("check", "Check the password against this hash instead of hashing"
         " it", cxxopts::value<std::string>())
        ("v,verbose", "Print debug messages.")
        ("h,help", "Print this message.");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        spdlog::error("Invalid arguments: {}", e.what());
        return EXIT_USAGE;
    }

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }
    if(opts.count("verbose"))
    {
        spdlog::set_level(spdlog::level::debug);
    }

    Configuration conf;
    if(opts.count("config") == 1)
    {
        auto conf_maybe = Configuration::fromYaml(
            std::filesystem::path(opts["config"].as<std::string>()));
        if(!conf_maybe.has_value())
        {
            spdlog::error("Failed to load configuration: {}",
                          errorMsg(conf_maybe.error()));
            return EXIT_USAGE;
        }
        conf = *std::move(conf_maybe);
    }
    AlgorithmFinder finder(std::move(conf));
    Password password(finder);

    std::optional<Bytes> salt;
    if(opts.count("salt") == 1)
    {
        auto salt_maybe = hexDecode(strip(opts["salt"].as<std::string>()));
        if(!salt_maybe.has_value())
        {
            spdlog::error("Invalid salt: {}", errorMsg(salt_maybe.error()));
            return EXIT_USAGE;
        }
        salt = *std::move(salt_maybe);
    }
    if(opts.count("pepper") && !finder.pepper().has_value())
    {
        spdlog::warn("No pepper in the configuration, not using any.");
    }

    std::optional<std::string> encoded;
    if(opts.count("check") == 1)
    {
        encoded = std::string(strip(opts["check"].as<std::string>()));
    }

    E<HashingStrategy> strategy = std::unexpected(
        configurationError("No algorithm"));
    if(opts.count("algorithm") == 1)
    {
        strategy = finder.byName(opts["algorithm"].as<std::string>());
    }
    else if(encoded.has_value())
    {
        strategy = HashingStrategy::fromEncoded(
            *encoded, finder.saltGenerator());
        if(!strategy.has_value())
        {
            spdlog::debug("Cannot tell the algorithm from the hash ({}), "
                          "using the default.", errorMsg(strategy.error()));
            strategy = finder.defaultStrategy();
        }
    }
    else
    {
        strategy = finder.defaultStrategy();
    }
    if(!strategy.has_value())
    {
        spdlog::error("Failed to find hashing algorithm: {}",
                      errorMsg(strategy.error()));
        return EXIT_USAGE;
    }

    std::string line;
    if(!std::getline(std::cin, line))
    {
        spdlog::error("Expecting a password from the standard input.");
        return EXIT_USAGE;
    }
    if(line.ends_with('\r'))
    {
        line.pop_back();
    }

    if(encoded.has_value())
    {
        HashChecker checker = password.check(std::move(line), *encoded);
        if(opts.count("pepper"))
        {
            checker.addPepper();
        }
        if(salt.has_value())
        {
            checker.addSalt(*salt);
        }
        E<bool> ok = checker.with(*strategy);
        if(!ok.has_value())
        {
            spdlog::error("Failed to check password with {}: {}",
                          strategy->name(), errorMsg(ok.error()));
            return EXIT_HASHING;
        }
        std::cout << (*ok ? "true" : "false") << std::endl;
        return *ok ? 0 : EXIT_MISMATCH;
    }

    HashBuilder builder = password.hash(line);
    if(opts.count("pepper"))
    {
        builder.addPepper();
    }
    if(salt.has_value())
    {
        builder.addSalt(*salt);
    }
    E<Hash> hash = builder.with(*strategy);
    if(!hash.has_value())
    {
        spdlog::error("Failed to hash password with {}: {}", strategy->name(),
                      errorMsg(hash.error()));
        return EXIT_HASHING;
    }
    std::cout << hash->encoded() << std::endl;
    if(!embedsSalt(*strategy))
    {
        std::cout << hexEncode(hash->salt()) << std::endl;
    }
    return 0;
}
