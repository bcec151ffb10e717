#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "password.hpp"
#include "utils.hpp"

namespace {

std::string peppered(const std::optional<std::string>& pepper,
                     std::string_view plain)
{
    return pepper.value_or("") + std::string(plain);
}

std::optional<std::string> configuredPepper(const AlgorithmFinder& finder)
{
    auto pepper = finder.pepper();
    if(!pepper.has_value())
    {
        spdlog::debug("No pepper is configured.");
    }
    return pepper;
}

} // namespace

HashBuilder::HashBuilder(const AlgorithmFinder& f, std::string plain_text)
        : finder(&f), plain(std::move(plain_text))
{
}

HashBuilder& HashBuilder::addSalt(Bytes value)
{
    salt = std::move(value);
    return *this;
}

HashBuilder& HashBuilder::addSalt(std::string_view value)
{
    return addSalt(toBytes(value));
}

HashBuilder& HashBuilder::addRandomSalt()
{
    salt.reset();
    return *this;
}

HashBuilder& HashBuilder::addRandomSalt(size_t length)
{
    salt = finder->saltGenerator()->generate(length);
    return *this;
}

HashBuilder& HashBuilder::addPepper(std::string_view value)
{
    pepper = std::string(value);
    return *this;
}

HashBuilder& HashBuilder::addPepper()
{
    pepper = configuredPepper(*finder);
    return *this;
}

E<Hash> HashBuilder::with(const HashingStrategy& strategy) const
{
    if(salt.has_value())
    {
        return strategy.hash(peppered(pepper, plain), *salt);
    }
    return strategy.hash(peppered(pepper, plain));
}

E<Hash> HashBuilder::withFound(E<HashingStrategy> strategy) const
{
    if(!strategy.has_value())
    {
        return std::unexpected(strategy.error());
    }
    return with(*strategy);
}

E<Hash> HashBuilder::withBCrypt() const
{
    return withFound(finder->bcrypt());
}

E<Hash> HashBuilder::withSCrypt() const
{
    return withFound(finder->scrypt());
}

E<Hash> HashBuilder::withPBKDF2() const
{
    return withFound(finder->pbkdf2());
}

E<Hash> HashBuilder::withCompressedPBKDF2() const
{
    return withFound(finder->compressedPBKDF2());
}

E<Hash> HashBuilder::withArgon2() const
{
    return withFound(finder->argon2());
}

E<Hash> HashBuilder::withMessageDigest() const
{
    return withFound(finder->messageDigest());
}

HashChecker::HashChecker(const AlgorithmFinder& f,
                         std::optional<std::string> plain_text,
                         std::string hashed_value)
        : finder(&f), plain(std::move(plain_text)),
          hashed(std::move(hashed_value))
{
}

HashChecker& HashChecker::addPepper(std::string_view value)
{
    check_pepper = std::string(value);
    return *this;
}

HashChecker& HashChecker::addPepper()
{
    check_pepper = configuredPepper(*finder);
    return *this;
}

HashChecker& HashChecker::addSalt(Bytes value)
{
    check_salt = std::move(value);
    return *this;
}

HashChecker& HashChecker::addSalt(std::string_view value)
{
    return addSalt(toBytes(value));
}

E<bool> HashChecker::with(const HashingStrategy& strategy) const
{
    if(!plain.has_value())
    {
        return false;
    }
    if(check_salt.has_value())
    {
        return strategy.check(peppered(check_pepper, *plain), hashed,
                              *check_salt);
    }
    return strategy.check(peppered(check_pepper, *plain), hashed);
}

E<bool> HashChecker::withFound(E<HashingStrategy> strategy) const
{
    if(!strategy.has_value())
    {
        return std::unexpected(strategy.error());
    }
    return with(*strategy);
}

E<bool> HashChecker::withBCrypt() const
{
    return withFound(finder->bcrypt());
}

E<bool> HashChecker::withSCrypt() const
{
    return withFound(finder->scrypt());
}

E<bool> HashChecker::withPBKDF2() const
{
    return withFound(finder->pbkdf2());
}

E<bool> HashChecker::withCompressedPBKDF2() const
{
    return withFound(finder->compressedPBKDF2());
}

E<bool> HashChecker::withArgon2() const
{
    return withFound(finder->argon2());
}

E<bool> HashChecker::withMessageDigest() const
{
    return withFound(finder->messageDigest());
}

HashUpdater HashChecker::andUpdate() const
{
    return HashUpdater(*finder, *this);
}

HashUpdater::HashUpdater(const AlgorithmFinder& f, HashChecker check)
        : finder(&f), checker(std::move(check)),
          builder(f, checker.plainText().value_or(""))
{
    if(checker.salt().has_value())
    {
        builder.addSalt(*checker.salt());
    }
    if(checker.pepper().has_value())
    {
        builder.addPepper(*checker.pepper());
    }
}

HashUpdater& HashUpdater::addNewSalt(Bytes salt)
{
    builder.addSalt(std::move(salt));
    return *this;
}

HashUpdater& HashUpdater::addNewSalt(std::string_view salt)
{
    builder.addSalt(salt);
    return *this;
}

HashUpdater& HashUpdater::addNewRandomSalt()
{
    builder.addRandomSalt();
    return *this;
}

HashUpdater& HashUpdater::addNewRandomSalt(size_t length)
{
    builder.addRandomSalt(length);
    return *this;
}

HashUpdater& HashUpdater::addNewPepper(std::string_view pepper)
{
    builder.addPepper(pepper);
    return *this;
}

HashUpdater& HashUpdater::addNewPepper()
{
    builder.addPepper();
    return *this;
}

E<HashUpdate> HashUpdater::with(const HashingStrategy& check_strategy,
                                const HashingStrategy& update_strategy) const
{
    ASSIGN_OR_RETURN(bool verified, checker.with(check_strategy));
    HashUpdate update;
    if(!verified)
    {
        return update;
    }
    update.verified = true;
    ASSIGN_OR_RETURN(update.hash, builder.with(update_strategy));
    return update;
}

E<HashUpdate> HashUpdater::with(const HashingStrategy& strategy) const
{
    return with(strategy, strategy);
}

E<HashUpdate> HashUpdater::withFound(E<HashingStrategy> strategy) const
{
    if(!strategy.has_value())
    {
        return std::unexpected(strategy.error());
    }
    return with(*strategy);
}

E<HashUpdate> HashUpdater::withBCrypt() const
{
    return withFound(finder->bcrypt());
}

E<HashUpdate> HashUpdater::withSCrypt() const
{
    return withFound(finder->scrypt());
}

E<HashUpdate> HashUpdater::withPBKDF2() const
{
    return withFound(finder->pbkdf2());
}

E<HashUpdate> HashUpdater::withCompressedPBKDF2() const
{
    return withFound(finder->compressedPBKDF2());
}

E<HashUpdate> HashUpdater::withArgon2() const
{
    return withFound(finder->argon2());
}

E<HashUpdate> HashUpdater::withMessageDigest() const
{
    return withFound(finder->messageDigest());
}

HashBuilder Password::hash(std::string_view plain) const
{
    return HashBuilder(finder, std::string(plain));
}

HashChecker Password::check(std::optional<std::string> plain,
                            std::string_view hashed) const
{
    return HashChecker(finder, std::move(plain), std::string(hashed));
}
