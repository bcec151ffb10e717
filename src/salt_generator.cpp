#include <memory>
#include <mutex>

#include <cryptopp/osrng.h>

#include "salt_generator.hpp"

Bytes SaltGenerator::generate(size_t length) const
{
    Bytes salt(length);
    if(length == 0)
    {
        return salt;
    }
    std::lock_guard<std::mutex> guard(lock);
    pool.GenerateBlock(salt.data(), salt.size());
    return salt;
}

std::shared_ptr<const SaltGeneratorInterface> SaltGenerator::shared()
{
    static const auto instance = std::make_shared<const SaltGenerator>();
    return instance;
}
