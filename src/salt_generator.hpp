#pragma once

#include <cstddef>
#include <memory>
#include <mutex>

#include <cryptopp/osrng.h>

#include "codec.hpp"

class SaltGeneratorInterface
{
public:
    virtual ~SaltGeneratorInterface() = default;
    // Return “length” cryptographically random bytes.
    virtual Bytes generate(size_t length) const = 0;
};

// Draws from the operating system seeded Crypto++ pool. The pool
// itself is not thread-safe, so access is serialized.
class SaltGenerator : public SaltGeneratorInterface
{
public:
    ~SaltGenerator() override = default;
    Bytes generate(size_t length) const override;

    // A process-wide instance, for callers that do not bring their
    // own random source.
    static std::shared_ptr<const SaltGeneratorInterface> shared();

private:
    mutable std::mutex lock;
    mutable CryptoPP::AutoSeededRandomPool pool;
};
