#pragma once

#include <cstddef>

#include <gmock/gmock.h>

#include "salt_generator.hpp"

class SaltGeneratorMock : public SaltGeneratorInterface
{
public:
    ~SaltGeneratorMock() override = default;
    MOCK_METHOD(Bytes, generate, (size_t length), (const override));
};
