#pragma once

#include <gtest/gtest.h>
#include <memory>

#include "IdGenerator.h"
#include "TypeRegistry.h"

namespace hapdb {

// Fixture giving every test a fresh registry and a deterministic aid generator (first aid is 1)
class ModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        generator = std::make_shared<SequentialIdGenerator>();
        IdGenerator::setGlobal(generator);
        TypeRegistry::setInstance(std::make_shared<DefaultTypeRegistry>());
    }

    void TearDown() override {
        IdGenerator::setGlobal(nullptr);
        TypeRegistry::setInstance(nullptr);
    }

    std::shared_ptr<SequentialIdGenerator> generator;
};

} // namespace hapdb
