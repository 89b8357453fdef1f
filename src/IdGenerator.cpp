#include "IdGenerator.h"

#include <mutex>

namespace hapdb {

namespace {

std::mutex generatorMutex;
std::shared_ptr<IdGenerator> generatorInstance;

} // namespace

std::shared_ptr<IdGenerator> IdGenerator::global() {
    std::lock_guard<std::mutex> lock(generatorMutex);
    if (!generatorInstance) {
        generatorInstance = std::make_shared<SequentialIdGenerator>();
    }
    return generatorInstance;
}

void IdGenerator::setGlobal(std::shared_ptr<IdGenerator> generator) {
    std::lock_guard<std::mutex> lock(generatorMutex);
    generatorInstance = std::move(generator);
}

SequentialIdGenerator::SequentialIdGenerator(uint64_t seed)
    : m_counter(seed) {
}

uint64_t SequentialIdGenerator::nextId() {
    return m_counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

uint64_t SequentialIdGenerator::current() const {
    return m_counter.load(std::memory_order_relaxed);
}

} // namespace hapdb
