#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

namespace hapdb {

/**
 * @brief Source of accessory identifiers (aid)
 *
 * The process-wide generator is shared by every Accessory constructed without
 * an explicit generator. Tests replace it with setGlobal() to get
 * deterministic identifiers.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    // Strictly increasing; safe to call from several threads
    virtual uint64_t nextId() = 0;

    // Shared ownership: a generator swapped out by setGlobal() stays valid for callers still holding it
    static std::shared_ptr<IdGenerator> global();
    static void setGlobal(std::shared_ptr<IdGenerator> generator);
};

/**
 * @brief Atomic counter implementation
 *
 * The first value handed out is seed + 1. With the default seed of 0 the first
 * aid is 1; 0 is never allocated.
 */
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(uint64_t seed = 0);

    uint64_t nextId() override;

    // Last value handed out (the seed if none yet)
    uint64_t current() const;

private:
    std::atomic<uint64_t> m_counter;

    SequentialIdGenerator(const SequentialIdGenerator&) = delete;
    SequentialIdGenerator& operator=(const SequentialIdGenerator&) = delete;
};

} // namespace hapdb
