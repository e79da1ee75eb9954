#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace sagabus {

/**
 * Source of fresh saga identifiers.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * Return an identifier distinct from every one returned before.
     */
    virtual std::string next() = 0;
};

/**
 * Generates "comb" UUIDs: ten random bytes followed by a six byte
 * millisecond timestamp, formatted as 36 lowercase hex characters with dashes.
 *
 * The timestamp tail keeps ids roughly ordered by creation time, which
 * keeps index inserts in the saga store append-mostly.
 */
class CombIdGenerator : public IdGenerator {
public:
    CombIdGenerator();

    std::string next() override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    uint64_t last_millis_ = 0;
};

} // namespace sagabus
