#pragma once

#include "wopan/upload/types.hpp"

#include <chrono>
#include <functional>
#include <random>

namespace wopan::upload {

/**
 * @brief Produces the (uniqueId, batchNo) pair for a new session
 *
 * The clock is injectable so tests can pin the timestamp.
 */
class SessionIdentityGenerator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SessionIdentityGenerator();
    explicit SessionIdentityGenerator(Clock clock, std::uint32_t seed = std::random_device{}());

    SessionIdentity generate();

    static std::string format_batch_no(std::chrono::system_clock::time_point now);

private:
    std::string random_letters(std::size_t count);

    Clock clock_;
    std::mt19937 engine_;
};

} // namespace wopan::upload
