#include "wopan/upload/session_identity.hpp"

#include <ctime>
#include <string_view>

namespace wopan::upload {
namespace {

constexpr std::string_view kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::size_t kSuffixLength = 6;

} // namespace

SessionIdentityGenerator::SessionIdentityGenerator()
    : SessionIdentityGenerator([] { return std::chrono::system_clock::now(); }) {}

SessionIdentityGenerator::SessionIdentityGenerator(Clock clock, std::uint32_t seed)
    : clock_(std::move(clock)),
      engine_(seed) {}

SessionIdentity SessionIdentityGenerator::generate() {
    const auto now = clock_();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    SessionIdentity identity;
    identity.batch_no = format_batch_no(now);
    identity.unique_id = std::to_string(millis) + "_" + random_letters(kSuffixLength);
    return identity;
}

std::string SessionIdentityGenerator::format_batch_no(std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[16];
    const auto written = std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &local);
    return std::string(buffer, written);
}

std::string SessionIdentityGenerator::random_letters(std::size_t count) {
    std::uniform_int_distribution<std::size_t> pick(0, kLetters.size() - 1);
    std::string out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(kLetters[pick(engine_)]);
    }
    return out;
}

} // namespace wopan::upload
