#include "transfer/rejection.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "misc/tools.hpp"
#include "transfer/failure.hpp"

namespace xdcc::transfer {

namespace {

using namespace std::string_view_literals;

constexpr std::array QUEUE_FULL{
  "queue is full"sv,
  "queue full"sv,
  "queues are full"sv,
};

constexpr std::array BANNED{
  "banned"sv,
};

constexpr std::array CHANNEL_REQUIRED{
  "known channel"sv,
  "must be on"sv,
  "must be in"sv,
  "must join"sv,
};

constexpr std::array INFORMATIONAL{
  "sending you"sv,
  "added you to"sv,
  "queued"sv,
  "in position"sv,
  "resume supported"sv,
};

constexpr std::array NO_SLOTS{
  "no slots"sv,
  "slots full"sv,
  "no free slot"sv,
  "all slots"sv,
};

template<std::size_t N>
auto has_any(const std::string& text, const std::array<std::string_view, N>& phrases)
  -> bool
{
    for (auto phrase : phrases) {
        if (text.find(phrase) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto classify_rejection(std::string_view text) -> std::optional<Reason>
{
    const auto lowered = utils::to_lower(text);

    // "Main queue of size 10 is Full, Try Again Later"
    const bool queue_of_size_full =
      lowered.find("queue of size") != std::string::npos and
      lowered.find("is full") != std::string::npos;

    if (queue_of_size_full or has_any(lowered, QUEUE_FULL)) {
        return Reason::QueueFull;
    }
    if (has_any(lowered, BANNED)) {
        return Reason::Banned;
    }
    if (has_any(lowered, CHANNEL_REQUIRED)) {
        return Reason::ChannelRequired;
    }
    if (has_any(lowered, INFORMATIONAL)) {
        return std::nullopt;
    }
    if (has_any(lowered, NO_SLOTS)) {
        return Reason::NoSlots;
    }

    return Reason::Rejected;
}

}  // namespace xdcc::transfer
