#pragma once

#include <optional>
#include <string_view>

#include "transfer/failure.hpp"

namespace xdcc::transfer {

/**
 * @brief Classify a bot notice sent instead of a file offer
 *
 * Returns nullopt for informational notices ("sending you pack", "added you
 * to the queue") that do not end the request. Unknown text is a generic
 * Reason::Rejected.
 */
auto classify_rejection(std::string_view text) -> std::optional<Reason>;

}  // namespace xdcc::transfer
