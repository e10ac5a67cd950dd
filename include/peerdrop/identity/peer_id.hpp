#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"

#include <string>
#include <string_view>

namespace peerdrop::identity {

/**
 * @brief Name of a party registered at the rendezvous server
 *
 * A valid id is 1 to 64 characters of ASCII letters, digits, '-' and '_',
 * starting and ending with a letter or digit. Immutable once built.
 */
class PeerId {
public:
    static Result<PeerId, PeerDropFailure> Parse(std::string_view text);

    /**
     * @brief Random human-friendly id of the form adjective-noun-noun
     */
    static PeerId Generate();

    [[nodiscard]] static bool IsValid(std::string_view text) noexcept;

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const PeerId& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const PeerId& other) const noexcept { return value_ != other.value_; }

private:
    explicit PeerId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/// Random per-connection token sent with the registration request.
std::string GenerateToken();

/// Connection-scoped id correlating one offer/answer/candidate exchange.
std::string GenerateConnectionId();

} // namespace peerdrop::identity
