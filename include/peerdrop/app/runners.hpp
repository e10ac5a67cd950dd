#pragma once

#include "peerdrop/app/command_line.hpp"
#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"

#include <istream>
#include <ostream>

namespace peerdrop::app {

/**
 * @brief Register, print the peer id and transfer key, answer the receiver's
 *        offer and send the file
 */
[[nodiscard]] Result<Unit, PeerDropFailure> RunSender(const SendCommand& command,
                                                      const configuration::ApplicationConfig& config,
                                                      std::ostream& out);

/**
 * @brief Offer a connection to the sender and store the file it sends
 *
 * The transfer key comes from the command or, when absent, from the first
 * line of @p in.
 */
[[nodiscard]] Result<Unit, PeerDropFailure> RunReceiver(const ReceiveCommand& command,
                                                        const configuration::ApplicationConfig& config,
                                                        std::istream& in,
                                                        std::ostream& out);

} // namespace peerdrop::app
