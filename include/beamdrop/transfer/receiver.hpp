#pragma once

#include "beamdrop/core/runtime.hpp"
#include "beamdrop/network/ticket.hpp"
#include "beamdrop/transfer/status.hpp"
#include "beamdrop/transfer/transfer_options.hpp"
#include <filesystem>
#include <string>

namespace beamdrop::transfer {

// Staging directory used for a ticket, named after the collection hash.
std::filesystem::path receive_staging_dir(const TransferOptions& options, const crypto::Hash& hash);

// Fetches the collection named by the ticket and writes it to
// options.output_dir. Emits exactly one terminal Done or Error, after the
// staging directory has been removed. Returns true on success.
bool receive(const std::string& ticket, ReceiveChannel& events, const TransferOptions& options,
             const core::CancellationToken* cancel = nullptr);

}
