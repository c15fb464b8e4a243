#pragma once

#include "beamdrop/core/runtime.hpp"
#include "beamdrop/transfer/send_handle.hpp"
#include "beamdrop/transfer/status.hpp"
#include "beamdrop/transfer/transfer_options.hpp"
#include <filesystem>
#include <memory>

namespace beamdrop::transfer {

// Imports path into a private store, serves it to peers presenting the
// ticket and reports Connecting, Importing and ReadyToSend. On failure
// everything acquired so far is released, a single Error is emitted and
// nullptr is returned.
std::shared_ptr<SendHandle> send_p2p(const std::filesystem::path& path, const TransferOptions& options,
                                     const std::shared_ptr<core::Runtime>& runtime, SendChannel& events);

}
