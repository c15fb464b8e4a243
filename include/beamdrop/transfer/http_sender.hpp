#pragma once

#include "beamdrop/core/runtime.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/transfer/send_handle.hpp"
#include "beamdrop/transfer/status.hpp"
#include "beamdrop/transfer/transfer_options.hpp"
#include <filesystem>
#include <memory>

namespace beamdrop::transfer {

// Publishes a single file through a local HTTP server and a public tunnel.
// The ReadyToSend ticket is the public download URL. Failure handling is the
// same as send_p2p.
std::shared_ptr<SendHandle> send_http(const std::filesystem::path& path, const TransferOptions& options,
                                      const std::shared_ptr<network::TunnelConnector>& connector,
                                      const std::shared_ptr<core::Runtime>& runtime, SendChannel& events);

}
