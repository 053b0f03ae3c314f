#pragma once

#include "remotegate/common/result.hpp"
#include "remotegate/config/schema.hpp"
#include "remotegate/dispatch/dispatcher.hpp"

#include <memory>

namespace remotegate::dispatch {

/// Backend by name: "tmux", "iterm" or "none".
[[nodiscard]] common::Result<std::unique_ptr<IKeystrokeDispatcher>>
create_dispatcher(const config::DispatcherConfig &config,
                  ProcessRunner runner = default_process_runner());

} // namespace remotegate::dispatch
