#include "remotegate/dispatch/factory.hpp"

#include "remotegate/common/strings.hpp"
#include "remotegate/dispatch/iterm_dispatcher.hpp"
#include "remotegate/dispatch/null_dispatcher.hpp"
#include "remotegate/dispatch/tmux_dispatcher.hpp"

namespace remotegate::dispatch {

common::Result<std::unique_ptr<IKeystrokeDispatcher>>
create_dispatcher(const config::DispatcherConfig &config, ProcessRunner runner) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  const auto timeout = std::chrono::milliseconds(config.timeout_ms);
  if (!runner) {
    runner = default_process_runner();
  }

  if (backend == "tmux") {
    return common::Result<std::unique_ptr<IKeystrokeDispatcher>>::success(
        std::make_unique<TmuxDispatcher>(timeout, std::move(runner)));
  }
  if (backend == "iterm") {
    return common::Result<std::unique_ptr<IKeystrokeDispatcher>>::success(
        std::make_unique<ItermDispatcher>(timeout, std::move(runner)));
  }
  if (backend == "none") {
    return common::Result<std::unique_ptr<IKeystrokeDispatcher>>::success(
        std::make_unique<NullDispatcher>());
  }
  return common::Result<std::unique_ptr<IKeystrokeDispatcher>>::failure(
      "unknown dispatcher backend: " + config.backend);
}

} // namespace remotegate::dispatch
