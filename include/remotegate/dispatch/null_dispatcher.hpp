#pragma once

#include "remotegate/dispatch/dispatcher.hpp"

namespace remotegate::dispatch {

class NullDispatcher final : public IKeystrokeDispatcher {
public:
  [[nodiscard]] DispatchOutcome send(const std::string &, const std::string &) override {
    return DispatchOutcome::not_found("keystroke delivery disabled");
  }
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace remotegate::dispatch
