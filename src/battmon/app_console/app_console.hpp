/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <memory>

#include "dev_console/console.hpp"
#include "system_fsm/service_locator.hpp"

namespace console {

class AppConsole : public Console {
 public:
  static std::shared_ptr<system_fsm::ServiceLocator> sServices;

 protected:
  auto RegisterExtraComponents() -> void override;
};

}  // namespace console
