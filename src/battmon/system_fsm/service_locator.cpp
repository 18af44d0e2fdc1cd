/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "system_fsm/service_locator.hpp"

#include <memory>

namespace system_fsm {

ServiceLocator::ServiceLocator() {}

}  // namespace system_fsm
