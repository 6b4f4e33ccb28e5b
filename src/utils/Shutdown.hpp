#pragma once

#include <atomic>

namespace mp::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void install_signal_handlers();

} // namespace mp::runtime
