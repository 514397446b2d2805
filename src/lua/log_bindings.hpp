#pragma once

namespace tc::lua {

class LuaState;

/// Register LOG, WARN, SPEW and _ALERT, forwarding to spdlog at info, warn,
/// debug and error level.
void register_log_bindings(LuaState& state);

} // namespace tc::lua
