#pragma once

namespace tc::lua {

class LuaState;

/// Register the map globals (MapWidth, SetTile, IsInFov, ShortestPath, ...).
/// The state must have a TileMap set; a Config is optional and supplies
/// defaults for radius, crouching, fov mode and the search node cap.
void register_map_bindings(LuaState& state);

} // namespace tc::lua
