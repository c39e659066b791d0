// src/replay/lua_point_source.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "replay/point_source.hpp"

namespace replay {

/**
 * LuaPointSource - Scripted point frames
 *
 * The script must define scenario_points(t) returning an array of points,
 * each either {y = ..., x = ...} or {y, x} with finite numbers. An optional scenario_init(path)
 * receives the scenario path and may return false to signal a soft failure.
 * Returning nil from scenario_points() ends the scenario.
 */
class LuaPointSource : public PointSource {
public:
    LuaPointSource() = default;
    ~LuaPointSource() override;

    LuaPointSource(const LuaPointSource&) = delete;
    LuaPointSource& operator=(const LuaPointSource&) = delete;

    bool init(const std::string& lua_script_path,
              const std::string& scenario_path);

    bool next_frame(double t_s, std::vector<fit::Point>& out) override;
    const char* name() const override { return "Lua"; }

private:
    lua_State* L_{nullptr};

    bool read_point_(int idx, fit::Point& out);
};

} // namespace replay
