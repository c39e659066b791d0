// src/replay/lua_point_source.cpp
#include "replay/lua_point_source.hpp"
#include "utils/logging.hpp"

#include <cmath>

namespace replay {

LuaPointSource::~LuaPointSource() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaPointSource::init(const std::string& lua_script_path,
                          const std::string& scenario_path) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    lua_getglobal(L_, "scenario_points");
    const bool has_points_fn = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_points_fn) {
        LOG_ERROR("[Lua] %s does not define scenario_points(t)", lua_script_path.c_str());
        return false;
    }

    // Optional scenario_init(path)
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        lua_pushstring(L_, scenario_path.c_str());
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            return false;
        }
        const bool ok = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
    } else {
        lua_pop(L_, 1);
    }

    return true;
}

bool LuaPointSource::read_point_(int idx, fit::Point& out) {
    if (!lua_istable(L_, idx)) return false;

    auto get_num = [&](const char* k, int pos, double& v) -> bool {
        lua_getfield(L_, idx, k);
        if (lua_isnumber(L_, -1)) {
            v = lua_tonumber(L_, -1);
            lua_pop(L_, 1);
            return true;
        }
        lua_pop(L_, 1);

        lua_rawgeti(L_, idx, pos);
        const bool ok = lua_isnumber(L_, -1);
        if (ok) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return ok;
    };

    double y = 0.0;
    double x = 0.0;
    if (!get_num("y", 1, y) || !get_num("x", 2, x)) return false;
    if (!std::isfinite(y) || !std::isfinite(x)) return false;

    out = fit::Point(y, x);
    return true;
}

bool LuaPointSource::next_frame(double t_s, std::vector<fit::Point>& out) {
    out.clear();
    if (!L_) return false;

    lua_getglobal(L_, "scenario_points");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_points() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);

    if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_points failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    if (lua_isnil(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }

    if (!lua_istable(L_, -1)) {
        LOG_ERROR("[Lua] scenario_points must return a table");
        lua_pop(L_, 1);
        return false;
    }

    const int list_idx = lua_gettop(L_);
    const auto n = static_cast<lua_Integer>(lua_rawlen(L_, list_idx));
    out.reserve(static_cast<size_t>(n));

    for (lua_Integer i = 1; i <= n; ++i) {
        lua_rawgeti(L_, list_idx, i);
        fit::Point p;
        const bool ok = read_point_(lua_gettop(L_), p);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_ERROR("[Lua] [t=%.3f] point %lld is not a finite {y, x}", t_s, static_cast<long long>(i));
            lua_pop(L_, 1);
            return false;
        }
        out.push_back(p);
    }

    lua_pop(L_, 1);
    return true;
}

} // namespace replay
