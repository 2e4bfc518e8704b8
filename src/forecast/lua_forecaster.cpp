// src/forecast/lua_forecaster.cpp
#include "forecast/lua_forecaster.hpp"
#include "dispatch/errors.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <utility>

namespace forecast {

namespace {

// Registry key for the owning LuaForecaster
const char* const kSelfKey = "vesta.forecaster";

// VM instructions between deadline checks
constexpr int kHookInstructionCount = 10000;

} // namespace

LuaForecaster::LuaForecaster(std::string script_path, size_t horizon, size_t lookback)
    : script_path_(std::move(script_path)),
      horizon_(horizon == 0 ? 1 : horizon),
      lookback_(lookback) {}

LuaForecaster::~LuaForecaster() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

void LuaForecaster::set_time_budget(double predict_s, double retrain_s) {
    std::lock_guard<std::mutex> lock(mtx_);
    predict_budget_s_ = predict_s > 0.0 ? predict_s : 0.0;
    retrain_budget_s_ = retrain_s > 0.0 ? retrain_s : 0.0;
}

void LuaForecaster::deadline_hook_(lua_State* L, lua_Debug* ar) {
    (void)ar;
    lua_getfield(L, LUA_REGISTRYINDEX, kSelfKey);
    const auto* self = static_cast<const LuaForecaster*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    if (self && std::chrono::steady_clock::now() > self->deadline_) {
        luaL_error(L, "script call exceeded its time budget");
    }
}

int LuaForecaster::pcall_with_budget_(int nargs, int nresults, double budget_s) const {
    if (budget_s <= 0.0) {
        return lua_pcall(L_, nargs, nresults, 0);
    }
    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(budget_s));
    lua_sethook(L_, &LuaForecaster::deadline_hook_, LUA_MASKCOUNT, kHookInstructionCount);
    const int rc = lua_pcall(L_, nargs, nresults, 0);
    lua_sethook(L_, nullptr, 0, 0);
    return rc;
}

bool LuaForecaster::is_loaded() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return L_ != nullptr;
}

bool LuaForecaster::init() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    lua_State* L = luaL_newstate();
    if (!L) {
        LOG_ERROR("[Lua] Failed to allocate interpreter state");
        return false;
    }
    luaL_openlibs(L);
    lua_pushlightuserdata(L, this);
    lua_setfield(L, LUA_REGISTRYINDEX, kSelfKey);

    if (luaL_dofile(L, script_path_.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load forecaster %s: %s", script_path_.c_str(), lua_tostring(L, -1));
        lua_close(L);
        return false;
    }

    lua_getglobal(L, "forecast");
    const bool has_forecast = lua_isfunction(L, -1);
    lua_pop(L, 1);
    if (!has_forecast) {
        LOG_ERROR("[Lua] %s does not define forecast(window, horizon)", script_path_.c_str());
        lua_close(L);
        return false;
    }

    // Optional forecast_init(horizon, lookback)
    lua_getglobal(L, "forecast_init");
    if (lua_isfunction(L, -1)) {
        lua_pushinteger(L, static_cast<lua_Integer>(horizon_));
        lua_pushinteger(L, static_cast<lua_Integer>(lookback_));
        if (lua_pcall(L, 2, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] forecast_init failed: %s", lua_tostring(L, -1));
            lua_close(L);
            return false;
        }
        const bool ok = lua_isnil(L, -1) || lua_toboolean(L, -1);
        lua_pop(L, 1);
        if (!ok) {
            LOG_ERROR("[Lua] forecast_init returned false");
            lua_close(L);
            return false;
        }
    } else {
        lua_pop(L, 1);
    }

    L_ = L;
    LOG_INFO("[Lua] Forecaster loaded: %s (horizon=%zu)", script_path_.c_str(), horizon_);
    return true;
}

void LuaForecaster::push_window_(const ForecastWindow& w) const {
    const size_t n = (lookback_ > 0 && w.size() > lookback_) ? lookback_ : w.size();
    const size_t first = w.size() - n;

    lua_createtable(L_, static_cast<int>(n), 0);

    auto set_num = [&](const char* k, double v) {
        lua_pushstring(L_, k);
        lua_pushnumber(L_, v);
        lua_settable(L_, -3);
    };

    for (size_t i = 0; i < n; ++i) {
        const auto& r = w[first + i];
        lua_createtable(L_, 0, 8);
        set_num("t_s", static_cast<double>(r.timestamp_s));
        set_num("hour", static_cast<double>(r.hour_of_day));
        set_num("demand_kw", r.demand_kw);
        set_num("irradiance_w_m2", r.solar_irradiance_w_m2);
        set_num("cloud_cover_pct", r.cloud_cover_pct);
        set_num("temperature_c", r.temperature_c);
        set_num("carbon_g_per_kwh", r.carbon_intensity_g_per_kwh);
        set_num("price_per_kwh", r.grid_price_per_kwh);
        lua_rawseti(L_, -2, static_cast<lua_Integer>(i + 1));
    }
}

std::vector<double> LuaForecaster::predict(const ForecastWindow& recent_window) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!L_) {
        throw dispatch::ModelUnavailable("[Lua] forecaster not loaded: " + script_path_);
    }

    lua_getglobal(L_, "forecast");
    push_window_(recent_window);
    lua_pushinteger(L_, static_cast<lua_Integer>(horizon_));

    if (pcall_with_budget_(2, 1, predict_budget_s_) != LUA_OK) {
        std::string err = lua_tostring(L_, -1) ? lua_tostring(L_, -1) : "unknown error";
        lua_pop(L_, 1);
        throw dispatch::ModelUnavailable("[Lua] forecast() failed: " + err);
    }

    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        throw dispatch::ModelUnavailable("[Lua] forecast() must return a table");
    }

    std::vector<double> out;
    out.reserve(horizon_);
    for (size_t k = 1; k <= horizon_; ++k) {
        lua_rawgeti(L_, -1, static_cast<lua_Integer>(k));
        const bool is_num = lua_isnumber(L_, -1);
        const double v = is_num ? lua_tonumber(L_, -1) : 0.0;
        lua_pop(L_, 1);
        if (!is_num || !std::isfinite(v)) {
            lua_pop(L_, 1);
            throw dispatch::ModelUnavailable("[Lua] forecast() returned " + std::to_string(k - 1) +
                                             " usable values, expected " + std::to_string(horizon_));
        }
        out.push_back(v);
    }
    lua_pop(L_, 1);
    return out;
}

bool LuaForecaster::call_retrain_(const std::string& dataset_path, std::string& err) {
    std::lock_guard<std::mutex> lock(mtx_);
    lua_getglobal(L_, "retrain");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        err = "script defines no retrain(dataset_path)";
        return false;
    }

    lua_pushstring(L_, dataset_path.c_str());
    if (pcall_with_budget_(1, 1, retrain_budget_s_) != LUA_OK) {
        err = lua_tostring(L_, -1) ? lua_tostring(L_, -1) : "unknown error";
        lua_pop(L_, 1);
        return false;
    }

    const bool ok = lua_toboolean(L_, -1);
    lua_pop(L_, 1);
    if (!ok) err = "retrain() returned false";
    return ok;
}

std::shared_ptr<ForecastProvider> LuaForecaster::retrain(const std::string& dataset_path) const {
    // Fresh interpreter; this instance keeps serving predictions meanwhile
    auto fresh = std::make_shared<LuaForecaster>(script_path_, horizon_, lookback_);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        fresh->predict_budget_s_ = predict_budget_s_;
        fresh->retrain_budget_s_ = retrain_budget_s_;
    }
    if (!fresh->init()) {
        throw dispatch::RetrainFailure("cannot reload forecaster script: " + script_path_);
    }

    std::string err;
    if (!fresh->call_retrain_(dataset_path, err)) {
        throw dispatch::RetrainFailure("[Lua] retrain(" + dataset_path + "): " + err);
    }

    LOG_INFO("[Lua] Forecaster retrained on %s", dataset_path.c_str());
    return fresh;
}

} // namespace forecast
