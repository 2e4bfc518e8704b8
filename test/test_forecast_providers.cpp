// test/test_forecast_providers.cpp
// Unit tests for the profile and Lua demand forecasters

#include "forecast/profile_forecaster.hpp"
#include "forecast/lua_forecaster.hpp"
#include "dispatch/errors.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

static bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

static void write_file(const char* path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

static dispatch::ConditionRecord at_hour(int hour, double demand_kw) {
    dispatch::ConditionRecord r;
    r.timestamp_s = 1704067200 + hour * 3600;
    r.hour_of_day = hour;
    r.demand_kw = demand_kw;
    return r;
}

// ============================================================================
// ProfileForecaster
// ============================================================================

bool test_profile_empty_window() {
    forecast::ProfileForecaster f(6, 24);
    const auto profile = forecast::ProfileForecaster::default_profile();

    auto p = f.predict({});
    TEST_ASSERT(p.size() == 6, "Horizon 6 expected, got " << p.size());
    for (size_t k = 0; k < 6; ++k) {
        TEST_ASSERT(near(p[k], profile[k]), "Empty window follows the profile from midnight");
    }
    TEST_ASSERT(f.is_loaded() && f.name() == "profile", "Profile forecaster loaded");

    return true;
}

bool test_profile_scales_to_recent_load() {
    forecast::ProfileForecaster f(3, 24);
    const auto profile = forecast::ProfileForecaster::default_profile();

    // Observed load at twice the profile
    forecast::ForecastWindow w = {at_hour(17, 2.0 * profile[17]), at_hour(18, 2.0 * profile[18])};
    auto p = f.predict(w);

    TEST_ASSERT(p.size() == 3, "Horizon 3 expected");
    TEST_ASSERT(near(p[0], 2.0 * profile[19]), "Next hour scaled by 2: " << p[0]);
    TEST_ASSERT(near(p[1], 2.0 * profile[20]), "Second hour scaled by 2");
    TEST_ASSERT(near(p[2], 2.0 * profile[21]), "Third hour scaled by 2");

    // NaN demand in the window is ignored
    w.push_back(at_hour(19, std::nan("")));
    auto q = f.predict(w);
    TEST_ASSERT(near(q[0], 2.0 * profile[20]), "NaN records do not change the scale");

    return true;
}

bool test_profile_wraps_midnight() {
    forecast::ProfileForecaster f(4, 24);
    const auto profile = forecast::ProfileForecaster::default_profile();

    auto p = f.predict({at_hour(22, profile[22])});
    TEST_ASSERT(near(p[0], profile[23]), "Hour 23 first");
    TEST_ASSERT(near(p[1], profile[0]), "Wraps to hour 0");
    TEST_ASSERT(near(p[3], profile[2]), "Then hour 2");

    return true;
}

bool test_profile_unloaded() {
    forecast::ProfileForecaster f(6, 24, forecast::ProfileForecaster::default_profile(), false);

    bool thrown = false;
    try {
        f.predict({});
    } catch (const dispatch::ModelUnavailable&) {
        thrown = true;
    }
    TEST_ASSERT(thrown, "Unloaded profile forecaster must raise ModelUnavailable");
    TEST_ASSERT(!f.is_loaded(), "Reports not loaded");

    return true;
}

bool test_profile_retrain_copy_on_write() {
    const char* path = "/tmp/vesta_test_profile_retrain.csv";
    write_file(path, "hour,demand_kw\n0,5.0\n0,3.0\n1,6.0\n");

    forecast::ProfileForecaster original(6, 24);
    auto retrained = original.retrain(path);
    std::remove(path);

    auto fresh = std::dynamic_pointer_cast<forecast::ProfileForecaster>(retrained);
    TEST_ASSERT(fresh != nullptr, "Retrain returns a profile forecaster");
    TEST_ASSERT(near(fresh->profile()[0], 4.0), "Hour 0 is the mean of 5 and 3");
    TEST_ASSERT(near(fresh->profile()[1], 6.0), "Hour 1 retrained");
    TEST_ASSERT(near(fresh->profile()[2], forecast::ProfileForecaster::default_profile()[2]),
                "Hours absent from the dataset keep their value");
    TEST_ASSERT(fresh->generation() == 1, "Generation advanced");

    TEST_ASSERT(near(original.profile()[0], forecast::ProfileForecaster::default_profile()[0]),
                "Original instance untouched");
    TEST_ASSERT(original.generation() == 0, "Original generation untouched");

    return true;
}

bool test_profile_retrain_failures() {
    forecast::ProfileForecaster f(6, 24);
    const char* path = "/tmp/vesta_test_profile_bad.csv";

    auto fails = [&f](const std::string& p) {
        try {
            f.retrain(p);
        } catch (const dispatch::RetrainFailure&) {
            return true;
        }
        return false;
    };

    TEST_ASSERT(fails("/tmp/vesta_no_such_profile.csv"), "Missing file");

    write_file(path, "hour,price\n1,5.0\n");
    TEST_ASSERT(fails(path), "No demand column");

    write_file(path, "demand_kw\n1.0\n");
    TEST_ASSERT(fails(path), "Neither hour nor timestamp column");

    write_file(path, "hour,demand_kw\n");
    TEST_ASSERT(fails(path), "No rows");

    write_file(path, "hour,demand_kw\n3,-1.0\n");
    TEST_ASSERT(fails(path), "Negative demand");

    write_file(path, "hour,demand_kw\n30,1.0\n");
    TEST_ASSERT(fails(path), "Hour out of range");

    std::remove(path);
    return true;
}

bool test_profile_from_dataset() {
    const char* path = "/tmp/vesta_test_profile_seed.csv";
    write_file(path, "timestamp,demand_kw\n2024-01-01 05:00:00,0.9\n2024-01-02 05:00:00,1.1\n");

    auto f = forecast::ProfileForecaster::from_dataset(path, 2, 12);
    std::remove(path);

    TEST_ASSERT(f && f->is_loaded(), "Seeded forecaster loaded");
    TEST_ASSERT(f->horizon() == 2 && f->lookback() == 12, "Horizon and lookback kept");
    TEST_ASSERT(near(f->profile()[5], 1.0), "Hour 5 seeded from timestamps");
    TEST_ASSERT(f->generation() == 0, "Seeded forecaster starts at generation 0");

    return true;
}

// ============================================================================
// LuaForecaster
// ============================================================================

static const char* kLuaScript = "/tmp/vesta_test_forecast.lua";

static void write_counting_script() {
    write_file(kLuaScript,
        "function forecast(window, horizon)\n"
        "  local out = {}\n"
        "  for k = 1, horizon do out[k] = #window + k + window[#window].demand_kw end\n"
        "  return out\n"
        "end\n"
        "function retrain(path)\n"
        "  return string.find(path, 'good') ~= nil\n"
        "end\n");
}

bool test_lua_predict() {
    write_counting_script();

    forecast::LuaForecaster f(kLuaScript, 3, 24);
    TEST_ASSERT(f.init(), "Script loads");
    TEST_ASSERT(f.is_loaded(), "Loaded after init");

    forecast::ForecastWindow w = {at_hour(1, 0.0), at_hour(2, 0.0), at_hour(3, 0.5)};
    auto p = f.predict(w);
    TEST_ASSERT(p.size() == 3, "Horizon 3 expected");
    TEST_ASSERT(near(p[0], 4.5) && near(p[1], 5.5) && near(p[2], 6.5), "Script values returned in order");

    // Window trimmed to lookback
    forecast::LuaForecaster short_lookback(kLuaScript, 1, 2);
    TEST_ASSERT(short_lookback.init(), "Second instance loads");
    auto q = short_lookback.predict(w);
    TEST_ASSERT(q.size() == 1 && near(q[0], 3.5), "Only the last 2 records reach the script");

    return true;
}

bool test_lua_retrain() {
    write_counting_script();

    forecast::LuaForecaster f(kLuaScript, 2, 24);
    TEST_ASSERT(f.init(), "Script loads");

    auto fresh = f.retrain("/data/good_week.csv");
    TEST_ASSERT(fresh && fresh->is_loaded(), "Retrain returns a loaded provider");
    TEST_ASSERT(fresh.get() != &f, "Retrain builds a new instance");

    bool thrown = false;
    try {
        f.retrain("/data/bad_week.csv");
    } catch (const dispatch::RetrainFailure&) {
        thrown = true;
    }
    TEST_ASSERT(thrown, "retrain() returning false raises RetrainFailure");
    TEST_ASSERT(f.is_loaded(), "Original instance still loaded");

    return true;
}

bool test_lua_load_failures() {
    forecast::LuaForecaster missing("/tmp/vesta_no_such_script.lua", 3, 24);
    TEST_ASSERT(!missing.init(), "Missing script fails to load");

    bool thrown = false;
    try {
        missing.predict({});
    } catch (const dispatch::ModelUnavailable&) {
        thrown = true;
    }
    TEST_ASSERT(thrown, "Unloaded Lua forecaster raises ModelUnavailable");

    write_file(kLuaScript, "function something_else() return 1 end\n");
    forecast::LuaForecaster no_entry(kLuaScript, 3, 24);
    TEST_ASSERT(!no_entry.init(), "Script without forecast() rejected");

    write_file(kLuaScript, "function forecast(window, horizon) return 42 end\n");
    forecast::LuaForecaster wrong_type(kLuaScript, 3, 24);
    TEST_ASSERT(wrong_type.init(), "Script loads");
    thrown = false;
    try {
        wrong_type.predict({});
    } catch (const dispatch::ModelUnavailable&) {
        thrown = true;
    }
    TEST_ASSERT(thrown, "Non-table result raises ModelUnavailable");

    write_file(kLuaScript, "function forecast(window, horizon) return {1.0} end\n");
    forecast::LuaForecaster short_result(kLuaScript, 3, 24);
    TEST_ASSERT(short_result.init(), "Script loads");
    thrown = false;
    try {
        short_result.predict({});
    } catch (const dispatch::ModelUnavailable&) {
        thrown = true;
    }
    TEST_ASSERT(thrown, "Too few values raises ModelUnavailable");
    TEST_ASSERT(short_result.is_loaded(), "Instance stays usable after a bad call");

    std::remove(kLuaScript);
    return true;
}

bool test_lua_time_budget() {
    write_file(kLuaScript,
               "function forecast(window, horizon)\n"
               "  if #window > 0 then while true do end end\n"
               "  local out = {}\n"
               "  for i = 1, horizon do out[i] = 0.5 end\n"
               "  return out\n"
               "end\n"
               "function retrain(path) while true do end end\n");

    forecast::LuaForecaster f(kLuaScript, 2, 24);
    TEST_ASSERT(f.init(), "Script loads");
    f.set_time_budget(0.05, 0.05);

    const auto start = std::chrono::steady_clock::now();
    bool thrown = false;
    try {
        f.predict({at_hour(3, 1.0)});
    } catch (const dispatch::ModelUnavailable& e) {
        thrown = std::string(e.what()).find("time budget") != std::string::npos;
    }
    const double elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    TEST_ASSERT(thrown, "Runaway forecast() aborted with ModelUnavailable");
    TEST_ASSERT(elapsed_s < 2.0, "Runaway forecast() stopped near its budget, took " << elapsed_s << " s");

    // The interpreter is released and still serves calls
    auto p = f.predict({});
    TEST_ASSERT(p.size() == 2 && near(p[0], 0.5), "Forecaster usable after an aborted call");

    thrown = false;
    try {
        f.retrain("/data/week.csv");
    } catch (const dispatch::RetrainFailure& e) {
        thrown = std::string(e.what()).find("time budget") != std::string::npos;
    }
    TEST_ASSERT(thrown, "Runaway retrain() aborted with RetrainFailure");
    TEST_ASSERT(f.is_loaded(), "Original instance still loaded");

    std::remove(kLuaScript);
    return true;
}

bool test_shipped_lua_script() {
    const char* path = "config/lua/demand_forecast.lua";
    std::ifstream probe(path);
    if (!probe.good()) {
        std::cout << "(skipped, run from the repository root) ";
        return true;
    }

    forecast::LuaForecaster f(path, 6, 24);
    TEST_ASSERT(f.init(), "Shipped script loads");

    forecast::ForecastWindow w;
    for (int h = 0; h < 12; ++h) w.push_back(at_hour(h, 1.0));
    auto p = f.predict(w);
    TEST_ASSERT(p.size() == 6, "Six steps returned");
    for (double v : p) {
        TEST_ASSERT(std::isfinite(v) && v > 0.0, "Forecast values positive");
    }

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Forecast Provider Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_profile_empty_window);
    RUN_TEST(test_profile_scales_to_recent_load);
    RUN_TEST(test_profile_wraps_midnight);
    RUN_TEST(test_profile_unloaded);
    RUN_TEST(test_profile_retrain_copy_on_write);
    RUN_TEST(test_profile_retrain_failures);
    RUN_TEST(test_profile_from_dataset);
    RUN_TEST(test_lua_predict);
    RUN_TEST(test_lua_retrain);
    RUN_TEST(test_lua_load_failures);
    RUN_TEST(test_lua_time_budget);
    RUN_TEST(test_shipped_lua_script);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
