// test/test_load_advisor.cpp
/**
 * Unit Test: LoadAdvisor
 *
 * Tests deferral advice for household loads under carbon and price signals.
 *
 * Test Coverage:
 *   1. High carbon intensity defers every deferrable load
 *   2. High price defers when carbon is acceptable
 *   3. Carbon takes precedence over price
 *   4. Critical and unknown loads are never deferred
 *   5. Thresholds are strict; NaN inputs never defer
 *   6. Custom load lists
 */

#include "engine/load_advisor.hpp"
#include <iostream>
#include <cmath>
#include <limits>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

// Default household: 7.7 kW of deferrable load
static const double kDeferrableKw = 1.5 + 3.0 + 2.0 + 1.2;

// Test 1: High carbon
void test_high_carbon(TestResult& result) {
    std::cout << "\n=== Test 1: High Carbon Intensity ===\n";

    engine::LoadAdvisor advisor;
    auto plan = advisor.recommend(800.0, 5.0);

    if (plan.items.size() == 7) {
        result.pass("Advice for every configured load");
    } else {
        result.fail("Expected 7 items, got " + std::to_string(plan.items.size()));
    }

    if (is_close(plan.total_deferred_kw, kDeferrableKw)) {
        result.pass("All deferrable load deferred: " + std::to_string(plan.total_deferred_kw) + " kW");
    } else {
        result.fail("Deferred kW mismatch: " + std::to_string(plan.total_deferred_kw));
    }

    // 7.7 kW x (800 - 400) g/kWh
    if (is_close(plan.total_carbon_saved_g, 3080.0) && plan.total_cost_saved == 0.0) {
        result.pass("Carbon savings 3080 g, no cost savings");
    } else {
        result.fail("Savings mismatch");
    }

    if (plan.summary() == "Defer 7.7 kW to save 3080g CO2") {
        result.pass("Summary: " + plan.summary());
    } else {
        result.fail("Unexpected summary: " + plan.summary());
    }
}

// Test 2: High price
void test_high_price(TestResult& result) {
    std::cout << "\n=== Test 2: High Grid Price ===\n";

    engine::LoadAdvisor advisor;
    auto plan = advisor.recommend(500.0, 10.0);

    // 7.7 kW x (10 - 5)
    if (is_close(plan.total_deferred_kw, kDeferrableKw) && is_close(plan.total_cost_saved, 38.5) &&
        plan.total_carbon_saved_g == 0.0) {
        result.pass("Price deferral with cost savings 38.5");
    } else {
        result.fail("Price deferral mismatch");
    }

    if (plan.summary() == "Defer 7.7 kW to save 38.50") {
        result.pass("Summary: " + plan.summary());
    } else {
        result.fail("Unexpected summary: " + plan.summary());
    }

    auto ev = advisor.advise("ev_charger", 500.0, 10.0);
    if (ev.defer && ev.reason.find("High grid price") != std::string::npos && is_close(ev.cost_savings, 15.0)) {
        result.pass("EV charger: " + ev.reason);
    } else {
        result.fail("EV charger advice mismatch: " + ev.reason);
    }
}

// Test 3: Carbon before price
void test_carbon_precedence(TestResult& result) {
    std::cout << "\n=== Test 3: Carbon Takes Precedence ===\n";

    engine::LoadAdvisor advisor;
    auto a = advisor.advise("washing_machine", 900.0, 12.0);

    if (a.defer && a.reason.find("High carbon") != std::string::npos &&
        is_close(a.carbon_savings_g, 1.5 * 500.0) && a.cost_savings == 0.0) {
        result.pass("Deferred for carbon only: " + a.reason);
    } else {
        result.fail("Carbon precedence violated: " + a.reason);
    }
}

// Test 4: Critical and unknown loads
void test_never_deferred(TestResult& result) {
    std::cout << "\n=== Test 4: Critical And Unknown Loads ===\n";

    engine::LoadAdvisor advisor;

    auto fridge = advisor.advise("refrigerator", 2000.0, 50.0);
    if (!fridge.defer && fridge.kind == engine::LoadKind::Critical &&
        fridge.reason == "Critical load - cannot defer") {
        result.pass("Critical load kept running");
    } else {
        result.fail("Critical load deferred");
    }

    auto unknown = advisor.advise("hot_tub", 2000.0, 50.0);
    if (!unknown.defer && unknown.reason == "Unknown load" && unknown.power_kw == 0.0) {
        result.pass("Unknown load not deferred");
    } else {
        result.fail("Unknown load advice mismatch");
    }

    auto plan = advisor.recommend(2000.0, 50.0);
    bool critical_ok = true;
    for (const auto& item : plan.items) {
        if (item.kind == engine::LoadKind::Critical && item.defer) critical_ok = false;
    }
    if (critical_ok) {
        result.pass("No critical load deferred in a full plan");
    } else {
        result.fail("Critical load deferred in plan");
    }

    if (std::string(engine::to_string(engine::LoadKind::Deferrable)) == "deferrable") {
        result.pass("LoadKind names");
    } else {
        result.fail("LoadKind name mismatch");
    }
}

// Test 5: Thresholds and missing data
void test_thresholds(TestResult& result) {
    std::cout << "\n=== Test 5: Thresholds And Missing Data ===\n";

    engine::LoadAdvisor advisor;

    auto at_threshold = advisor.recommend(700.0, 8.0);
    if (!at_threshold.any_deferred() && at_threshold.summary() == "All loads can proceed") {
        result.pass("Exactly at both thresholds: nothing deferred");
    } else {
        result.fail("Threshold should be strict");
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto missing = advisor.recommend(nan, nan);
    if (!missing.any_deferred()) {
        result.pass("Missing market data defers nothing");
    } else {
        result.fail("NaN inputs caused deferral");
    }

    auto good = advisor.advise("dishwasher", 300.0, 4.0);
    if (!good.defer && good.reason.find("Good conditions") != std::string::npos) {
        result.pass("Clean cheap grid: " + good.reason);
    } else {
        result.fail("Unexpected advice under good conditions");
    }
}

// Test 6: Custom loads
void test_custom_loads(TestResult& result) {
    std::cout << "\n=== Test 6: Custom Load List ===\n";

    engine::LoadAdvisorParams p;
    p.carbon_threshold_g_per_kwh = 300.0;
    p.clean_carbon_baseline_g_per_kwh = 200.0;
    p.loads = {{"pool_pump", engine::LoadKind::Deferrable, 0.75},
               {"medical", engine::LoadKind::Critical, 0.4}};
    engine::LoadAdvisor advisor(p);

    auto plan = advisor.recommend(400.0, 1.0);
    if (plan.items.size() == 2 && is_close(plan.total_deferred_kw, 0.75) &&
        is_close(plan.total_carbon_saved_g, 150.0)) {
        result.pass("Custom threshold and baseline applied");
    } else {
        result.fail("Custom load plan mismatch");
    }

    engine::LoadAdvisorParams none;
    none.loads.clear();
    auto empty = engine::LoadAdvisor(none).recommend(900.0, 20.0);
    if (empty.items.empty() && !empty.any_deferred()) {
        result.pass("Empty load list gives an empty plan");
    } else {
        result.fail("Empty load list mismatch");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            LoadAdvisor Unit Tests                           ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_high_carbon(result);
    test_high_price(result);
    test_carbon_precedence(result);
    test_never_deferred(result);
    test_thresholds(result);
    test_custom_loads(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
