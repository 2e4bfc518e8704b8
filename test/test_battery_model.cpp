// test/test_battery_model.cpp
#include "plant/battery_model.hpp"
#include <iostream>
#include <iomanip>
#include <cmath>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

static bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

static plant::BatteryParams make_params(double soc) {
    plant::BatteryParams p;
    p.capacity_kwh = 10.0;
    p.max_discharge_kw = 2.0;
    p.max_charge_kw = 2.0;
    p.initial_soc = soc;
    return p;
}

bool test_initial_charge() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Initial Charge From SOC ===" << COLOR_RESET << "\n";

    plant::BatteryModel nominal(make_params(0.8));
    plant::BatteryModel over(make_params(1.5));
    plant::BatteryModel under(make_params(-0.2));

    plant::BatteryParams broken = make_params(0.5);
    broken.capacity_kwh = -4.0;
    plant::BatteryModel empty(broken);

    std::cout << "  soc 0.8  -> " << nominal.charge_kwh() << " kWh\n";
    std::cout << "  soc 1.5  -> " << over.charge_kwh() << " kWh\n";
    std::cout << "  soc -0.2 -> " << under.charge_kwh() << " kWh\n";
    std::cout << "  capacity -4 -> " << empty.capacity_kwh() << " kWh\n";

    bool pass = near(nominal.charge_kwh(), 8.0) &&
                near(over.charge_kwh(), 10.0) &&
                near(under.charge_kwh(), 0.0) &&
                near(empty.capacity_kwh(), 0.0) &&
                near(empty.charge_kwh(), 0.0) &&
                near(nominal.soc_pct(), 80.0);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_discharge_clamped_to_charge() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: Discharge Clamped To Stored Energy ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.1), 1.0);   // 1 kWh stored

    const double headroom = b.discharge_headroom_kw();
    const double actual = b.apply(5.0);

    std::cout << "  Headroom: " << headroom << " kW, requested 5.0 kW, applied " << actual << " kW\n";
    std::cout << "  Charge after: " << b.charge_kwh() << " kWh\n";

    bool pass = near(headroom, 1.0) && near(actual, 1.0) && near(b.charge_kwh(), 0.0);

    // Empty battery delivers nothing
    const double second = b.apply(1.0);
    pass = pass && near(second, 0.0) && near(b.charge_kwh(), 0.0);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_discharge_rate_limit() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: Discharge Rate Limit ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.8), 1.0);   // 8 kWh, 2 kW max

    const double actual = b.apply(3.5);
    std::cout << "  Requested 3.5 kW, applied " << actual << " kW, charge " << b.charge_kwh() << " kWh\n";

    bool pass = near(actual, 2.0) && near(b.charge_kwh(), 6.0);

    // Half-hour step: 1 kW for 0.5 h removes 0.5 kWh
    const double half = b.apply(1.0, 0.5);
    std::cout << "  1.0 kW over 0.5 h -> charge " << b.charge_kwh() << " kWh\n";
    pass = pass && near(half, 1.0) && near(b.charge_kwh(), 5.5);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_charge_clamped_to_capacity() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Charge Clamped To Capacity ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.95), 1.0);   // 9.5 kWh

    const double actual = b.apply(-3.0);
    std::cout << "  Requested -3.0 kW, applied " << actual << " kW, charge " << b.charge_kwh() << " kWh\n";

    bool pass = near(actual, -0.5) && near(b.charge_kwh(), 10.0);

    // Full battery accepts nothing
    const double again = b.apply(-1.0);
    pass = pass && near(again, 0.0) && near(b.charge_headroom_kw(), 0.0);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_degenerate_requests() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Zero/Negative Timestep And NaN Power ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.5), 1.0);
    const double before = b.charge_kwh();

    const double r_zero_dt = b.apply(1.0, 0.0);
    const double r_neg_dt = b.apply(-1.0, -1.0);
    const double r_nan = b.apply(std::nan(""));
    const double r_zero = b.apply(0.0);

    std::cout << "  dt=0: " << r_zero_dt << ", dt<0: " << r_neg_dt
              << ", NaN: " << r_nan << ", 0 kW: " << r_zero << "\n";

    bool pass = near(r_zero_dt, 0.0) && near(r_neg_dt, 0.0) &&
                near(r_nan, 0.0) && near(r_zero, 0.0) &&
                near(b.charge_kwh(), before) &&
                near(b.discharge_headroom_kw(0.0), 0.0) &&
                near(b.charge_headroom_kw(-1.0), 0.0);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_bounds_over_long_sequence() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 6: Bounds Hold Over Mixed Requests ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.5), 1.0);
    bool pass = true;

    for (int i = 0; i < 500; ++i) {
        const double request = 4.0 * std::sin(0.37 * i) + 0.5 * std::cos(1.3 * i);
        const double applied = b.apply(request);

        if (b.charge_kwh() < 0.0 || b.charge_kwh() > b.capacity_kwh()) {
            std::cout << "  Step " << i << ": charge out of bounds " << b.charge_kwh() << "\n";
            pass = false;
            break;
        }
        // Realized power never exceeds the request and keeps its sign
        if (std::abs(applied) > std::abs(request) + 1e-12 || applied * request < 0.0) {
            std::cout << "  Step " << i << ": applied " << applied << " for request " << request << "\n";
            pass = false;
            break;
        }
    }

    std::cout << "  Final charge: " << std::fixed << std::setprecision(3) << b.charge_kwh() << " kWh\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_set_charge_and_copy() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 7: set_charge_kwh And Independent Copies ===" << COLOR_RESET << "\n";

    plant::BatteryModel b(make_params(0.5), 1.0);
    b.set_charge_kwh(42.0);
    const bool clamped_high = near(b.charge_kwh(), 10.0);
    b.set_charge_kwh(-1.0);
    const bool clamped_low = near(b.charge_kwh(), 0.0);
    b.set_charge_kwh(std::nan(""));
    const bool nan_zero = near(b.charge_kwh(), 0.0);

    b.set_charge_kwh(6.0);
    plant::BatteryModel copy = b;
    copy.apply(2.0);

    std::cout << "  Original " << b.charge_kwh() << " kWh, copy " << copy.charge_kwh() << " kWh\n";

    bool pass = clamped_high && clamped_low && nan_zero &&
                near(b.charge_kwh(), 6.0) && near(copy.charge_kwh(), 4.0);

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        BatteryModel Validation Tests                       ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_initial_charge(); total++;
    passed += test_discharge_clamped_to_charge(); total++;
    passed += test_discharge_rate_limit(); total++;
    passed += test_charge_clamped_to_capacity(); total++;
    passed += test_degenerate_requests(); total++;
    passed += test_bounds_over_long_sequence(); total++;
    passed += test_set_charge_and_copy(); total++;

    std::cout << "\n" << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n";
    std::cout << "  " << COLOR_YELLOW << "Summary: " << COLOR_RESET;

    if (passed == total) {
        std::cout << COLOR_GREEN << passed << "/" << total << " tests passed ✓" << COLOR_RESET << "\n";
    } else {
        std::cout << COLOR_RED << passed << "/" << total << " tests passed ✗" << COLOR_RESET << "\n";
    }

    std::cout << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n\n";

    return (passed == total) ? 0 : 1;
}
