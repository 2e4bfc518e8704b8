// test/test_condition_loader.cpp
#include "sim/condition_loader.hpp"
#include "sim/synthetic_day.hpp"
#include "utils/timestamp.hpp"
#include <iostream>
#include <fstream>
#include <cmath>
#include <cstdio>
#include <stdexcept>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

static const char* kTempCsv = "/tmp/vesta_test_conditions.csv";

static void write_csv(const std::string& content) {
    std::ofstream out(kTempCsv);
    out << content;
}

bool test_canonical_columns() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Canonical Columns ===" << COLOR_RESET << "\n";

    write_csv("timestamp,demand_kw,shortwave_radiation,cloud_cover,temperature,carbon_intensity,grid_price_per_kwh,hour\n"
              "2024-03-01 12:00:00,1.25,640,20,31.5,710,8.5,12\n"
              "2024-03-01 13:00:00,1.10,600,25,32.0,690,5.0,13\n");

    const auto recs = sim::load_conditions_csv(kTempCsv);
    std::remove(kTempCsv);

    bool pass = recs.size() == 2;
    if (pass) {
        const auto& r = recs[0];
        std::cout << "  " << utils::format_timestamp(r.timestamp_s) << " demand " << r.demand_kw
                  << " kW, irradiance " << r.solar_irradiance_w_m2 << " W/m2\n";
        pass = utils::format_timestamp(r.timestamp_s) == "2024-03-01T12:00:00Z" &&
               r.demand_kw == 1.25 &&
               r.solar_irradiance_w_m2 == 640.0 &&
               r.cloud_cover_pct == 20.0 &&
               r.temperature_c == 31.5 &&
               r.carbon_intensity_g_per_kwh == 710.0 &&
               r.grid_price_per_kwh == 8.5 &&
               r.hour_of_day == 12 &&
               recs[1].timestamp_s - r.timestamp_s == 3600;
    }

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_column_aliases() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: Column Aliases And Derived Hour ===" << COLOR_RESET << "\n";

    // Integrated-dataset names; no hour column, no cloud column
    write_csv("timestamp,total_energy_kwh,solar_radiation,outdoor_temperature,carbon_intensity_g_per_kwh,grid_price\n"
              "2024-03-01T07:00:00Z,0.9,120,26.0,680,8.5\n");

    const auto recs = sim::load_conditions_csv(kTempCsv);
    std::remove(kTempCsv);

    bool pass = recs.size() == 1;
    if (pass) {
        const auto& r = recs[0];
        std::cout << "  hour " << r.hour_of_day << ", demand " << r.demand_kw
                  << " kW, cloud " << r.cloud_cover_pct << "%\n";
        pass = r.hour_of_day == 7 &&
               r.demand_kw == 0.9 &&
               r.solar_irradiance_w_m2 == 120.0 &&
               r.temperature_c == 26.0 &&
               r.carbon_intensity_g_per_kwh == 680.0 &&
               r.grid_price_per_kwh == 8.5 &&
               r.cloud_cover_pct == 0.0;
    }

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_missing_cells_are_nan() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: Missing Cells Load As NaN ===" << COLOR_RESET << "\n";

    write_csv("timestamp,demand_kw,shortwave_radiation,cloud_cover,carbon_intensity,grid_price_per_kwh\n"
              "2024-03-01 12:00:00,1.0,,10,700,\n"
              "2024-03-01 13:00:00,n/a,500,10,700,5.0\n");

    const auto recs = sim::load_conditions_csv(kTempCsv);
    std::remove(kTempCsv);

    bool pass = recs.size() == 2 &&
                std::isnan(recs[0].solar_irradiance_w_m2) &&
                std::isnan(recs[0].grid_price_per_kwh) &&
                std::isnan(recs[0].temperature_c) &&
                recs[0].carbon_intensity_g_per_kwh == 700.0 &&
                std::isnan(recs[1].demand_kw) &&
                recs[1].solar_irradiance_w_m2 == 500.0;

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_errors() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Load Errors ===" << COLOR_RESET << "\n";

    int caught = 0;

    try {
        sim::load_conditions_csv("/tmp/vesta_no_such_conditions.csv");
    } catch (const std::runtime_error& e) {
        std::cout << "  " << e.what() << "\n";
        ++caught;
    }

    write_csv("timestamp,shortwave_radiation\n2024-03-01 12:00:00,500\n");
    try {
        sim::load_conditions_csv(kTempCsv);
    } catch (const std::runtime_error& e) {
        std::cout << "  " << e.what() << "\n";
        ++caught;
    }

    write_csv("timestamp,demand_kw\n2024-03-01 12:00:00,1.0\nyesterday noon,1.0\n");
    try {
        sim::load_conditions_csv(kTempCsv);
    } catch (const std::runtime_error& e) {
        std::cout << "  " << e.what() << "\n";
        ++caught;
    }
    std::remove(kTempCsv);

    bool pass = caught == 3;
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_save_and_reload() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Save And Reload ===" << COLOR_RESET << "\n";

    sim::SyntheticDayParams sp;
    sp.seed = 5;
    const auto day = sim::SyntheticDayGenerator(sp).generate();

    bool pass = sim::save_conditions_csv(day, kTempCsv);
    const auto back = sim::load_conditions_csv(kTempCsv);
    std::remove(kTempCsv);

    pass = pass && back.size() == day.size();
    for (size_t i = 0; pass && i < day.size(); ++i) {
        pass = back[i].timestamp_s == day[i].timestamp_s &&
               back[i].hour_of_day == day[i].hour_of_day &&
               std::abs(back[i].demand_kw - day[i].demand_kw) < 1e-4 &&
               std::abs(back[i].solar_irradiance_w_m2 - day[i].solar_irradiance_w_m2) < 1e-4 &&
               std::abs(back[i].grid_price_per_kwh - day[i].grid_price_per_kwh) < 1e-4;
    }
    std::cout << "  Round-tripped " << back.size() << " records\n";

    pass = pass && sim::is_time_ordered(back) && !sim::save_conditions_csv(day, "/nonexistent_dir/c.csv");

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_time_order() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 6: Time Order Check ===" << COLOR_RESET << "\n";

    std::vector<dispatch::ConditionRecord> recs(3);
    recs[0].timestamp_s = 100;
    recs[1].timestamp_s = 100;
    recs[2].timestamp_s = 200;
    const bool ordered = sim::is_time_ordered(recs);

    recs[2].timestamp_s = 50;
    const bool unordered = !sim::is_time_ordered(recs);

    bool pass = ordered && unordered && sim::is_time_ordered({});
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        Condition Dataset Loader Tests                      ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_canonical_columns(); total++;
    passed += test_column_aliases(); total++;
    passed += test_missing_cells_are_nan(); total++;
    passed += test_errors(); total++;
    passed += test_save_and_reload(); total++;
    passed += test_time_order(); total++;

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
