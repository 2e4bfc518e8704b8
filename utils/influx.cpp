// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// ============================================================================
// Callback for ignoring HTTP response body
// ============================================================================

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// Line protocol rejects NaN/Inf field values; such fields are left out
static void append_field(std::ostringstream& line, bool& first, const char* key, double value) {
    if (!std::isfinite(value)) {
        return;
    }
    line << (first ? " " : ",") << key << "=" << value;
    first = false;
}

static void append_int_field(std::ostringstream& line, bool& first, const char* key, long long value) {
    line << (first ? " " : ",") << key << "=" << value << "i";
    first = false;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_decision_ts_s_(0)
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }

    impl_ = std::make_unique<Impl>();

    // http://localhost:8086/api/v2/write?org=Vesta&bucket=vesta-dispatch&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str());
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        LOG_INFO("[InfluxDB] Client shutdown (%zu writes)", writes_ok_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_decision(const engine::DecisionRecord& record) {
    if (!config_.enabled) {
        return false;
    }

    if (have_last_decision_ &&
        static_cast<double>(record.timestamp_s - last_decision_ts_s_) < config_.write_interval_s) {
        return false;
    }
    last_decision_ts_s_ = record.timestamp_s;
    have_last_decision_ = true;

    const int64_t ts_ns = config_.use_wall_clock ? wall_clock_time_ns()
                                                 : seconds_to_ns(record.timestamp_s);
    return send_to_influx(build_decision_line(record, config_.site_tag, ts_ns) + "\n");
}

bool InfluxClient::write_simulation_summary(const sim::SimulationResult& result,
                                            const std::string& run_name) {
    if (!config_.enabled) {
        return false;
    }

    int64_t ts_ns = wall_clock_time_ns();
    if (!config_.use_wall_clock && !result.steps.empty()) {
        ts_ns = seconds_to_ns(result.steps.back().conditions.timestamp_s);
    }
    return send_to_influx(build_summary_line(result, config_.site_tag, run_name, ts_ns) + "\n");
}

void InfluxClient::flush() {
    // Writes are sent synchronously; nothing is buffered
}

// ============================================================================
// Line Protocol Builders (field names match the decision log CSV)
// ============================================================================

std::string InfluxClient::escape_tag(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ',' || c == ' ' || c == '=') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out.empty() ? "none" : out;
}

std::string InfluxClient::build_decision_line(const engine::DecisionRecord& record,
                                              const std::string& site_tag,
                                              int64_t timestamp_ns) {
    using dispatch::Source;

    std::ostringstream line;
    line << "dispatch_decision"
         << ",site=" << escape_tag(site_tag)
         << ",fallback=" << (record.fallback ? "true" : "false");

    bool first = true;
    append_field(line, first, "requested_kw", record.requested_power_kw);
    append_field(line, first, "solar_kw", dispatch::allocated_kw(record.allocation, Source::Solar));
    append_field(line, first, "battery_kw", dispatch::allocated_kw(record.allocation, Source::Battery));
    append_field(line, first, "grid_kw", dispatch::allocated_kw(record.allocation, Source::Grid));
    append_field(line, first, "cost", record.metrics.estimated_cost);
    append_field(line, first, "carbon_g", record.metrics.estimated_carbon_g);
    append_field(line, first, "battery_kwh", record.metrics.battery_charge_after_kwh);
    append_field(line, first, "battery_charged_kw", record.metrics.battery_charged_kw);
    append_field(line, first, "grid_score", record.metrics.grid_score);
    append_field(line, first, "battery_score", record.metrics.battery_score);
    if (record.has_forecast()) {
        append_field(line, first, "forecast_next_kw", record.forecast_kw.front());
    }
    append_field(line, first, "deferred_kw", record.load_shedding.total_deferred_kw);

    line << " " << timestamp_ns;
    return line.str();
}

std::string InfluxClient::build_summary_line(const sim::SimulationResult& result,
                                             const std::string& site_tag,
                                             const std::string& run_name,
                                             int64_t timestamp_ns) {
    std::ostringstream line;
    line << "simulation_summary"
         << ",site=" << escape_tag(site_tag)
         << ",run=" << escape_tag(run_name);

    bool first = true;
    append_field(line, first, "cost_weight", result.weights.cost_weight);
    append_field(line, first, "carbon_weight", result.weights.carbon_weight);
    append_field(line, first, "total_cost", result.total_cost);
    append_field(line, first, "total_carbon_g", result.total_carbon_g);
    append_field(line, first, "demand_kwh", result.total_demand_kwh);
    append_field(line, first, "solar_kwh", result.solar_kwh);
    append_field(line, first, "battery_kwh", result.battery_kwh);
    append_field(line, first, "grid_kwh", result.grid_kwh);
    append_field(line, first, "baseline_cost", result.baseline_grid_only_cost);
    append_field(line, first, "baseline_carbon_g", result.baseline_grid_only_carbon_g);
    append_field(line, first, "cost_savings_pct", result.cost_savings_pct);
    append_field(line, first, "carbon_savings_pct", result.carbon_savings_pct);
    append_field(line, first, "objective_savings_pct", result.objective_savings_pct);
    append_field(line, first, "final_battery_kwh", result.final_battery_kwh);
    append_int_field(line, first, "steps", static_cast<long long>(result.steps_total));
    append_int_field(line, first, "gaps", static_cast<long long>(result.gaps.size()));

    line << " " << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    writes_ok_++;
    if (writes_ok_ == 1) {
        LOG_INFO("[InfluxDB] First write successful");
    } else if (writes_ok_ % 24 == 0) {
        LOG_INFO("[InfluxDB] Successfully wrote %zu points", writes_ok_);
    }

    return true;
}

// ============================================================================
// Time Conversion
// ============================================================================

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

} // namespace utils
