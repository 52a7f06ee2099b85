#include "model/signals.hpp"
#include <cmath>

namespace claro::model {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

constexpr double kBaseTempC = 8.0;
constexpr double kDailyTroughHour = 5.0;

constexpr double kBaseCapacity = 180.0;
constexpr double kWeekendMultiplier = 0.65;
constexpr double kOccupancyNoiseSigma = 8.0;

double gaussian_bump(double x, double center, double sigma) {
    double d = x - center;
    return std::exp(-(d * d) / (2.0 * sigma * sigma));
}

bool is_weekday(const Timestamp& ts) {
    return ts.weekday() <= 4;
}

}  // anonymous namespace

double simulate_outdoor_temp(const Timestamp& ts, double seasonal_amp, double daily_amp) {
    double day_of_year = static_cast<double>(ts.day_of_year());
    double hour = ts.hour_of_day();

    double seasonal = kBaseTempC + seasonal_amp * std::sin(TWO_PI * (day_of_year / 365.0));
    double daily = daily_amp * std::sin(TWO_PI * ((hour - kDailyTroughHour) / 24.0));

    return seasonal + daily;
}

int simulate_open_regime(const Timestamp& ts) {
    double hour = ts.hour_of_day();

    if (is_weekday(ts)) {
        return (hour >= 8.0 && hour < 22.0) ? 1 : 0;
    }
    return (hour >= 10.0 && hour < 18.0) ? 1 : 0;
}

double simulate_occupancy(const Timestamp& ts, int open_regime,
                          double academic_intensity, SimRNG& rng) {
    if (open_regime == 0) return 0.0;

    double hour = ts.hour_of_day();

    // Midday peak + late-afternoon peak
    double daily_profile = 0.6 * gaussian_bump(hour, 13.0, 3.5)
                         + 0.4 * gaussian_bump(hour, 18.0, 2.8);

    double weekday_multiplier = is_weekday(ts) ? 1.0 : kWeekendMultiplier;
    double base_capacity = kBaseCapacity * academic_intensity;

    double noise = rng.gaussian(0.0, kOccupancyNoiseSigma);
    double occ = base_capacity * daily_profile * weekday_multiplier + noise;

    return clamp(occ, 0.0, kMaxOccupancy);
}

double temp_pressure(double temp_out, double comfort_low, double comfort_high) {
    if (temp_out < comfort_low) return comfort_low - temp_out;
    if (temp_out > comfort_high) return temp_out - comfort_high;
    return 0.0;
}

} // namespace claro::model
