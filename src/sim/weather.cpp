/// @file src/sim/weather.cpp
/// @brief Weather Markov chain.

#include "sim/weather.hpp"

namespace medsim::sim {

double weather_index(WeatherState w) noexcept {
    switch (w) {
        case WeatherState::Calm:     return 0.0;
        case WeatherState::Moderate: return 0.5;
        case WeatherState::Rough:    return 1.0;
    }
    return 0.0;
}

WeatherState next_weather(WeatherState current, double change_rate, RandomStream& rng) {
    if (!rng.bernoulli(change_rate)) {
        return current;
    }
    switch (current) {
        case WeatherState::Calm:  return WeatherState::Moderate;
        case WeatherState::Rough: return WeatherState::Moderate;
        case WeatherState::Moderate:
            return rng.bernoulli(0.5) ? WeatherState::Rough : WeatherState::Calm;
    }
    return current;
}

}  // namespace medsim::sim
