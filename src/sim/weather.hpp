#pragma once

/// @file src/sim/weather.hpp
/// @brief Slow-varying weather process for the field simulation.

#include "medsim/simulation.hpp"
#include "sim/random_stream.hpp"

namespace medsim::sim {

/// Weather index w: calm 0, moderate ½, rough 1.
[[nodiscard]] double weather_index(WeatherState w) noexcept;

/// One step of the Markov chain: with probability `change_rate` the state
/// moves one notch (towards the only neighbour at either end, otherwise
/// up or down with equal odds).
[[nodiscard]] WeatherState next_weather(WeatherState current,
                                        double change_rate,
                                        RandomStream& rng);

}  // namespace medsim::sim
