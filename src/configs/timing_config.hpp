// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace ReinvestTrader {
namespace Config {

struct TimingConfig {
    int order_spacing_milliseconds = 2000;           // Pause after each submitted order (broker rate limit)
};

} // namespace Config
} // namespace ReinvestTrader

#endif // TIMING_CONFIG_HPP
