#pragma once

#include "../../utility/timing.hpp"
#include "config.hpp"
#include "window.hpp"

// per-frame context passed to renderers
struct Context {
    Config &vcfg;
    const WindowConfig &wcfg;
    kernelbench::TimingLog &timings;
    ViewStats &stats;

    bool should_exit = false;

    Context(Config &vcfg, const WindowConfig &wcfg,
            kernelbench::TimingLog &timings, ViewStats &stats)
        : vcfg(vcfg), wcfg(wcfg), timings(timings), stats(stats) {}
};
