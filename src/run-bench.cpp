/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#define ANKERL_NANOBENCH_IMPLEMENTATION 1
#include <iostream>
#include <strata/common/benchmark.hpp>
#include <strata/common/timer.hpp>

int main(const int argc, const char **argv)
{
    using namespace strata;
    const timer t { "run-bench", logger::level::info };
    if (argc >= 2) {
        std::cerr << fmt::format("using bench-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    return res ? 1 : 0;
}
