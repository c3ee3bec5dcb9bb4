#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <ostream>
#include <string>
#include <string_view>
#include <boost/json.hpp>
#include "data.hpp"

namespace strata::codec::json {
    using namespace boost::json;

    extern value parse(std::string_view text);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    // Numbers are written using their original text, map keys are written in their sort order
    extern std::string encode(const data_t &val);
    // Accepts a single JSON document optionally surrounded by whitespace; NaN and Infinity are allowed
    extern data_t decode(std::string_view text);
}
