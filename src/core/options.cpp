#include "edakari/options.hpp"
#include "edakari/error.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace edakari {

namespace {

size_t parse_size(const std::string& key, const std::string& text) {
    // strtoull は空白・符号を読み飛ばすので先頭は数字に限る
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw InvalidInputError(key + ": expected a non-negative integer, got '" + text + "'");
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0') {
        throw InvalidInputError(key + ": expected a non-negative integer, got '" + text + "'");
    }
    if (errno == ERANGE) {
        throw InvalidInputError(key + ": value out of range '" + text + "'");
    }
    return static_cast<size_t>(v);
}

bool parse_bool(const std::string& key, const std::string& text) {
    if (text == "true" || text == "1" || text == "on") return true;
    if (text == "false" || text == "0" || text == "off") return false;
    throw InvalidInputError(key + ": expected true/false, got '" + text + "'");
}

std::chrono::milliseconds parse_duration(const std::string& key, const std::string& text) {
    std::string number = text;
    double scale = 1000.0;  // 秒 -> ミリ秒
    if (number.size() > 2 && number.compare(number.size() - 2, 2, "ms") == 0) {
        number.resize(number.size() - 2);
        scale = 1.0;
    } else if (number.size() > 1 && number.back() == 's') {
        number.pop_back();
    }
    if (number.empty() ||
        !(std::isdigit(static_cast<unsigned char>(number[0])) || number[0] == '.')) {
        throw InvalidInputError(key + ": expected a positive duration, got '" + text + "'");
    }
    char* end = nullptr;
    double v = std::strtod(number.c_str(), &end);
    if (*end != '\0' || !std::isfinite(v) || v <= 0.0) {
        throw InvalidInputError(key + ": expected a positive duration, got '" + text + "'");
    }
    if (v * scale >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw InvalidInputError(key + ": value out of range '" + text + "'");
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(v * scale)));
}

} // namespace

void SolverOptions::validate() const {
    if (worker_count == 0) {
        throw InvalidInputError("worker_count must be at least 1");
    }
    if (node_limit && *node_limit == 0) {
        throw InvalidInputError("node_limit must be positive");
    }
    if (time_limit && time_limit->count() <= 0) {
        throw InvalidInputError("time_limit must be positive");
    }
    if (log_interval == 0) {
        throw InvalidInputError("log_interval must be positive");
    }
}

SearchOrder parse_search_order(const std::string& text) {
    if (text == "best_bound_first") return SearchOrder::BestBoundFirst;
    if (text == "depth_first") return SearchOrder::DepthFirst;
    throw InvalidInputError("search_order: unknown value '" + text + "'");
}

BranchingRule parse_branching_rule(const std::string& text) {
    if (text == "first_unassigned") return BranchingRule::FirstUnassigned;
    if (text == "most_constrained") return BranchingRule::MostConstrained;
    throw InvalidInputError("branching_strategy: unknown value '" + text + "'");
}

SolverOptions parse_solver_options(const std::map<std::string, std::string>& values) {
    SolverOptions options;
    for (const auto& [key, text] : values) {
        if (key == "search_order") {
            options.search_order = parse_search_order(text);
        } else if (key == "branching_strategy") {
            options.branching_rule = parse_branching_rule(text);
        } else if (key == "node_limit") {
            if (text == "unbounded") {
                options.node_limit.reset();
            } else {
                options.node_limit = parse_size(key, text);
            }
        } else if (key == "time_limit") {
            if (text == "unbounded") {
                options.time_limit.reset();
            } else {
                options.time_limit = parse_duration(key, text);
            }
        } else if (key == "worker_count") {
            options.worker_count = parse_size(key, text);
        } else if (key == "pruning") {
            options.pruning = parse_bool(key, text);
        } else if (key == "bisect_threshold") {
            options.bisect_threshold = parse_size(key, text);
        } else if (key == "verbose") {
            options.verbose = parse_bool(key, text);
        } else if (key == "log_interval") {
            options.log_interval = parse_size(key, text);
        } else {
            throw InvalidInputError("unknown solver option: " + key);
        }
    }
    options.validate();
    return options;
}

} // namespace edakari
