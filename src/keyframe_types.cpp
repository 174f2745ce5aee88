#include "keyframe_types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace kfx {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::string method_name(Method method) {
    switch (method) {
        case Method::IFrame: return "I_frame";
        case Method::Difference: return "difference";
        case Method::Histogram: return "histogram";
        case Method::OpticalFlow: return "optical_flow";
    }
    return "unknown";
}

Method parse_method(const std::string& name) {
    if (name == "I_frame") return Method::IFrame;
    if (name == "difference") return Method::Difference;
    if (name == "histogram") return Method::Histogram;
    if (name == "optical_flow") return Method::OpticalFlow;
    throw std::invalid_argument("Unsupported method: " + name);
}

std::vector<Method> parse_method_list(const std::string& list) {
    std::vector<Method> methods;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        methods.push_back(parse_method(item));
    }
    return methods;
}

std::optional<double> default_threshold(Method method) {
    switch (method) {
        case Method::Difference: return 12.0;
        case Method::Histogram: return 0.35;
        case Method::OpticalFlow: return 1.5;
        case Method::IFrame: break;
    }
    return std::nullopt;
}

std::optional<double> MethodSpec::effective_threshold() const {
    if (method == Method::IFrame) return std::nullopt;
    return threshold ? threshold : default_threshold(method);
}

void ExtractionConfig::validate() const {
    if (methods.empty()) {
        throw std::invalid_argument("method must not be empty");
    }
    if (threshold && !std::isfinite(*threshold)) {
        throw std::invalid_argument("threshold must be a finite number");
    }
    if (max_keyframes <= 0) {
        throw std::invalid_argument("max_keyframes must be positive");
    }
    if (!(min_interval_s >= 0.0)) {
        throw std::invalid_argument("min_interval_s must be non-negative");
    }
    if (flow_step <= 0) {
        throw std::invalid_argument("flow_step must be positive");
    }
    if (image_format != "jpg" && image_format != "jpeg" && image_format != "png") {
        throw std::invalid_argument("Unsupported image_format: " + image_format);
    }
    if (!std::isfinite(timeout_s) || timeout_s < 0.0) {
        throw std::invalid_argument("timeout_s must be a finite non-negative number");
    }
}

std::vector<MethodSpec> ExtractionConfig::method_specs() const {
    std::vector<MethodSpec> specs;
    specs.reserve(methods.size());
    for (Method m : methods) {
        specs.push_back(MethodSpec{m, threshold});
    }
    return specs;
}

} // namespace kfx
