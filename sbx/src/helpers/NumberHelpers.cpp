#include "helpers/HelperArguments.h"
#include "helpers/HelperLibrary.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <map>
#include <random>

namespace SBX {

using namespace HelperArguments;

namespace {

constexpr int MAX_FRACTION_DIGITS = 20;

int fractionDigits(const HelperArgs &args, size_t index, int defaultValue, const char *helper) {
    double digits = optionalNumber(args, index, defaultValue, helper);
    if (!std::isfinite(digits) || digits < 0 || digits > MAX_FRACTION_DIGITS) {
        throw HelperError(std::string(helper) + ": decimals must be between 0 and 20");
    }
    return static_cast<int>(digits);
}

// Half away from zero, as Number.prototype.toFixed does
double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    double scaled = std::fabs(value) * scale;
    if (!std::isfinite(scaled)) {
        // Too large to carry a fraction at this precision
        return value;
    }
    return std::copysign(std::round(scaled) / scale, value);
}

std::string toFixed(double value, int decimals) {
    std::string text = std::format("{:.{}f}", roundTo(value, decimals), decimals);
    // Avoid "-0.00"
    if (text.front() == '-' && text.find_first_not_of("-0.") == std::string::npos) {
        text.erase(0, 1);
    }
    return text;
}

std::string groupThousands(const std::string &digits) {
    size_t pointPos = digits.find('.');
    std::string integral = digits.substr(0, pointPos);
    std::string fraction = pointPos == std::string::npos ? std::string() : digits.substr(pointPos);

    std::string grouped;
    int counter = 0;
    for (auto it = integral.rbegin(); it != integral.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        counter++;
    }
    return grouped + fraction;
}

struct CurrencyFormat {
    const char *symbol;
    int decimals;
};

const std::map<std::string, CurrencyFormat> &currencyFormats() {
    static const std::map<std::string, CurrencyFormat> formats = {
        {"USD", {"$", 2}},     {"EUR", {"€", 2}}, {"GBP", {"£", 2}},  {"JPY", {"¥", 0}},
        {"CAD", {"CA$", 2}},   {"AUD", {"A$", 2}},     {"INR", {"₹", 2}},  {"CNY", {"CN¥", 2}},
        {"KRW", {"₩", 0}}, {"MXN", {"MX$", 2}},    {"BRL", {"R$", 2}},      {"NZD", {"NZ$", 2}},
    };
    return formats;
}

HostValue round(const HelperArgs &args) {
    double value = requireNumber(args, 0, "number.round");
    int decimals = fractionDigits(args, 1, 0, "number.round");
    return numberValue(roundTo(value, decimals));
}

HostValue ceil(const HelperArgs &args) {
    return numberValue(std::ceil(requireNumber(args, 0, "number.ceil")));
}

HostValue floor(const HelperArgs &args) {
    return numberValue(std::floor(requireNumber(args, 0, "number.floor")));
}

HostValue abs(const HelperArgs &args) {
    return numberValue(std::fabs(requireNumber(args, 0, "number.abs")));
}

HostValue clamp(const HelperArgs &args) {
    double value = requireNumber(args, 0, "number.clamp");
    double low = requireNumber(args, 1, "number.clamp");
    double high = requireNumber(args, 2, "number.clamp");
    return numberValue(std::max(low, std::min(high, value)));
}

HostValue currency(const HelperArgs &args) {
    double value = requireNumber(args, 0, "number.currency");
    std::string code = isMissing(args, 1) ? std::string("USD") : requireString(args, 1, "number.currency");
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isalpha(c); })) {
        throw HelperError("number.currency: invalid currency code '" + code + "'");
    }
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = currencyFormats().find(code);
    int decimals = it != currencyFormats().end() ? it->second.decimals : 2;
    std::string prefix = it != currencyFormats().end() ? std::string(it->second.symbol) : code + " ";

    std::string amount = groupThousands(toFixed(std::fabs(value), decimals));
    bool negative = value < 0 && roundTo(std::fabs(value), decimals) != 0;
    return (negative ? "-" : "") + prefix + amount;
}

HostValue percent(const HelperArgs &args) {
    double value = requireNumber(args, 0, "number.percent");
    int decimals = fractionDigits(args, 1, 2, "number.percent");
    return toFixed(value * 100.0, decimals) + "%";
}

// === math ===

std::mt19937_64 &randomEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::vector<double> requireNumbers(const HelperArgs &args, const char *helper) {
    const HostValue &items = requireArray(args, 0, helper);
    std::vector<double> numbers;
    numbers.reserve(items.size());
    for (const auto &item : items) {
        if (!item.is_number()) {
            throw HelperError(std::string(helper) + ": array elements must be numbers");
        }
        numbers.push_back(item.get<double>());
    }
    return numbers;
}

HostValue random(const HelperArgs &args) {
    double low = optionalNumber(args, 0, 0.0, "math.random");
    double high = optionalNumber(args, 1, 1.0, "math.random");
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(randomEngine()) * (high - low) + low;
}

HostValue randomInt(const HelperArgs &args) {
    double low = requireNumber(args, 0, "math.randomInt");
    double high = requireNumber(args, 1, "math.randomInt");
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return numberValue(std::floor(distribution(randomEngine()) * (high - low + 1)) + low);
}

HostValue sum(const HelperArgs &args) {
    double total = 0;
    for (double number : requireNumbers(args, "math.sum")) {
        total += number;
    }
    return numberValue(total);
}

HostValue avg(const HelperArgs &args) {
    std::vector<double> numbers = requireNumbers(args, "math.avg");
    if (numbers.empty()) {
        return 0;
    }
    double total = 0;
    for (double number : numbers) {
        total += number;
    }
    return numberValue(total / static_cast<double>(numbers.size()));
}

HostValue min(const HelperArgs &args) {
    std::vector<double> numbers = requireNumbers(args, "math.min");
    if (numbers.empty()) {
        return nullptr;
    }
    return numberValue(*std::min_element(numbers.begin(), numbers.end()));
}

HostValue max(const HelperArgs &args) {
    std::vector<double> numbers = requireNumbers(args, "math.max");
    if (numbers.empty()) {
        return nullptr;
    }
    return numberValue(*std::max_element(numbers.begin(), numbers.end()));
}

}  // namespace

void registerNumberHelpers(std::vector<HelperDescriptor> &out) {
    out.push_back({HelperNamespace::Number, "round", 2, round});
    out.push_back({HelperNamespace::Number, "ceil", 1, ceil});
    out.push_back({HelperNamespace::Number, "floor", 1, floor});
    out.push_back({HelperNamespace::Number, "abs", 1, abs});
    out.push_back({HelperNamespace::Number, "clamp", 3, clamp});
    out.push_back({HelperNamespace::Number, "currency", 2, currency});
    out.push_back({HelperNamespace::Number, "formatCurrency", 2, currency});
    out.push_back({HelperNamespace::Number, "percent", 2, percent});
}

void registerMathHelpers(std::vector<HelperDescriptor> &out) {
    out.push_back({HelperNamespace::Math, "random", 2, random});
    out.push_back({HelperNamespace::Math, "randomInt", 2, randomInt});
    out.push_back({HelperNamespace::Math, "sum", 1, sum});
    out.push_back({HelperNamespace::Math, "avg", 1, avg});
    out.push_back({HelperNamespace::Math, "min", 1, min});
    out.push_back({HelperNamespace::Math, "max", 1, max});
}

}  // namespace SBX
