#include "helpers/HelperArguments.h"
#include "helpers/HelperLibrary.h"
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <format>
#include <optional>

namespace SBX {

using namespace HelperArguments;

// Dates travel as ISO-8601 strings and are interpreted in UTC. Every date helper is
// total: unparseable input, unknown units and bad amounts yield "Invalid Date" (or 0
// for diff) instead of an error.

namespace {

using namespace std::chrono;
using TimePoint = sys_time<milliseconds>;

constexpr const char *INVALID_DATE = "Invalid Date";

constexpr std::array<const char *, 12> MONTH_NAMES = {"January", "February", "March",     "April",   "May",      "June",
                                                      "July",    "August",   "September", "October", "November", "December"};
constexpr std::array<const char *, 7> WEEKDAY_NAMES = {"Sunday",   "Monday", "Tuesday", "Wednesday",
                                                       "Thursday", "Friday", "Saturday"};

enum class DateUnit { Seconds, Minutes, Hours, Days, Months, Years };

std::optional<DateUnit> parseUnit(const HostValue &value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    const auto &name = value.get_ref<const std::string &>();
    if (name == "seconds") {
        return DateUnit::Seconds;
    } else if (name == "minutes") {
        return DateUnit::Minutes;
    } else if (name == "hours") {
        return DateUnit::Hours;
    } else if (name == "days") {
        return DateUnit::Days;
    } else if (name == "months") {
        return DateUnit::Months;
    } else if (name == "years") {
        return DateUnit::Years;
    }
    return std::nullopt;
}

// === ISO-8601 parsing ===

class Scanner {
public:
    explicit Scanner(const std::string &text) : text_(text) {}

    bool atEnd() const {
        return pos_ >= text_.size();
    }

    char peek() const {
        return atEnd() ? '\0' : text_[pos_];
    }

    bool consume(char c) {
        if (peek() == c) {
            pos_++;
            return true;
        }
        return false;
    }

    // Exactly count digits
    std::optional<int> digits(size_t count) {
        if (pos_ + count > text_.size()) {
            return std::nullopt;
        }
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return value;
    }

    // Between minCount and maxCount digits, greedy
    std::optional<int> digitsUpTo(size_t minCount, size_t maxCount) {
        size_t count = 0;
        while (count < maxCount && pos_ + count < text_.size() &&
               std::isdigit(static_cast<unsigned char>(text_[pos_ + count]))) {
            count++;
        }
        if (count < minCount) {
            return std::nullopt;
        }
        return digits(count);
    }

    size_t position() const {
        return pos_;
    }

private:
    const std::string &text_;
    size_t pos_ = 0;
};

std::optional<TimePoint> makeTimePoint(int y, int mo, int d, int h, int mi, int s, int ms) {
    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }
    return TimePoint{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s} + milliseconds{ms};
}

std::optional<TimePoint> parseIso(const std::string &text) {
    Scanner in(text);
    auto y = in.digits(4);
    if (!y) {
        return std::nullopt;
    }
    int mo = 1;
    int d = 1;
    int h = 0;
    int mi = 0;
    int s = 0;
    int ms = 0;

    if (in.consume('-')) {
        auto month = in.digits(2);
        if (!month) {
            return std::nullopt;
        }
        mo = *month;
        if (in.consume('-')) {
            auto dayOfMonth = in.digits(2);
            if (!dayOfMonth) {
                return std::nullopt;
            }
            d = *dayOfMonth;
        }
    }

    if (in.consume('T') || in.consume(' ')) {
        auto hour = in.digits(2);
        if (!hour || !in.consume(':')) {
            return std::nullopt;
        }
        auto minute = in.digits(2);
        if (!minute) {
            return std::nullopt;
        }
        h = *hour;
        mi = *minute;
        if (in.consume(':')) {
            auto second = in.digits(2);
            if (!second) {
                return std::nullopt;
            }
            s = *second;
            if (in.consume('.') || in.consume(',')) {
                size_t start = in.position();
                auto fraction = in.digitsUpTo(1, 9);
                if (!fraction) {
                    return std::nullopt;
                }
                size_t count = in.position() - start;
                double scaled = *fraction / std::pow(10.0, static_cast<double>(count)) * 1000.0;
                ms = static_cast<int>(std::floor(scaled));
            }
        }
    }

    int offsetMinutes = 0;
    if (in.consume('Z') || in.consume('z')) {
        // UTC
    } else if (in.peek() == '+' || in.peek() == '-') {
        int sign = in.peek() == '-' ? -1 : 1;
        in.consume(in.peek());
        auto offsetHours = in.digits(2);
        if (!offsetHours) {
            return std::nullopt;
        }
        int offsetMins = 0;
        if (in.consume(':')) {
            auto m = in.digits(2);
            if (!m) {
                return std::nullopt;
            }
            offsetMins = *m;
        } else if (!in.atEnd()) {
            auto m = in.digits(2);
            if (!m) {
                return std::nullopt;
            }
            offsetMins = *m;
        }
        offsetMinutes = sign * (*offsetHours * 60 + offsetMins);
    }

    if (!in.atEnd()) {
        return std::nullopt;
    }

    auto local = makeTimePoint(*y, mo, d, h, mi, s, ms);
    if (!local) {
        return std::nullopt;
    }
    return *local - minutes{offsetMinutes};
}

std::optional<TimePoint> parseDateArgument(const HelperArgs &args, size_t index) {
    const HostValue &value = at(args, index);
    if (!value.is_string()) {
        return std::nullopt;
    }
    return parseIso(value.get_ref<const std::string &>());
}

struct Fields {
    year_month_day ymd;
    weekday wd;
    hh_mm_ss<milliseconds> time;
};

Fields fieldsOf(TimePoint tp) {
    sys_days dayPoint = floor<days>(tp);
    return Fields{year_month_day{dayPoint}, weekday{dayPoint}, hh_mm_ss<milliseconds>{tp - dayPoint}};
}

std::string formatIso(TimePoint tp) {
    Fields f = fieldsOf(tp);
    int y = static_cast<int>(f.ymd.year());
    std::string yearText = (y >= 0 && y <= 9999) ? std::format("{:04d}", y) : std::format("{:+07d}", y);
    return std::format("{}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", yearText, static_cast<unsigned>(f.ymd.month()),
                       static_cast<unsigned>(f.ymd.day()), f.time.hours().count(), f.time.minutes().count(),
                       f.time.seconds().count(), f.time.subseconds().count());
}

// === Arithmetic ===

// Instants whose calendar year std::chrono can represent; results outside are Invalid Date
constexpr TimePoint EARLIEST = TimePoint{sys_days{year::min() / January / 1}};
constexpr TimePoint LATEST = TimePoint{sys_days{year::max() / December / 31}} + days{1} - milliseconds{1};

double millisOf(TimePoint tp) {
    return static_cast<double>(tp.time_since_epoch().count());
}

std::optional<TimePoint> offsetBy(TimePoint tp, double deltaMs) {
    double target = millisOf(tp) + deltaMs;
    if (!std::isfinite(target) || target < millisOf(EARLIEST) || target > millisOf(LATEST)) {
        return std::nullopt;
    }
    return TimePoint{milliseconds{static_cast<int64_t>(target)}};
}

std::optional<TimePoint> addCalendarMonths(TimePoint tp, double amount) {
    sys_days dayPoint = floor<days>(tp);
    milliseconds timeOfDay = tp - dayPoint;
    year_month_day ymd{dayPoint};

    double monthIndex =
        static_cast<int>(ymd.year()) * 12.0 + static_cast<double>(static_cast<unsigned>(ymd.month()) - 1) + amount;
    double targetYear = std::floor(monthIndex / 12);
    if (!std::isfinite(targetYear) || targetYear < static_cast<int>(year::min()) ||
        targetYear > static_cast<int>(year::max())) {
        return std::nullopt;
    }
    auto monthOfYear = static_cast<unsigned>(monthIndex - targetYear * 12) + 1;

    year_month_day shifted{year{static_cast<int>(targetYear)}, month{monthOfYear}, ymd.day()};
    if (!shifted.ok()) {
        // Clamp to the last day, e.g. Jan 31 + 1 month = Feb 28/29
        shifted = year_month_day{year_month_day_last{shifted.year(), month_day_last{shifted.month()}}};
    }
    return TimePoint{sys_days{shifted}} + timeOfDay;
}

std::optional<TimePoint> shift(TimePoint tp, double amount, DateUnit unit) {
    switch (unit) {
    case DateUnit::Seconds:
        return offsetBy(tp, amount * 1000.0);
    case DateUnit::Minutes:
        return offsetBy(tp, amount * 60'000.0);
    case DateUnit::Hours:
        return offsetBy(tp, amount * 3'600'000.0);
    case DateUnit::Days:
        return offsetBy(tp, amount * 86'400'000.0);
    case DateUnit::Months:
        return addCalendarMonths(tp, amount);
    case DateUnit::Years:
        return addCalendarMonths(tp, amount * 12);
    }
    return std::nullopt;
}

int64_t calendarMonthsBetween(TimePoint from, TimePoint to) {
    if (from == to) {
        return 0;
    }
    year_month_day a{floor<days>(from)};
    year_month_day b{floor<days>(to)};
    int64_t monthsBetween = (static_cast<int>(b.year()) - static_cast<int>(a.year())) * 12 +
                            (static_cast<int>(static_cast<unsigned>(b.month())) -
                             static_cast<int>(static_cast<unsigned>(a.month())));

    // Only count complete months
    auto candidate = addCalendarMonths(from, static_cast<double>(monthsBetween));
    if (!candidate) {
        return monthsBetween;
    }
    if (to > from && *candidate > to) {
        monthsBetween--;
    } else if (to < from && *candidate < to) {
        monthsBetween++;
    }
    return monthsBetween;
}

int64_t difference(TimePoint from, TimePoint to, DateUnit unit) {
    milliseconds delta = to - from;
    switch (unit) {
    case DateUnit::Seconds:
        return duration_cast<seconds>(delta).count();
    case DateUnit::Minutes:
        return duration_cast<minutes>(delta).count();
    case DateUnit::Hours:
        return duration_cast<hours>(delta).count();
    case DateUnit::Days:
        return duration_cast<days>(delta).count();
    case DateUnit::Months:
        return calendarMonthsBetween(from, to);
    case DateUnit::Years:
        return calendarMonthsBetween(from, to) / 12;
    }
    return 0;
}

// === Pattern formatting (date-fns token subset) ===

std::string padded(int64_t value, size_t width) {
    std::string digitsText = std::to_string(value < 0 ? -value : value);
    if (digitsText.size() < width) {
        digitsText.insert(0, width - digitsText.size(), '0');
    }
    return value < 0 ? "-" + digitsText : digitsText;
}

std::optional<std::string> formatToken(char letter, size_t count, const Fields &f) {
    int y = static_cast<int>(f.ymd.year());
    unsigned mo = static_cast<unsigned>(f.ymd.month());
    unsigned d = static_cast<unsigned>(f.ymd.day());
    int64_t h = f.time.hours().count();
    int64_t mi = f.time.minutes().count();
    int64_t s = f.time.seconds().count();
    int64_t ms = f.time.subseconds().count();

    switch (letter) {
    case 'y':
        if (count == 2) {
            return padded(y % 100, 2);
        }
        return padded(y, count);
    case 'M':
        if (count <= 2) {
            return padded(mo, count);
        } else if (count == 3) {
            return std::string(MONTH_NAMES[mo - 1]).substr(0, 3);
        } else if (count == 4) {
            return std::string(MONTH_NAMES[mo - 1]);
        }
        return std::string(1, MONTH_NAMES[mo - 1][0]);
    case 'd':
        if (count <= 2) {
            return padded(d, count);
        }
        return std::nullopt;
    case 'E': {
        const char *name = WEEKDAY_NAMES[f.wd.c_encoding()];
        if (count <= 3) {
            return std::string(name).substr(0, 3);
        } else if (count == 4) {
            return std::string(name);
        }
        return std::string(1, name[0]);
    }
    case 'H':
        return count <= 2 ? std::optional<std::string>(padded(h, count)) : std::nullopt;
    case 'h': {
        int64_t twelve = h % 12 == 0 ? 12 : h % 12;
        return count <= 2 ? std::optional<std::string>(padded(twelve, count)) : std::nullopt;
    }
    case 'm':
        return count <= 2 ? std::optional<std::string>(padded(mi, count)) : std::nullopt;
    case 's':
        return count <= 2 ? std::optional<std::string>(padded(s, count)) : std::nullopt;
    case 'S': {
        std::string fraction = padded(ms, 3);
        if (count <= 3) {
            return fraction.substr(0, count);
        }
        return fraction + std::string(count - 3, '0');
    }
    case 'a':
        return std::string(h < 12 ? "AM" : "PM");
    default:
        return std::nullopt;
    }
}

std::optional<std::string> formatPattern(TimePoint tp, const std::string &pattern) {
    Fields f = fieldsOf(tp);
    std::string out;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '\'') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '\'') {
                out += '\'';
                i += 2;
                continue;
            }
            size_t close = i + 1;
            while (close < pattern.size()) {
                if (pattern[close] == '\'' && close + 1 < pattern.size() && pattern[close + 1] == '\'') {
                    out += '\'';
                    close += 2;
                    continue;
                }
                if (pattern[close] == '\'') {
                    break;
                }
                out += pattern[close++];
            }
            i = close + 1;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            size_t count = 1;
            while (i + count < pattern.size() && pattern[i + count] == c) {
                count++;
            }
            auto token = formatToken(c, count, f);
            if (!token) {
                return std::nullopt;
            }
            out += *token;
            i += count;
            continue;
        }
        out += c;
        i++;
    }
    return out;
}

// === Pattern parsing ===

std::optional<TimePoint> parsePattern(const std::string &text, const std::string &pattern) {
    Scanner in(text);
    int y = 2000;
    int mo = 1;
    int d = 1;

    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '\'') {
            size_t close = pattern.find('\'', i + 1);
            std::string literal = pattern.substr(i + 1, close == std::string::npos ? std::string::npos : close - i - 1);
            for (char lc : literal) {
                if (!in.consume(lc)) {
                    return std::nullopt;
                }
            }
            i = close == std::string::npos ? pattern.size() : close + 1;
            continue;
        }
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            if (!in.consume(c)) {
                return std::nullopt;
            }
            i++;
            continue;
        }

        size_t count = 1;
        while (i + count < pattern.size() && pattern[i + count] == c) {
            count++;
        }
        std::optional<int> value;
        switch (c) {
        case 'y':
            value = count == 2 ? in.digits(2) : in.digitsUpTo(1, 4);
            if (value && count == 2) {
                *value += 2000;
            }
            if (value) {
                y = *value;
            }
            break;
        case 'M':
            value = count == 2 ? in.digits(2) : in.digitsUpTo(1, 2);
            if (value) {
                mo = *value;
            }
            break;
        case 'd':
            value = count == 2 ? in.digits(2) : in.digitsUpTo(1, 2);
            if (value) {
                d = *value;
            }
            break;
        case 'H':
        case 'h':
        case 'm':
        case 's':
            // Time of day is accepted but the result is the calendar date at midnight UTC
            value = count == 2 ? in.digits(2) : in.digitsUpTo(1, 2);
            break;
        default:
            return std::nullopt;
        }
        if (!value) {
            return std::nullopt;
        }
        i += count;
    }

    if (!in.atEnd() || mo < 1 || mo > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }
    return makeTimePoint(y, mo, d, 0, 0, 0, 0);
}

// === Helpers ===

HostValue now(const HelperArgs &) {
    return formatIso(floor<milliseconds>(system_clock::now()));
}

std::optional<double> amountArgument(const HelperArgs &args, size_t index) {
    const HostValue &value = at(args, index);
    if (!value.is_number() || !std::isfinite(value.get<double>())) {
        return std::nullopt;
    }
    return std::trunc(value.get<double>());
}

HostValue shiftHelper(const HelperArgs &args, double direction) {
    auto tp = parseDateArgument(args, 0);
    auto amount = amountArgument(args, 1);
    auto unit = parseUnit(at(args, 2));
    if (!tp || !amount || !unit) {
        return INVALID_DATE;
    }
    auto shifted = shift(*tp, direction * *amount, *unit);
    return shifted ? HostValue(formatIso(*shifted)) : HostValue(INVALID_DATE);
}

HostValue add(const HelperArgs &args) {
    return shiftHelper(args, 1.0);
}

HostValue subtract(const HelperArgs &args) {
    return shiftHelper(args, -1.0);
}

HostValue format(const HelperArgs &args) {
    auto tp = parseDateArgument(args, 0);
    const HostValue &pattern = at(args, 1);
    if (!tp || !pattern.is_string()) {
        return INVALID_DATE;
    }
    auto text = formatPattern(*tp, pattern.get_ref<const std::string &>());
    return text ? HostValue(*text) : HostValue(INVALID_DATE);
}

HostValue parse(const HelperArgs &args) {
    const HostValue &text = at(args, 0);
    if (!text.is_string()) {
        return INVALID_DATE;
    }
    std::optional<TimePoint> tp;
    if (at(args, 1).is_string() && !at(args, 1).get_ref<const std::string &>().empty()) {
        tp = parsePattern(text.get_ref<const std::string &>(), at(args, 1).get_ref<const std::string &>());
    } else {
        tp = parseIso(text.get_ref<const std::string &>());
    }
    return tp ? HostValue(formatIso(*tp)) : HostValue(INVALID_DATE);
}

HostValue diff(const HelperArgs &args) {
    auto from = parseDateArgument(args, 0);
    auto to = parseDateArgument(args, 1);
    auto unit = parseUnit(at(args, 2));
    if (!from || !to || !unit) {
        return 0;
    }
    return difference(*from, *to, *unit);
}

}  // namespace

void registerDateHelpers(std::vector<HelperDescriptor> &out) {
    out.push_back({HelperNamespace::Date, "now", 0, now});
    out.push_back({HelperNamespace::Date, "add", 3, add});
    out.push_back({HelperNamespace::Date, "subtract", 3, subtract});
    out.push_back({HelperNamespace::Date, "format", 2, format});
    out.push_back({HelperNamespace::Date, "parse", 2, parse});
    out.push_back({HelperNamespace::Date, "diff", 3, diff});
}

}  // namespace SBX
