// ==============================================================================
// usage.cpp - Модель ответа GetUserStatus и отчёт
// ==============================================================================

#include "quotaprobe/usage.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <locale>
#include <rapidjson/document.h>
#include <sstream>

namespace quotaprobe::usage {

namespace {

constexpr const char* REPORT_TITLE = "Antigravity quota usage";
constexpr const char* REPORT_RULE = "----------------------------------------";
constexpr const char* NOT_AVAILABLE = "N/A";

// ----------------------------------------------------------------------------
// Доступ к полям JSON
// ----------------------------------------------------------------------------

const rapidjson::Value* member_object(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsObject()) {
        return nullptr;
    }
    return &it->value;
}

/// Непустая строка или nullopt
std::optional<std::string> member_string(const rapidjson::Value* obj, const char* key) {
    if (obj == nullptr || !obj->IsObject()) {
        return std::nullopt;
    }
    auto it = obj->FindMember(key);
    if (it == obj->MemberEnd() || !it->value.IsString() || it->value.GetStringLength() == 0) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<double> member_number(const rapidjson::Value* obj, const char* key) {
    if (obj == nullptr || !obj->IsObject()) {
        return std::nullopt;
    }
    auto it = obj->FindMember(key);
    if (it == obj->MemberEnd() || !it->value.IsNumber()) {
        return std::nullopt;
    }
    double value = it->value.GetDouble();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

ModelQuota parse_model(const rapidjson::Value& item) {
    ModelQuota model;
    if (!item.IsObject()) {
        return model;
    }
    model.label = member_string(&item, "label");
    model.model_id = member_string(member_object(item, "modelOrAlias"), "model");
    const rapidjson::Value* quota = member_object(item, "quotaInfo");
    model.remaining_fraction = member_number(quota, "remainingFraction");
    model.reset_time = member_string(quota, "resetTime");
    return model;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// ----------------------------------------------------------------------------
// Дата/время
// ----------------------------------------------------------------------------

/// Прочитать ровно count цифр
bool read_digits(std::string_view text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Дни от 1970-01-01 (алгоритм days_from_civil, H. Hinnant)
long long days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2) / 5 +
                         static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Модель
// ----------------------------------------------------------------------------

std::string ModelQuota::display_label() const {
    if (label) {
        return *label;
    }
    if (model_id) {
        return *model_id;
    }
    return {};
}

UsageStatus parse_usage_status(const rapidjson::Value& root) {
    UsageStatus status;

    const rapidjson::Value* user = member_object(root, "userStatus");
    if (user == nullptr) {
        return status;
    }

    UserStatus parsed;
    parsed.email = member_string(user, "email");

    const rapidjson::Value* plan_status = member_object(*user, "planStatus");
    if (plan_status != nullptr) {
        parsed.monthly_credits =
            member_number(member_object(*plan_status, "planInfo"), "monthlyPromptCredits");
        parsed.available_credits = member_number(plan_status, "availablePromptCredits");
    }

    const rapidjson::Value* config_data = member_object(*user, "cascadeModelConfigData");
    if (config_data != nullptr) {
        auto it = config_data->FindMember("clientModelConfigs");
        if (it != config_data->MemberEnd() && it->value.IsArray()) {
            std::vector<ModelQuota> models;
            for (const auto& item : it->value.GetArray()) {
                models.push_back(parse_model(item));
            }
            parsed.models = std::move(models);
        }
    }

    status.user = std::move(parsed);
    return status;
}

std::optional<UsageStatus> parse_usage_body(std::string_view body) {
    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        return std::nullopt;
    }
    return parse_usage_status(doc);
}

// ----------------------------------------------------------------------------
// Расчёты
// ----------------------------------------------------------------------------

double round_half_up(double value) {
    return std::floor(value + 0.5);
}

std::optional<CreditUsage> compute_credit_usage(std::optional<double> monthly,
                                                std::optional<double> available) {
    if (!monthly || !available || !std::isfinite(*monthly) || !std::isfinite(*available)) {
        return std::nullopt;
    }
    CreditUsage usage;
    usage.monthly = *monthly;
    usage.used = *monthly - *available;
    usage.percentage = *monthly > 0 ? round_half_up(usage.used / *monthly * 100.0) : 0;
    return usage;
}

bool is_hidden_model(std::string_view label) {
    std::string normalized = to_lower(label);
    return normalized.find("autocomplete") != std::string::npos ||
           normalized.find("embedding") != std::string::npos;
}

std::vector<ModelQuota> visible_models(const std::vector<ModelQuota>& models) {
    std::vector<ModelQuota> result;
    std::copy_if(models.begin(), models.end(), std::back_inserter(result),
                 [](const ModelQuota& m) { return !is_hidden_model(m.display_label()); });
    return result;
}

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_number(double value) {
    if (value == 0) {
        return "0";
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e21) {
        oss << std::fixed << std::setprecision(0) << value;
        return oss.str();
    }
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::string format_remaining(std::optional<double> fraction) {
    if (!fraction || !std::isfinite(*fraction)) {
        return NOT_AVAILABLE;
    }
    return format_number(round_half_up(*fraction * 100.0)) + "%";
}

std::optional<std::time_t> parse_rfc3339(std::string_view text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    // Дробная часть секунд отбрасывается
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
    }

    // Без смещения время считается локальным
    long long offset_seconds = 0;
    bool local_time = pos >= text.size();
    if (!local_time) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos, 2, off_h) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
                return std::nullopt;
            }
            offset_seconds = sign * (off_h * 3600LL + off_m * 60LL);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    if (local_time) {
        std::tm tm_local{};
        tm_local.tm_year = year - 1900;
        tm_local.tm_mon = month - 1;
        tm_local.tm_mday = day;
        tm_local.tm_hour = hour;
        tm_local.tm_min = minute;
        tm_local.tm_sec = second;
        tm_local.tm_isdst = -1;
        std::time_t t = std::mktime(&tm_local);
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return t;
    }

    long long seconds = days_from_civil(year, month, day) * 86400LL + hour * 3600LL +
                        minute * 60LL + second - offset_seconds;
    return static_cast<std::time_t>(seconds);
}

std::string format_reset_time(const std::optional<std::string>& reset_time) {
    if (!reset_time || reset_time->empty()) {
        return NOT_AVAILABLE;
    }
    auto parsed = parse_rfc3339(*reset_time);
    if (!parsed) {
        return NOT_AVAILABLE;
    }

    std::tm tm_local{};
#ifdef _WIN32
    if (localtime_s(&tm_local, &*parsed) != 0) {
        return NOT_AVAILABLE;
    }
#else
    if (localtime_r(&*parsed, &tm_local) == nullptr) {
        return NOT_AVAILABLE;
    }
#endif

    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), "%c", &tm_local);
    if (n == 0) {
        return NOT_AVAILABLE;
    }
    return std::string(buf, n);
}

std::string render_report(const UsageStatus& status) {
    if (!status.user) {
        return "No user status returned.\n";
    }
    const UserStatus& user = *status.user;

    std::ostringstream out;
    out << REPORT_TITLE << "\n";
    out << REPORT_RULE << "\n";
    out << "User: " << user.email.value_or("Unknown") << "\n";

    if (auto credits = compute_credit_usage(user.monthly_credits, user.available_credits)) {
        out << "Credits: " << format_number(credits->used) << " / "
            << format_number(credits->monthly) << " used (" << format_number(credits->percentage)
            << "%)\n";
    }

    if (!user.models) {
        return out.str();
    }

    std::vector<ModelQuota> models = visible_models(*user.models);
    if (models.empty()) {
        return out.str();
    }

    out << "\nModel quotas:\n";
    for (const auto& model : models) {
        std::string label = model.display_label();
        if (label.empty()) {
            label = "Unknown";
        }
        out << "- " << label << ": remaining " << format_remaining(model.remaining_fraction)
            << ", resets " << format_reset_time(model.reset_time) << "\n";
    }
    return out.str();
}

}  // namespace quotaprobe::usage
