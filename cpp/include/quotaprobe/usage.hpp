// ==============================================================================
// quotaprobe/usage.hpp - Модель ответа GetUserStatus и отчёт
// ==============================================================================
//
// Назначение:
// - UsageStatus: выборка нужных полей из JSON-ответа (все поля опциональны)
// - Расчёт израсходованных кредитов и процента
// - Фильтр моделей (autocomplete / embedding не показываются)
// - Разбор RFC 3339 и вывод времени сброса в локальном формате
// - render_report(): текст отчёта, чистая функция от UsageStatus
//
// Схема ответа:
//   userStatus.email
//   userStatus.planStatus.planInfo.monthlyPromptCredits
//   userStatus.planStatus.availablePromptCredits
//   userStatus.cascadeModelConfigData.clientModelConfigs[]
//       .label, .modelOrAlias.model, .quotaInfo.remainingFraction, .quotaInfo.resetTime
//
// ==============================================================================

#ifndef QUOTAPROBE_USAGE_HPP
#define QUOTAPROBE_USAGE_HPP

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace quotaprobe::usage {

// ----------------------------------------------------------------------------
// Модель
// ----------------------------------------------------------------------------

struct ModelQuota {
    std::optional<std::string> label;
    std::optional<std::string> model_id;  // modelOrAlias.model
    std::optional<double> remaining_fraction;
    std::optional<std::string> reset_time;

    /// label, иначе model_id, иначе пустая строка
    std::string display_label() const;
};

struct UserStatus {
    std::optional<std::string> email;
    std::optional<double> monthly_credits;
    std::optional<double> available_credits;
    /// nullopt если clientModelConfigs отсутствует или не массив
    std::optional<std::vector<ModelQuota>> models;
};

struct UsageStatus {
    /// nullopt если в ответе нет объекта userStatus
    std::optional<UserStatus> user;
};

/// Выбрать поля из корня ответа. Неожиданные типы трактуются как отсутствие.
UsageStatus parse_usage_status(const rapidjson::Value& root);

/// Разобрать тело ответа. nullopt если это не JSON.
std::optional<UsageStatus> parse_usage_body(std::string_view body);

// ----------------------------------------------------------------------------
// Расчёты
// ----------------------------------------------------------------------------

struct CreditUsage {
    double used = 0;
    double monthly = 0;
    double percentage = 0;  // уже округлён
};

/// used = monthly - available; percentage = round(used / monthly * 100),
/// 0 при monthly == 0. nullopt если одно из значений отсутствует.
std::optional<CreditUsage> compute_credit_usage(std::optional<double> monthly,
                                                std::optional<double> available);

/// Округление до ближайшего целого, .5 вверх (floor(x + 0.5)), в double
double round_half_up(double value);

/// Модель скрывается, если в её подписи есть "autocomplete" или "embedding"
bool is_hidden_model(std::string_view label);

/// Модели без скрытых, в исходном порядке
std::vector<ModelQuota> visible_models(const std::vector<ModelQuota>& models);

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

/// Целые до 1e21 - все цифры без дробной части, прочие - до 15 значащих цифр
std::string format_number(double value);

/// "83%" или "N/A"
std::string format_remaining(std::optional<double> fraction);

/// RFC 3339 -> UTC time_t: "2025-11-20T10:00:00Z", "...00.123Z", "...00+03:00"
/// Без смещения ("2025-11-20T10:00:00") время считается локальным
std::optional<std::time_t> parse_rfc3339(std::string_view text);

/// Локальное время в формате %c текущей локали LC_TIME или "N/A"
std::string format_reset_time(const std::optional<std::string>& reset_time);

/// Текст отчёта (с завершающим переводом строки)
std::string render_report(const UsageStatus& status);

}  // namespace quotaprobe::usage

#endif  // QUOTAPROBE_USAGE_HPP
