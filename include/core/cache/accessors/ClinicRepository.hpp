#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace clinic {
namespace core {
namespace cache {

// ScreeningTypeRecord: тип скрининга в виде, пригодном для кэширования
struct ScreeningTypeRecord {
    int64_t id = 0;
    std::string name;
    bool isActive = true;
    std::string description;
    std::string defaultFrequency;
    std::optional<int> frequencyNumber;
    std::optional<std::string> frequencyUnit;
    std::string keywords;
    std::string triggerConditions;
    std::optional<int> minAge;
    std::optional<int> maxAge;
    std::optional<std::string> genderSpecific;
    std::string documentTypes;
    std::string filenameKeywords;
    std::string contentKeywords;

    nlohmann::json toJson() const;
    static ScreeningTypeRecord fromJson(const nlohmann::json& j); // Бросает nlohmann::json::exception
};

// PatientDemographics: демография пациента для проверки применимости скринингов
struct PatientDemographics {
    int64_t id = 0;
    std::optional<int> age;
    std::string sex;
    std::optional<std::string> dateOfBirth; // ISO-8601
    std::vector<std::string> conditions;

    nlohmann::json toJson() const;
    static PatientDemographics fromJson(const nlohmann::json& j); // Бросает nlohmann::json::exception
};

/**
 * @brief Источник истины для кэшируемых справочников клиники.
 *
 * Реализация обращается к основной базе данных. Ошибки доступа
 * сообщаются исключениями.
 */
class ClinicRepository {
public:
    virtual ~ClinicRepository() = default;
    /// Типы скринингов, упорядоченные по имени.
    virtual std::vector<ScreeningTypeRecord> screeningTypes(bool activeOnly) = 0;
    /// Демография пациента; nullopt, если пациент не найден.
    virtual std::optional<PatientDemographics> findPatientDemographics(int64_t patientId) = 0;
    /// Уникальные непустые типы документов.
    virtual std::vector<std::string> distinctDocumentTypes() = 0;
};

} // namespace cache
} // namespace core
} // namespace clinic
