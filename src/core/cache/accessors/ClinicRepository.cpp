#include "core/cache/accessors/ClinicRepository.hpp"

namespace clinic {
namespace core {
namespace cache {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

nlohmann::json ScreeningTypeRecord::toJson() const {
    return {
        {"id", id},
        {"name", name},
        {"is_active", isActive},
        {"description", description},
        {"default_frequency", defaultFrequency},
        {"frequency_number", optionalToJson(frequencyNumber)},
        {"frequency_unit", optionalToJson(frequencyUnit)},
        {"keywords", keywords},
        {"trigger_conditions", triggerConditions},
        {"min_age", optionalToJson(minAge)},
        {"max_age", optionalToJson(maxAge)},
        {"gender_specific", optionalToJson(genderSpecific)},
        {"document_types", documentTypes},
        {"filename_keywords", filenameKeywords},
        {"content_keywords", contentKeywords}
    };
}

ScreeningTypeRecord ScreeningTypeRecord::fromJson(const nlohmann::json& j) {
    ScreeningTypeRecord record;
    record.id = j.at("id").get<int64_t>();
    record.name = j.at("name").get<std::string>();
    record.isActive = j.value("is_active", true);
    record.description = j.value("description", "");
    record.defaultFrequency = j.value("default_frequency", "");
    record.frequencyNumber = optionalFromJson<int>(j, "frequency_number");
    record.frequencyUnit = optionalFromJson<std::string>(j, "frequency_unit");
    record.keywords = j.value("keywords", "");
    record.triggerConditions = j.value("trigger_conditions", "");
    record.minAge = optionalFromJson<int>(j, "min_age");
    record.maxAge = optionalFromJson<int>(j, "max_age");
    record.genderSpecific = optionalFromJson<std::string>(j, "gender_specific");
    record.documentTypes = j.value("document_types", "");
    record.filenameKeywords = j.value("filename_keywords", "");
    record.contentKeywords = j.value("content_keywords", "");
    return record;
}

nlohmann::json PatientDemographics::toJson() const {
    return {
        {"id", id},
        {"age", optionalToJson(age)},
        {"sex", sex},
        {"date_of_birth", optionalToJson(dateOfBirth)},
        {"conditions", conditions}
    };
}

PatientDemographics PatientDemographics::fromJson(const nlohmann::json& j) {
    PatientDemographics demo;
    demo.id = j.at("id").get<int64_t>();
    demo.age = optionalFromJson<int>(j, "age");
    demo.sex = j.value("sex", "");
    demo.dateOfBirth = optionalFromJson<std::string>(j, "date_of_birth");
    demo.conditions = j.value("conditions", std::vector<std::string>{});
    return demo;
}

} // namespace cache
} // namespace core
} // namespace clinic
