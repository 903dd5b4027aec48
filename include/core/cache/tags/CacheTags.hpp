#pragma once

#include <string>

namespace clinic {
namespace core {
namespace cache {
namespace tags {

// Теги списков
constexpr const char* SCREENING_TYPES = "screening_types";
constexpr const char* ACTIVE_SCREENING_TYPES = "active_screening_types";
constexpr const char* ALL_SCREENING_TYPES = "all_screening_types";
constexpr const char* DOCUMENT_TYPES = "document_types";
constexpr const char* PATIENT_DEMOGRAPHICS = "patient_demographics";

// Теги сущностей
inline std::string patient(const std::string& id) { return "patient_" + id; }
inline std::string screeningType(const std::string& id) { return "screening_type_" + id; }
inline std::string medicalData(const std::string& dataType) { return "medical_data_" + dataType; }

} // namespace tags
} // namespace cache
} // namespace core
} // namespace clinic
