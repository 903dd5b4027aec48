#pragma once

namespace clinic {
namespace core {
namespace cache {
namespace triggers {

constexpr const char* SCREENING_TYPE_KEYWORD_CHANGE = "screening_type_keyword_change";
constexpr const char* SCREENING_TYPE_STATUS_CHANGE = "screening_type_status_change";
constexpr const char* DOCUMENT_TYPE_CHANGE = "document_type_change";
constexpr const char* PATIENT_DEMOGRAPHIC_CHANGE = "patient_demographic_change";
constexpr const char* MEDICAL_DATA_SUBSECTION_UPDATE = "medical_data_subsection_update";
constexpr const char* BATCH_OPERATION_START = "batch_operation_start";
constexpr const char* BATCH_OPERATION_END = "batch_operation_end";

} // namespace triggers
} // namespace cache
} // namespace core
} // namespace clinic
