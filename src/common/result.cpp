#include "devchain/common/result.hpp"

namespace devchain::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::ModelUnavailable:
    return "model_unavailable";
  case ErrorCode::DescriptorBuildFailure:
    return "descriptor_build_failure";
  case ErrorCode::StorageFailure:
    return "storage_failure";
  case ErrorCode::CatalogUnavailable:
    return "catalog_unavailable";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace devchain::common
