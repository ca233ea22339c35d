#include "errors.h"

namespace rec {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidQuery: return "invalid_query";
    case ErrorCode::kEmbeddingUnavailable: return "embedding_unavailable";
    case ErrorCode::kRerankUnavailable: return "rerank_unavailable";
    case ErrorCode::kIndexNotReady: return "not_ready";
    case ErrorCode::kInternalInconsistency: return "internal_inconsistency";
    case ErrorCode::kCancelled: return "cancelled";
  }
  return "unknown";
}

} // namespace rec
