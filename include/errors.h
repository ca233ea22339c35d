#pragma once

#include <stdexcept>
#include <string>

namespace rec {

enum class ErrorCode {
  kInvalidQuery,
  kEmbeddingUnavailable,
  kRerankUnavailable,
  kIndexNotReady,
  kInternalInconsistency,
  kCancelled,
};

// Stable wire name, e.g. "invalid_query"
const char* errorCodeName(ErrorCode code);

class RecommendError : public std::runtime_error {
public:
  RecommendError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class InvalidQuery : public RecommendError {
public:
  explicit InvalidQuery(const std::string& message)
    : RecommendError(ErrorCode::kInvalidQuery, message) {}
};

class EmbeddingUnavailable : public RecommendError {
public:
  explicit EmbeddingUnavailable(const std::string& message)
    : RecommendError(ErrorCode::kEmbeddingUnavailable, message) {}
};

class RerankUnavailable : public RecommendError {
public:
  explicit RerankUnavailable(const std::string& message)
    : RecommendError(ErrorCode::kRerankUnavailable, message) {}
};

class IndexNotReady : public RecommendError {
public:
  explicit IndexNotReady(const std::string& message)
    : RecommendError(ErrorCode::kIndexNotReady, message) {}
};

class InternalInconsistency : public RecommendError {
public:
  explicit InternalInconsistency(const std::string& message)
    : RecommendError(ErrorCode::kInternalInconsistency, message) {}
};

class RequestCancelled : public RecommendError {
public:
  explicit RequestCancelled(const std::string& message)
    : RecommendError(ErrorCode::kCancelled, message) {}
};

} // namespace rec
