#pragma once

#include <stdexcept>
#include <string>

namespace rgkb {

class KnowledgeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Missing credential or invalid settings. Fatal at startup, never retried.
class ConfigError : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

class NotFoundError : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

class EmptyInputError : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

// Embedding provider failed at query time. Callers proceed without context.
class RetrievalUnavailableError : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

// Persisted snapshot could not be decoded. Treated as an absent snapshot.
class ParseFailure : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

class NotReadyError : public KnowledgeError {
 public:
  using KnowledgeError::KnowledgeError;
};

class ProviderError : public KnowledgeError {
 public:
  ProviderError(const std::string& message, bool transient)
      : KnowledgeError(message), transient_(transient) {}

  [[nodiscard]] bool transient() const noexcept { return transient_; }

 private:
  bool transient_ = false;
};

}  // namespace rgkb
