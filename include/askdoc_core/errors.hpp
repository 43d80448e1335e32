#pragma once

#include <exception>
#include <string>

namespace askdoc_core {

// Base for every error raised by the core. Carries a plain message.
class AskdocError : public std::exception {
 public:
  explicit AskdocError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  // Short stable identifier used by the HTTP layer and in log lines.
  virtual const char *kind() const noexcept {
    return "askdoc_error";
  }

 private:
  std::string message_;
};

// Invalid chunking or configuration parameters. Caller's fault, never retried.
class ConfigurationError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "configuration_error";
  }
};

// --- Index contract violations ---

class DimensionMismatchError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "dimension_mismatch";
  }
};

class DuplicateDocumentError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "duplicate_document";
  }
};

class EmptyIndexError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "empty_index";
  }
};

// --- External service failures (transient, retryable) ---

class EmbeddingUnavailableError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "embedding_unavailable";
  }
};

class SynthesisError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "synthesis_error";
  }
};

// Cleanup after a failed ingest did not complete. The index may hold a
// partial document.
class RollbackError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "rollback_error";
  }
};

// --- Ingest guards ---

class EmptyDocumentError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "empty_document";
  }
};

class IngestCancelledError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "ingest_cancelled";
  }
};

// --- Collaborators ---

class DocumentStoreError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "document_store_error";
  }
};

class ExtractionError : public AskdocError {
 public:
  using AskdocError::AskdocError;
  const char *kind() const noexcept override {
    return "extraction_error";
  }
};

}  // namespace askdoc_core
