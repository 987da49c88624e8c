#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace upgrader::runtime::config {
class RuntimeConfig;
}

namespace upgrader::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"pg-schema-upgrader"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const upgrader::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  SpanScope

  Span that ends when the scope does. Parent is passed explicitly instead
  of going through the thread-local active context, because engine code
  runs in coroutines that may suspend and resume between other work.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, const SpanScope* parent = nullptr);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const upgrader::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, const SpanScope*) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace upgrader::observability
