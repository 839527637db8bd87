#pragma once

#include "adapters/openai_adapter.hpp"

namespace llmbridge {

// Lollms speaks the OpenAI dialect for chat and model listing. Its extra
// /lollms/v1 and /v1/extract_text endpoints are gated by
// BackendConfig::use_extended_endpoints rather than by dialect.
class LollmsAdapter : public OpenAiAdapter {
 public:
  BackendKind Kind() const override { return BackendKind::kLollms; }
};

}  // namespace llmbridge
