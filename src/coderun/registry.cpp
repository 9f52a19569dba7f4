#include "registry.h"

#include <array>
#include <memory>

#include <coderun/utils.h>

namespace {

using PipelineTable = std::array<std::unique_ptr<Pipeline>, kLanguageCount>;

std::unique_ptr<Pipeline> MakePipeline(Language lang) {
  switch (lang) {
    case Language::PYTHON:
      return std::make_unique<InterpretedPipeline>(lang, std::vector<std::string>{"python3"});
    case Language::C:
      return std::make_unique<GccPipeline>(lang, "gcc", std::vector<std::string>{"-lm"});
    case Language::CPP:
      return std::make_unique<GccPipeline>(lang, "g++", std::vector<std::string>{});
    case Language::JAVA:
      return std::make_unique<JavaPipeline>();
    case Language::KOTLIN:
      return std::make_unique<KotlinPipeline>();
    case Language::JAVASCRIPT:
      return std::make_unique<InterpretedPipeline>(lang, std::vector<std::string>{"node"});
    case Language::RUST:
      return std::make_unique<CargoPipeline>();
    case Language::SQL:
      return std::make_unique<SqlPipeline>();
    case Language::TEXT:
      return std::make_unique<TextPipeline>();
  }
  __builtin_unreachable();
}

PipelineTable BuildTable() {
  PipelineTable ret;
  for (int i = 0; i < kLanguageCount; i++) ret[i] = MakePipeline((Language)i);
  return ret;
}

} // namespace

const Pipeline& GetPipeline(Language lang) {
  static const PipelineTable kTable = BuildTable();
  return *kTable[(int)lang];
}
