#include "internal/factory.hpp"

#include <cassert>
#include <iostream>

#include "internal/service/trace_service.hpp"

namespace {

using tracebrain::runtime::config::RuntimeConfig;

void TestModelLimitsReachBothCallers() {
  RuntimeConfig config;
  config.mutable_llm()->set_model("llama3.1");
  config.mutable_llm()->set_max_tokens(300);
  config.mutable_llm()->set_temperature(0.3);
  config.mutable_llm()->set_max_retries(4);

  auto translator = tracebrain::factory::TranslatorOptionsFrom(config.llm());
  auto evaluator  = tracebrain::factory::EvaluatorOptionsFrom(config);
  assert(translator.max_tokens == 300);
  assert(evaluator.max_tokens == 300);
  assert(translator.temperature == 0.3);
  assert(evaluator.temperature == 0.3);
  assert(translator.retry.max_retries == 4);
  assert(evaluator.retry.max_retries == 4);

  config.mutable_llm()->set_max_tokens(0);
  assert(tracebrain::factory::TranslatorOptionsFrom(config.llm()).max_tokens == tracebrain::query::TranslatorOptions{}.max_tokens);
  assert(tracebrain::factory::EvaluatorOptionsFrom(config).max_tokens == tracebrain::evaluation::EvaluatorOptions{}.max_tokens);
}

void TestJudgeDefaultsToConfiguredModel() {
  RuntimeConfig config;
  config.mutable_llm()->set_model("llama3.1");
  assert(tracebrain::factory::EvaluatorOptionsFrom(config).judge_model == "llama3.1");

  config.mutable_evaluation()->set_judge_model("qwen2.5:14b");
  assert(tracebrain::factory::EvaluatorOptionsFrom(config).judge_model == "qwen2.5:14b");
}

void TestBuildInMemoryApplication() {
  RuntimeConfig config;
  config.mutable_evaluation()->set_enabled(true);

  auto app = tracebrain::factory::Build(config);
  assert(app.repository);
  assert(app.store);
  assert(app.service);
  assert(app.evaluation_worker);
  app.Shutdown();
}

} // namespace

int main() {
  TestModelLimitsReachBothCallers();
  TestJudgeDefaultsToConfiguredModel();
  TestBuildInMemoryApplication();

  std::cout << "tracebrain_unit_factory: pass\n";
  return 0;
}
