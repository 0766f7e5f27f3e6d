#pragma once

#include <string>

namespace tracebrain::evaluation {

/*
  A scheduled AI evaluation of one trace.
*/
struct EvaluationTask {
  std::string trace_id;

  // Empty means the evaluator's configured judge.
  std::string judge_model;
};

}
