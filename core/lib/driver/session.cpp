// tlc/driver/session.cpp - Sample typing driver implementation
//
#include "tlc/driver/session.hpp"

#include <algorithm>
#include <iostream>

#include "tlc/ast/ast_printer.hpp"
#include "tlc/ast/json_visitor.hpp"
#include "tlc/sema/types/type_inferrer.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

bool RunReport::success() const noexcept
{
  return unknown_samples.empty() &&
         std::all_of(entries.begin(), entries.end(), [](const SampleReport & e) {
           return e.as_expected();
         });
}

nlohmann::json to_json(const RunReport & report)
{
  nlohmann::json out = nlohmann::json::array();
  for (const auto & e : report.entries) {
    nlohmann::json j{
      {"name", e.name},
      {"subject", e.subject},
      {"expectFailure", e.expect_failure},
      {"asExpected", e.as_expected()}};
    if (e.type_only) {
      j["typeOnly"] = true;
    } else {
      j["expression"] = to_json(e.expr);
      j["result"] = to_json(e.result);
    }
    out.push_back(std::move(j));
  }
  return out;
}

Session::Session(TypeContext & types) : types_(types) {}

RunReport Session::run(const RunOptions & options)
{
  RunReport report;

  const TypingContext base = TypingContext::from_bindings(options.base_bindings);
  if (options.verbose) {
    std::cerr << "Base context: " << base.size() << " binding(s)\n";
  }

  if (options.samples.empty()) {
    for (const auto & spec : builtin_samples()) {
      report.entries.push_back(run_sample(spec, base, report.diagnostics, options.verbose));
    }
    return report;
  }

  for (const auto & name : options.samples) {
    const SampleSpec * spec = find_sample(name);
    if (spec == nullptr) {
      report.unknown_samples.push_back(name);
      report.diagnostics.report_error("unknown sample '" + name + "'")
        .with_help("run 'tlc list' to see the available samples");
      continue;
    }
    report.entries.push_back(run_sample(*spec, base, report.diagnostics, options.verbose));
  }
  return report;
}

SampleReport Session::run_sample(
  const SampleSpec & spec, const TypingContext & base, DiagnosticBag & diags, bool verbose)
{
  if (verbose) {
    std::cerr << "Typing sample: " << spec.name << "\n";
  }

  const Sample & sample = built_sample(spec);

  SampleReport entry;
  entry.name = std::string(spec.name);
  entry.expect_failure = sample.expect_failure;

  if (sample.expr == nullptr) {
    entry.type_only = true;
    entry.subject = to_string(sample.type);
    return entry;
  }

  entry.expr = sample.expr;
  entry.subject = to_string(sample.expr);

  TypingContext ctx = base;
  for (const auto & b : sample.bindings) {
    ctx = ctx.extend(b.name, b.type);
  }

  TypeInferrer inferrer(types_, &diags);
  entry.result = inferrer.infer(sample.expr, ctx);

  if (verbose) {
    std::cerr << "  " << (entry.result.success ? "ok" : "failed")
              << (entry.as_expected() ? "" : " (unexpected)") << "\n";
  }
  return entry;
}

const Sample & Session::built_sample(const SampleSpec & spec)
{
  auto it = built_.find(spec.name);
  if (it == built_.end()) {
    it = built_.emplace(spec.name, spec.build(ast_, types_)).first;
  }
  return it->second;
}

}  // namespace tlc
