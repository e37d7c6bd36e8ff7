// recval/driver/analyzer.cpp - Analysis driver implementation
//
#include "recval/driver/analyzer.hpp"

#include <iostream>

#include "recval/model/model_loader.hpp"
#include "recval/sema/record_checker.hpp"

namespace recval
{

namespace
{

void log_model(const AnalyzeOptions & options, const TypeModel & model)
{
  if (options.verbose) {
    std::cerr << "Loaded model: " << model.path.string() << " (" << model.types->size()
              << " types, " << model.records.size() << " records)\n";
  }
}

}  // namespace

AnalysisResult Analyzer::analyze_file(
  const std::filesystem::path & file, const AnalyzeOptions & options)
{
  AnalysisResult result;

  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(file, ec)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  ModelLoader loader(result.sources, result.diagnostics);
  auto model = loader.load_file(file);
  if (!model) {
    return result;
  }
  log_model(options, *model);

  check_model(*model, options, nullptr, result);
  result.models.push_back(std::move(model));

  result.success = !result.diagnostics.has_errors();
  return result;
}

AnalysisResult Analyzer::analyze_text(
  std::string text, const std::filesystem::path & virtual_path, const AnalyzeOptions & options)
{
  AnalysisResult result;

  ModelLoader loader(result.sources, result.diagnostics);
  auto model = loader.load_string(std::move(text), virtual_path);
  if (!model) {
    return result;
  }
  log_model(options, *model);

  check_model(*model, options, nullptr, result);
  result.models.push_back(std::move(model));

  result.success = !result.diagnostics.has_errors();
  return result;
}

AnalysisResult Analyzer::analyze_project(
  const ProjectConfig & config, const AnalyzeOptions & options)
{
  AnalysisResult result;

  namespace fs = std::filesystem;

  if (config.analysis.models.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no models defined in project configuration");
    return result;
  }

  ModelLoader loader(result.sources, result.diagnostics);
  for (const auto & model_path : config.resolved_models()) {
    std::error_code ec;
    if (!fs::exists(model_path, ec)) {
      result.diagnostics.report_error(SourceRange{}, "model not found: " + model_path.string());
      continue;
    }

    auto model = loader.load_file(model_path);
    if (!model) {
      // Continue to collect errors from other models
      continue;
    }
    log_model(options, *model);

    check_model(*model, options, &config.analysis, result);
    result.models.push_back(std::move(model));
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

void Analyzer::check_model(
  const TypeModel & model, const AnalyzeOptions & options, const AnalysisConfig * project,
  AnalysisResult & result)
{
  RecordCheckOptions check_options;
  if (project != nullptr) {
    check_options.severity = project->severity;
    check_options.ignore = project->ignore;
  }
  if (options.severity) {
    check_options.severity = *options.severity;
  }
  check_options.ignore.insert(check_options.ignore.end(), options.ignore.begin(), options.ignore.end());

  RecordChecker checker(result.diagnostics, std::move(check_options));
  checker.check(model);

  result.records_checked += checker.records_checked();
  result.records_skipped += checker.records_skipped();

  if (options.verbose) {
    std::cerr << "Checked " << checker.records_checked() << " records, skipped "
              << checker.records_skipped() << ", " << checker.reported_count()
              << " members reported\n";
  }
}

}  // namespace recval
