// recval/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the check pipeline: load model files, then check
// every record they describe. Used by the CLI and by integration tests.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recval/basic/diagnostic.hpp"
#include "recval/basic/source_manager.hpp"
#include "recval/model/type_model.hpp"
#include "recval/project/project_config.hpp"

namespace recval
{

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Severity of findings (overrides project config)
  std::optional<Severity> severity;

  /// Additional record names to skip
  std::vector<std::string> ignore;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisResult
{
  /// Whether analysis succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (model errors and findings)
  DiagnosticBag diagnostics;

  /// Files referenced by diagnostics
  SourceRegistry sources;

  /// Loaded models (for introspection)
  std::vector<std::unique_ptr<TypeModel>> models;

  size_t records_checked = 0;
  size_t records_skipped = 0;
};

// ============================================================================
// Analyzer
// ============================================================================

class Analyzer
{
public:
  /**
   * Analyze a single model file.
   */
  [[nodiscard]] static AnalysisResult analyze_file(
    const std::filesystem::path & file, const AnalyzeOptions & options);

  /**
   * Analyze in-memory model text, named `virtual_path` in diagnostics.
   */
  [[nodiscard]] static AnalysisResult analyze_text(
    std::string text, const std::filesystem::path & virtual_path, const AnalyzeOptions & options);

  /**
   * Analyze every model listed by a project configuration.
   *
   * Project severity and ignore list apply unless overridden by `options`.
   */
  [[nodiscard]] static AnalysisResult analyze_project(
    const ProjectConfig & config, const AnalyzeOptions & options);

private:
  /**
   * Check the records of a loaded model.
   */
  static void check_model(
    const TypeModel & model, const AnalyzeOptions & options, const AnalysisConfig * project,
    AnalysisResult & result);
};

}  // namespace recval
