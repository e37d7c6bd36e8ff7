// recval/model/model_loader.hpp - JSON type model loader
//
// A model file describes the types of a host program and the records whose
// derived equality should be checked:
//
//   {
//     "types":   [ { "name": "StructA", "kind": "struct",
//                    "members": [ { "name": "Numbers", "type": "int[]" } ] } ],
//     "records": [ { "type": "A", "file": "A.cs", "line": 3, "column": 1,
//                    "parameters": [ { "name": "Sa", "type": "StructA",
//                                      "line": 3, "column": 23, "length": 10 } ] } ]
//   }
//
// Types are declared first and resolved afterwards, so members may refer to
// types declared later in the file, or cyclically.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "recval/basic/diagnostic.hpp"
#include "recval/basic/source_manager.hpp"
#include "recval/model/type_model.hpp"

namespace recval
{

/// Diagnostic codes emitted while loading a model
namespace model_codes
{
inline constexpr const char * k_invalid_json = "M001";
inline constexpr const char * k_invalid_root = "M002";
inline constexpr const char * k_invalid_type = "M003";
inline constexpr const char * k_duplicate_type = "M004";
inline constexpr const char * k_bad_type_syntax = "M005";
inline constexpr const char * k_unknown_type = "M006";
inline constexpr const char * k_unknown_record = "M007";
inline constexpr const char * k_invalid_record = "M008";
inline constexpr const char * k_generic_depth = "M009";
}  // namespace model_codes

class ModelLoader
{
public:
  ModelLoader(SourceRegistry & sources, DiagnosticBag & diags) : sources_(sources), diags_(diags)
  {
  }

  /**
   * Load a model file from disk.
   *
   * @return the model, or nullptr when the file is unreadable or not a JSON object.
   *         A returned model may still be partial; check the diagnostics.
   */
  [[nodiscard]] std::unique_ptr<TypeModel> load_file(const std::filesystem::path & path);

  /**
   * Load a model from in-memory text. `virtual_path` names it in diagnostics
   * and anchors relative record file paths.
   */
  [[nodiscard]] std::unique_ptr<TypeModel> load_string(
    std::string text, const std::filesystem::path & virtual_path);

private:
  SourceRegistry & sources_;
  DiagnosticBag & diags_;
};

}  // namespace recval
