// recval/sema/record_checker.hpp - Value-semantics check of record members
//
// Walks the positional parameters and the explicitly declared fields and
// properties of every record in a model and reports each member whose type
// would break the record's derived equality.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "recval/basic/diagnostic.hpp"
#include "recval/model/type_model.hpp"
#include "recval/sema/value_semantics.hpp"

namespace recval
{

/// Diagnostic code for a member without value semantics
inline constexpr const char * k_value_semantics_code = "JSV01";

struct RecordCheckOptions
{
  Severity severity = Severity::Warning;

  /// Records (by type name) that are never checked
  std::vector<std::string> ignore;
};

/**
 * Does `record` declare its own `bool Equals(T)`? Compiler-generated
 * equality does not count.
 */
[[nodiscard]] bool record_has_own_equals(const TypeSymbol & record) noexcept;

class RecordChecker
{
public:
  explicit RecordChecker(DiagnosticBag & diags, RecordCheckOptions options = {})
  : diags_(diags), options_(std::move(options))
  {
  }

  RecordChecker(
    DiagnosticBag & diags, RecordCheckOptions options, const ValueSemanticsClassifier & classifier)
  : diags_(diags), options_(std::move(options)), classifier_(classifier)
  {
  }

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Check every record of a model.
   *
   * @return true if no member was reported
   */
  bool check(const TypeModel & model);

  /**
   * Check one record.
   *
   * @return true if no member was reported
   */
  bool check(const RecordDecl & record);

  // ===========================================================================
  // Statistics
  // ===========================================================================

  [[nodiscard]] size_t records_checked() const noexcept { return records_checked_; }
  [[nodiscard]] size_t records_skipped() const noexcept { return records_skipped_; }
  [[nodiscard]] size_t reported_count() const noexcept { return reported_; }

private:
  [[nodiscard]] bool is_ignored(std::string_view name) const;
  bool check_member(const RecordDecl & record, const RecordMemberDecl & member);

  DiagnosticBag & diags_;
  RecordCheckOptions options_;
  ValueSemanticsClassifier classifier_;

  size_t records_checked_ = 0;
  size_t records_skipped_ = 0;
  size_t reported_ = 0;
};

}  // namespace recval
