// recval/model/model_loader.cpp - JSON type model loader implementation
//
#include "recval/model/model_loader.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "recval/model/type_expr.hpp"

namespace recval
{

namespace
{

using nlohmann::json;

namespace codes = model_codes;

struct PendingType
{
  TypeSymbol * symbol = nullptr;
  const json * node = nullptr;
};

/**
 * Loads one model document into a TypeModel.
 */
class ModelBuilder
{
public:
  ModelBuilder(
    TypeModel & model, SourceRegistry & sources, DiagnosticBag & diags, FileId model_file)
  : model_(model), sources_(sources), diags_(diags), model_file_(model_file)
  {
  }

  void build(const json & root)
  {
    std::vector<PendingType> pending;

    if (const auto it = root.find("types"); it != root.end()) {
      if (!it->is_array()) {
        error(codes::k_invalid_root, "'types' must be an array");
      } else {
        for (const auto & entry : *it) {
          if (auto p = declare_type(entry)) {
            pending.push_back(*p);
          }
        }
      }
    }

    const json * records = nullptr;
    if (const auto it = root.find("records"); it != root.end()) {
      if (!it->is_array()) {
        error(codes::k_invalid_root, "'records' must be an array");
      } else {
        records = &*it;
        mark_record_types(*records);
      }
    }

    for (const auto & p : pending) {
      resolve_type_body(*p.symbol, *p.node);
    }

    if (records != nullptr) {
      for (const auto & entry : *records) {
        load_record(entry);
      }
    }

    // Limits hit while resolving were already reported as unknown types
    const size_t limited_before = model_.types->depth_limited().size();
    model_.types->complete_instantiations();

    const auto & limited = model_.types->depth_limited();
    for (size_t i = limited_before; i < limited.size(); ++i) {
      error(
        codes::k_generic_depth,
        "generic type '" + limited[i] + "' expands without bound; members nested deeper than " +
          std::to_string(k_max_instantiation_depth) + " levels are left unresolved");
    }
  }

private:
  // ===========================================================================
  // Types
  // ===========================================================================

  std::optional<PendingType> declare_type(const json & entry)
  {
    try {
      if (!entry.is_object()) {
        error(codes::k_invalid_type, "type entry must be an object");
        return std::nullopt;
      }

      const auto name = entry.value("name", std::string());
      if (name.empty()) {
        error(codes::k_invalid_type, "type entry is missing 'name'");
        return std::nullopt;
      }

      TypeCategory category = TypeCategory::Class;
      const auto kind = entry.value("kind", std::string("class"));
      if (!parse_type_category(kind, category)) {
        error(codes::k_invalid_type, "type '" + name + "' has unknown kind '" + kind + "'");
        return std::nullopt;
      }

      std::vector<std::string> type_params;
      if (const auto it = entry.find("type_parameters"); it != entry.end()) {
        type_params = it->get<std::vector<std::string>>();
      }

      TypeSymbol * sym = model_.types->declare(name, category, std::move(type_params));
      if (sym == nullptr) {
        error(codes::k_duplicate_type, "type '" + name + "' is declared more than once");
        return std::nullopt;
      }

      sym->is_record = entry.value("record", false);
      sym->is_readonly = entry.value("readonly", false);
      if (const auto it = entry.find("attributes"); it != entry.end()) {
        sym->attributes = it->get<std::vector<std::string>>();
      }

      return PendingType{sym, &entry};
    } catch (const json::exception & e) {
      error(codes::k_invalid_type, std::string("invalid type entry: ") + e.what());
      return std::nullopt;
    }
  }

  void mark_record_types(const json & records)
  {
    for (const auto & entry : records) {
      if (!entry.is_object()) continue;
      const auto it = entry.find("type");
      if (it == entry.end() || !it->is_string()) continue;

      if (TypeRef t = model_.types->lookup(it->get<std::string>())) {
        model_.types->get_mutable(t)->is_record = true;
      }
    }
  }

  void resolve_type_body(TypeSymbol & sym, const json & entry)
  {
    try {
      if (const auto it = entry.find("members"); it != entry.end()) {
        for (const auto & m : *it) {
          MemberSymbol member;
          member.name = m.at("name").get<std::string>();
          member.kind = m.value("property", false) ? MemberKind::Property : MemberKind::Field;
          member.is_static = m.value("static", false);
          member.type = resolve_type_text(
            m.at("type").get<std::string>(), &sym, "member '" + sym.name + "." + member.name + "'");
          sym.members.push_back(std::move(member));
        }
      }

      if (const auto it = entry.find("methods"); it != entry.end()) {
        for (const auto & m : *it) {
          MethodSymbol method;
          method.name = m.at("name").get<std::string>();
          method.declaring_type = &sym;
          method.is_static = m.value("static", false);
          method.is_override = m.value("override", false);
          method.is_abstract = m.value("abstract", false);
          method.is_compiler_generated = m.value("generated", false);

          const std::string context = "method '" + sym.name + "." + method.name + "'";
          method.return_type =
            resolve_type_text(m.value("returns", std::string("void")), &sym, context);

          if (const auto params = m.find("parameters"); params != m.end()) {
            for (const auto & p : *params) {
              ParameterSymbol param;
              if (p.is_string()) {
                param.type = resolve_type_text(p.get<std::string>(), &sym, context);
              } else {
                param.name = p.value("name", std::string());
                param.type = resolve_type_text(p.at("type").get<std::string>(), &sym, context);
              }
              method.parameters.push_back(std::move(param));
            }
          }
          sym.methods.push_back(std::move(method));
        }
      }
    } catch (const json::exception & e) {
      error(codes::k_invalid_type, "invalid body of type '" + sym.name + "': " + e.what());
    }
  }

  TypeRef resolve_type_text(const std::string & text, TypeRef context, const std::string & where)
  {
    const TypeExprParseResult parsed = parse_type_expr(text);
    if (!parsed.success()) {
      error(
        codes::k_bad_type_syntax, "invalid type '" + text + "' in " + where + ": " +
                                    parsed.error + " (column " +
                                    std::to_string(parsed.error_column) + ")");
      return nullptr;
    }

    std::string resolve_error;
    TypeRef t = model_.types->resolve(*parsed.expr, context, resolve_error);
    if (t == nullptr) {
      error(codes::k_unknown_type, resolve_error + " in " + where);
    }
    return t;
  }

  // ===========================================================================
  // Records
  // ===========================================================================

  void load_record(const json & entry)
  {
    try {
      if (!entry.is_object()) {
        error(codes::k_invalid_record, "record entry must be an object");
        return;
      }

      const auto name = entry.value("type", std::string());
      TypeRef type = model_.types->lookup(name);
      if (type == nullptr) {
        error(codes::k_unknown_record, "record refers to unknown type '" + name + "'");
        return;
      }

      FileId file = model_file_;
      if (const auto it = entry.find("file"); it != entry.end()) {
        file = register_source(it->get<std::string>());
      }

      RecordDecl record;
      record.type = type;
      record.range = read_range(entry, file);

      if (const auto it = entry.find("parameters"); it != entry.end()) {
        for (const auto & p : *it) {
          record.parameters.push_back(read_member(p, type, file, MemberOrigin::Parameter));
        }
      }
      if (const auto it = entry.find("members"); it != entry.end()) {
        for (const auto & m : *it) {
          const MemberOrigin origin =
            m.value("property", true) ? MemberOrigin::Property : MemberOrigin::Field;
          record.members.push_back(read_member(m, type, file, origin));
        }
      }

      model_.records.push_back(std::move(record));
    } catch (const json::exception & e) {
      error(codes::k_invalid_record, std::string("invalid record entry: ") + e.what());
    }
  }

  RecordMemberDecl read_member(const json & node, TypeRef record, FileId file, MemberOrigin origin)
  {
    RecordMemberDecl decl;
    decl.name = node.at("name").get<std::string>();
    decl.origin = origin;
    decl.range = read_range(node, file);
    decl.type = resolve_type_text(
      node.at("type").get<std::string>(), record, "record member '" + record->name + "." +
                                                    decl.name + "'");
    return decl;
  }

  static SourceRange read_range(const json & node, FileId file)
  {
    SourceRange r;
    r.file = file;
    r.line = node.value("line", 0U);
    r.column = node.value("column", 1U);
    r.length = node.value("length", 0U);
    return r;
  }

  FileId register_source(const std::string & file)
  {
    std::filesystem::path p(file);
    if (p.is_relative()) {
      p = sources_.get_path(model_file_).parent_path() / p;
    }
    return sources_.register_path(p);
  }

  void error(const char * code, std::string message)
  {
    diags_.report_error(SourceRange{model_file_}, std::move(message)).with_code(code);
  }

  TypeModel & model_;
  SourceRegistry & sources_;
  DiagnosticBag & diags_;
  FileId model_file_;
};

}  // namespace

std::unique_ptr<TypeModel> ModelLoader::load_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    diags_.report_error(SourceRange{}, "cannot open model file: " + path.string())
      .with_code(model_codes::k_invalid_json);
    return nullptr;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return load_string(buffer.str(), path);
}

std::unique_ptr<TypeModel> ModelLoader::load_string(
  std::string text, const std::filesystem::path & virtual_path)
{
  const FileId file_id = sources_.add_file(virtual_path, std::move(text));
  const SourceFile * file = sources_.get_file(file_id);

  json root;
  try {
    const std::string_view content = file->content();
    root = json::parse(content.begin(), content.end());
  } catch (const json::parse_error & e) {
    const LineColumn lc = file->get_line_column(static_cast<uint32_t>(e.byte > 0 ? e.byte - 1 : 0));
    SourceRange range{file_id, lc.line, lc.column, 1};
    diags_.report_error(range, "invalid JSON in model file", e.what())
      .with_code(model_codes::k_invalid_json);
    return nullptr;
  }

  if (!root.is_object()) {
    diags_.report_error(SourceRange{file_id}, "model root must be a JSON object")
      .with_code(model_codes::k_invalid_root);
    return nullptr;
  }

  auto model = std::make_unique<TypeModel>();
  model->path = virtual_path;

  ModelBuilder builder(*model, sources_, diags_, file_id);
  builder.build(root);
  return model;
}

}  // namespace recval
