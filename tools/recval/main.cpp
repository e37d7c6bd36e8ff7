// recval - Record value-semantics checker command line interface
//
// Usage:
//   recval check [model.json | --project] [--werror]
//   recval explain <model.json> <type>
//   recval init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "recval/basic/diagnostic_printer.hpp"
#include "recval/driver/analyzer.hpp"
#include "recval/model/model_loader.hpp"
#include "recval/model/type_expr.hpp"
#include "recval/project/project_config.hpp"
#include "recval/sema/explain.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "recval - record value-semantics checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [model.json]        Check the records of a model or project\n"
            << "  explain <model.json> <type>\n"
            << "                            Show how a type is classified\n"
            << "  init <project-name>       Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                 Check models listed in recval.yaml\n"
            << "  --werror                  Treat warnings as errors\n"
            << "  --ignore <record>         Skip a record (repeatable)\n"
            << "  -v, --verbose             Verbose output\n"
            << "  -h, --help                Show this help message\n";
}

void print_diagnostics(const recval::DiagnosticBag & diagnostics, const recval::SourceRegistry & sources)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  recval::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::vector<std::string> ignore;
  bool use_project = false;
  bool werror = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--werror") {
      args.werror = true;
    } else if (arg == "--ignore") {
      if (i + 1 < argc) {
        args.ignore.emplace_back(argv[++i]);
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  recval::AnalyzeOptions options;
  options.verbose = args.verbose;
  options.ignore = args.ignore;

  recval::AnalysisResult result;
  std::string input_name = "project";

  if (args.use_project || args.positional.empty()) {
    // Project mode: find recval.yaml
    auto config_path = recval::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no recval.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = recval::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    result = recval::Analyzer::analyze_project(config_result.config, options);
  } else {
    // Single model mode
    input_name = args.positional.front();
    const fs::path input_path = fs::absolute(input_name);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking: " << input_path.string() << "\n";
    }

    result = recval::Analyzer::analyze_file(input_path, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.sources);
  }

  if (!result.success || (args.werror && result.diagnostics.has_warnings())) {
    return 1;
  }

  if (result.diagnostics.empty()) {
    std::cout << input_name << ": OK\n";
  }
  return 0;
}

int cmd_explain(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: model file and type required\n";
    std::cerr << "usage: recval explain <model.json> <type>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.positional[0]);
  const std::string & type_text = args.positional[1];

  recval::SourceRegistry sources;
  recval::DiagnosticBag diags;
  recval::ModelLoader loader(sources, diags);
  auto model = loader.load_file(input_path);

  if (!diags.empty()) {
    print_diagnostics(diags, sources);
  }
  if (!model) {
    return 1;
  }

  const auto parsed = recval::parse_type_expr(type_text);
  if (!parsed.success()) {
    std::cerr << "error: invalid type '" << type_text << "': " << parsed.error << "\n";
    return 1;
  }

  std::string error;
  recval::TypeRef type = model->types->resolve(*parsed.expr, nullptr, error);
  if (type == nullptr) {
    std::cerr << "error: " << error << "\n";
    return 1;
  }
  model->types->complete_instantiations();

  std::cout << recval::explain_to_json(type).dump(2) << "\n";
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: recval init <project-name>\n";
    return 1;
  }

  const std::string & name = args.positional.front();
  const fs::path project_dir = fs::current_path() / name;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "model");

    // Create recval.yaml
    std::ofstream config(project_dir / recval::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << name << "'\n"
           << "  version: '0.1.0'\n\n"
           << "analysis:\n"
           << "  models:\n"
           << "    - './model/types.json'\n"
           << "  severity: warning\n"
           << "  ignore: []\n";
    config.close();

    // Create a sample model
    using nlohmann::json;
    const json point = {
      {"name", "Point"},
      {"kind", "struct"},
      {"members", json::array({{{"name", "X"}, {"type", "int"}}, {{"name", "Y"}, {"type", "int"}}})},
    };
    const json shape = {{"name", "Shape"}, {"kind", "class"}, {"record", true}};
    const json shape_record = {
      {"type", "Shape"},
      {"parameters", json::array({{{"name", "Origin"}, {"type", "Point"}},
                                  {{"name", "Tags"}, {"type", "string[]"}}})},
    };
    json model;
    model["types"] = json::array({point, shape});
    model["records"] = json::array({shape_record});
    std::ofstream out(project_dir / "model" / "types.json");
    out << model.dump(2) << "\n";
    out.close();

    std::cout << "Initialized new recval project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << name << "\n"
              << "  recval check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "explain") {
    return cmd_explain(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
