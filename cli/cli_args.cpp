#include "cli_args.h"

#include <string>

#include "cli_utils.h"

namespace tbxflat::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_startup_help(std::ostream& os) {
  os << "tbxflat - flatten TBX terminology into spreadsheet tables\n\n";
  os << "Usage:\n";
  os << "  tbxflat <input.tbx> [-o <output>] [--format xlsx|csv|parquet|json]\n";
  os << "  tbxflat <input.tbx> --auto [-s]\n";
  os << "  tbxflat <input.tbx> --fields entry_id,term --map term=Headword\n";
  os << "  tbxflat <input.tbx> --list-fields\n\n";
  os << "Notes:\n";
  os << "  - Without --auto or --fields the fields are chosen interactively.\n";
  os << "  - Field discovery samples the first entries only (see --sample).\n";
  os << "  - Exit codes: 0=success, 1=conversion error or no data, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  tbxflat ./glossary.tbx --auto\n";
  os << "  tbxflat ./glossary.tbx --fields entry_id,term,termNote_partOfSpeech -o out/glossary.csv\n";
}

void print_help(std::ostream& os) {
  os << "Usage: tbxflat <input.tbx> [options]\n";
  os << "  -o, --output <path>       output file (default: input with the format's extension)\n";
  os << "  --format <kind>           xlsx, csv, parquet or json (default: xlsx when built\n";
  os << "                            with FastExcel, otherwise csv)\n";
  os << "  --auto                    use every discovered field with original names\n";
  os << "  --fields a,b,c            select fields without prompting\n";
  os << "  --map field=Name          rename a field (repeatable)\n";
  os << "  --map-file <file.json>    read a {\"field\": \"Name\"} rename mapping\n";
  os << "  --list-fields             print discovered fields and exit\n";
  os << "  -s, --summary             print a conversion summary\n";
  os << "  --sample <n>              entries sampled by field discovery (default: 3)\n";
  os << "  --verbose                 print extraction progress to stderr\n";
  os << "  --color=disabled          disable ANSI colors\n";
  os << "Config: $TBXFLAT_CONFIG or ~/.config/tbxflat/config.toml\n";
  os << "Exit codes: 0=success, 1=conversion error or no data, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      options.output = argv[++i];
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      options.format = argv[++i];
      if (!parse_export_kind(options.format).has_value()) {
        error = "Invalid --format value (use xlsx|csv|parquet|json)";
        return false;
      }
    } else if (arg == "--auto") {
      options.auto_mode = true;
    } else if (arg == "--fields") {
      if (i + 1 >= argc) {
        error = "Missing value for --fields";
        return false;
      }
      options.fields = split_field_list(argv[++i]);
      if (options.fields.empty()) {
        error = "--fields requires at least one field";
        return false;
      }
    } else if (arg == "--map") {
      if (i + 1 >= argc) {
        error = "Missing value for --map";
        return false;
      }
      std::string value = argv[++i];
      auto pair = parse_mapping_pair(value);
      if (!pair.has_value()) {
        error = "Invalid --map value (use field=Name): " + value;
        return false;
      }
      options.mappings.push_back(*pair);
    } else if (arg == "--map-file") {
      if (i + 1 >= argc) {
        error = "Missing value for --map-file";
        return false;
      }
      options.map_file = argv[++i];
    } else if (arg == "--list-fields") {
      options.list_fields = true;
    } else if (arg == "-s" || arg == "--summary") {
      options.summary = true;
    } else if (arg == "--sample") {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      size_t parsed = 0;
      if (!parse_size(argv[++i], parsed)) {
        error = "Invalid " + arg + " value (use a positive integer)";
        return false;
      }
      options.sample_entries = parsed;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "-h" || arg == "--help") {
      options.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "Unknown argument: " + arg;
      return false;
    } else if (options.input.empty()) {
      options.input = arg;
    } else {
      error = "Unexpected extra input: " + arg;
      return false;
    }
  }
  if (options.auto_mode && !options.fields.empty()) {
    error = "--auto and --fields are mutually exclusive";
    return false;
  }
  return true;
}

}  // namespace tbxflat::cli
