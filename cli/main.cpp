#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config/config.h"
#include "export/export_sinks.h"
#include "prompt/field_prompt.h"
#include "tbxflat/tbxflat.h"
#include "ui/color.h"

namespace {

using tbxflat::cli::kColor;
using tbxflat::cli::paint;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_error(const std::string& message) {
  std::cerr << paint(kColor.red, "Error: " + message) << std::endl;
}

void print_warning(const std::string& message) {
  std::cerr << paint(kColor.yellow, "Warning: " + message) << std::endl;
}

void print_discovery_notes(const tbxflat::DiscoveryResult& discovery) {
  if (!discovery.error.empty()) {
    print_warning("field discovery failed (" + discovery.error + "); using the default field set");
  } else if (discovery.incomplete) {
    print_warning("fields were discovered from the first " +
                  std::to_string(discovery.entries_examined) + " of " +
                  std::to_string(discovery.entries_total) +
                  " entries; raise --sample to scan more");
  }
}

int list_fields(const tbxflat::DiscoveryResult& discovery, tbxflat::cli::ExportSink::Kind kind) {
  if (kind == tbxflat::cli::ExportSink::Kind::Json) {
    std::string json;
    std::string error;
    if (!tbxflat::cli::build_fields_json(discovery, json, error)) {
      print_error(error);
      return kExitFailure;
    }
    std::cout << json << std::endl;
    return kExitOk;
  }
  for (const auto& field : discovery.fields) {
    std::cout << field << "\n";
  }
  std::cout.flush();
  return kExitOk;
}

// Renames come from config [rename], then --map-file, then --map; later sources win.
bool collect_overrides(const tbxflat::cli::Settings& settings,
                       const tbxflat::cli::CliOptions& options,
                       std::vector<std::pair<std::string, std::string>>& overrides,
                       std::string& error) {
  overrides = settings.renames;
  if (!options.map_file.empty()) {
    if (!tbxflat::cli::load_mapping_file(options.map_file, overrides, error)) {
      return false;
    }
  }
  overrides.insert(overrides.end(), options.mappings.begin(), options.mappings.end());
  return true;
}

void warn_unknown_fields(const tbxflat::SelectedFields& selected,
                         const tbxflat::DiscoveryResult& discovery) {
  std::unordered_set<std::string> known(discovery.fields.begin(), discovery.fields.end());
  for (const auto& field : selected) {
    if (known.count(field) == 0) {
      print_warning("field '" + field + "' was not seen in the sampled entries");
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  using namespace tbxflat::cli;

  if (argc == 1) {
    print_startup_help(std::cout);
    return kExitOk;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    print_error(error);
    return kExitUsage;
  }
  if (options.show_help) {
    print_help(std::cout);
    return kExitOk;
  }
  if (options.input.empty()) {
    print_error("Missing input TBX file");
    return kExitUsage;
  }

  Settings settings;
  std::string config_path = resolve_config_path();
  if (!load_config(config_path, settings, error) && !error.empty()) {
    print_error(config_path + ": " + error);
    return kExitUsage;
  }
  bool color = options.color && settings.color.value_or(true) && isatty(fileno(stdout)) != 0;
  if (!color) disable_color();

  std::error_code ec;
  if (!std::filesystem::exists(options.input, ec)) {
    print_error("File not found: " + options.input);
    return kExitUsage;
  }

  std::string format = !options.format.empty() ? options.format : settings.format.value_or("");
  ExportSink sink;
  sink.kind = parse_export_kind(format).value_or(default_export_kind());
  sink.path = options.output.empty() ? replace_extension(options.input, sink.kind) : options.output;

  try {
    tbxflat::TbxDocument document = tbxflat::load_document(options.input);

    tbxflat::ConvertOptions convert_options;
    convert_options.sample_entries =
        options.sample_entries.value_or(settings.sample_entries.value_or(tbxflat::kDefaultSampleEntries));
    if (options.verbose) convert_options.log = &std::cerr;

    if (options.verbose) {
      std::cerr << "Scanning TBX file to identify available data fields..." << std::endl;
    }
    tbxflat::DiscoveryResult discovery =
        tbxflat::discover_fields(document, convert_options.sample_entries);
    print_discovery_notes(discovery);

    if (options.list_fields) {
      return list_fields(discovery, sink.kind);
    }

    std::vector<std::pair<std::string, std::string>> overrides;
    if (!collect_overrides(settings, options, overrides, error)) {
      print_error(error);
      return kExitUsage;
    }

    tbxflat::SelectedFields selected;
    tbxflat::FieldMapping mapping;
    if (options.auto_mode) {
      selected = discovery.fields;
      mapping = build_field_mapping(selected, overrides);
    } else if (!options.fields.empty()) {
      selected = options.fields;
      warn_unknown_fields(selected, discovery);
      mapping = build_field_mapping(selected, overrides);
    } else {
      std::cout << std::string(60, '=') << "\n";
      std::cout << "TBX TO TABLE CONVERTER - CONFIGURATION\n";
      std::cout << std::string(60, '=') << "\n";
      auto picked = prompt_field_selection(discovery.fields, std::cin, std::cout);
      if (!picked.has_value()) {
        print_error("Input ended before a field selection was made");
        return kExitUsage;
      }
      selected = *picked;
      auto named = prompt_field_mapping(selected, std::cin, std::cout);
      if (!named.has_value()) {
        print_error("Input ended before field names were confirmed");
        return kExitUsage;
      }
      mapping = build_field_mapping(selected, overrides);
      for (const auto& kv : *named) {
        if (kv.first != kv.second) mapping[kv.first] = kv.second;
      }
      std::cout << "\nConfiguration complete!\n";
      std::cout << "Ready to extract " << selected.size() << " fields from your TBX file.\n";
      std::cout << std::string(60, '=') << std::endl;
    }

    tbxflat::ConversionResult result = tbxflat::convert(document, selected, mapping, convert_options);
    if (!result.has_data()) {
      print_error("No data was extracted from the TBX file.");
      if (result.status == tbxflat::ConversionResult::Status::NoEntries) {
        std::cerr << paint(kColor.yellow,
                           "Tip: no termEntry or conceptEntry elements were found.")
                  << std::endl;
      }
      return kExitFailure;
    }

    std::string written_path;
    if (!export_table_with_fallback(result.table, sink, written_path, error)) {
      print_error(error);
      return kExitFailure;
    }
    if (!error.empty()) {
      print_warning(export_kind_label(sink.kind) + " writer failed (" + error +
                    "); wrote CSV instead");
    }
    std::cout << paint(kColor.green, "Successfully converted " +
                                         std::to_string(result.table.rows.size()) +
                                         " entries to " + written_path)
              << std::endl;

    if (options.summary || (!options.auto_mode && options.fields.empty())) {
      std::cout << "\n" << format_summary(tbxflat::summarize(result.table));
    }
    return kExitOk;
  } catch (const std::exception& ex) {
    print_error(ex.what());
    return kExitFailure;
  }
}
