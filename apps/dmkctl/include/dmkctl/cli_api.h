#pragma once

#include "dmk/config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
  std::string command;
  std::filesystem::path in_path;      // macro source
  std::filesystem::path doc_path;     // document (.json snapshot or plain text)
  std::filesystem::path out_path;     // where the edited document goes
  std::filesystem::path plan_path;
  std::filesystem::path config_path;
  std::optional<std::string> host;
  std::optional<std::string> store_kind;
  std::optional<std::filesystem::path> store_path;
  std::optional<std::filesystem::path> audit_path;
  std::string block_id;
  int attempt = 1;
  std::string prior_error_type;
  std::string prior_error_message;
  bool json = false;
  bool verbose = false;
};

// Parses `dmkctl <command> [--flag value ...]`. Unknown flags fail.
bool parse_cli(int argc, char** argv, CliOptions& out, std::string& error);

// Config file values with command line overrides applied.
bool resolve_config(const CliOptions& opts, dmk::MacroConfig& out, std::string& error);

// Where `run`, `plan` and `rollback` write the edited document.
std::filesystem::path output_document_path(const CliOptions& opts);

int run_command(const CliOptions& opts, std::ostream& out, std::ostream& err);
int dmkctl_main(int argc, char** argv, std::ostream& out, std::ostream& err);
void print_usage(std::ostream& out);
