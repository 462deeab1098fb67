#include "MappingFile.hpp"
#include "TemplateEditor.hpp"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>

#include <unistd.h>

namespace {

enum class Command { None, Generate, Replace, Clear, List, Set };

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> <command> [options]\n"
      << "\nCommands:\n"
      << "  -g, --generate <out>      Write a mapping file of the text fields\n"
      << "  -r, --replace <mapping>   Replace fields listed in a mapping file\n"
      << "  -c, --clear               Remove placeholders from the document\n"
      << "  -l, --list                List red fields by alias\n"
      << "  -s, --set <alias=value>   Set one field (repeatable)\n"
      << "\nOptions:\n"
      << "  -f, --filter-color <red>  Only extract red text (--generate)\n"
      << "  -p, --pattern <regex>     Placeholder pattern (--clear)\n"
      << "  -v, --verbose             Print diagnostics\n"
      << "  -h, --help                Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " form.pdf --generate form.yaml -f red\n"
      << "  " << programName << " form.pdf --replace form.yaml\n"
      << "  " << programName << " form.pdf --set name=Alice --set city=Oslo\n";
}

// Checks the document can be used before anything opens it
bool validatePdfPath(const std::string &path, bool needWrite,
                     std::string &error) {
  if (!std::filesystem::exists(path)) {
    error = "File not found: " + path;
    return false;
  }
  std::string extension = std::filesystem::path(path).extension().string();
  for (char &c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (extension != ".pdf") {
    error = "Not a PDF file: " + path;
    return false;
  }
  if (::access(path.c_str(), R_OK) != 0) {
    error = "File is not readable: " + path;
    return false;
  }
  if (needWrite && ::access(path.c_str(), W_OK) != 0) {
    error = "File is not writable: " + path;
    return false;
  }
  return true;
}

bool setCommand(Command &command, Command next) {
  if (command != Command::None && command != next) {
    std::cerr << "Error: only one command may be given\n";
    return false;
  }
  command = next;
  return true;
}

int printReplacementReport(const fieldedit::ReplacementReport &report) {
  if (!report.success) {
    std::cerr << "Error: " << report.errorMessage << "\n";
    return 1;
  }

  std::cout << "Replaced " << report.applied << " of " << report.requested
            << " fields in " << std::fixed << std::setprecision(1)
            << report.processingTimeMs << " ms\n";
  for (const auto &outcome : report.outcomes) {
    if (!fieldedit::isApplied(outcome.status)) {
      std::cout << "  skipped " << outcome.key << " ("
                << fieldedit::editStatusName(outcome.status) << ")\n";
    }
  }
  return 0;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  std::string commandArg;
  std::string pattern = fieldedit::kPlaceholderPattern;
  std::map<std::string, std::string> fields;
  fieldedit::ColorFilter filter = fieldedit::ColorFilter::None;
  fieldedit::EditorConfig config;
  Command command = Command::None;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-g" || arg == "--generate" || arg == "-r" ||
               arg == "--replace") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires an argument\n";
        return 1;
      }
      bool generate = arg == "-g" || arg == "--generate";
      if (!setCommand(command, generate ? Command::Generate : Command::Replace)) {
        return 1;
      }
      commandArg = argv[++i];
    } else if (arg == "-c" || arg == "--clear") {
      if (!setCommand(command, Command::Clear)) {
        return 1;
      }
    } else if (arg == "-l" || arg == "--list") {
      if (!setCommand(command, Command::List)) {
        return 1;
      }
    } else if (arg == "-s" || arg == "--set") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --set requires an argument\n";
        return 1;
      }
      std::string assignment = argv[++i];
      std::string::size_type equals = assignment.find('=');
      if (equals == std::string::npos || equals == 0) {
        std::cerr << "Error: --set expects alias=value, got " << assignment
                  << "\n";
        return 1;
      }
      if (!setCommand(command, Command::Set)) {
        return 1;
      }
      fields[assignment.substr(0, equals)] = assignment.substr(equals + 1);
    } else if (arg == "-f" || arg == "--filter-color") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --filter-color requires an argument\n";
        return 1;
      }
      std::string color = argv[++i];
      if (color != "red") {
        std::cerr << "Error: unsupported filter color: " << color << "\n";
        return 1;
      }
      filter = fieldedit::ColorFilter::Red;
    } else if (arg == "-p" || arg == "--pattern") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --pattern requires an argument\n";
        return 1;
      }
      pattern = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-' && pdfPath.empty()) {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }
  if (command == Command::None) {
    std::cerr << "Error: No command given\n";
    printUsage(argv[0]);
    return 1;
  }

  bool writes = command == Command::Replace || command == Command::Clear ||
                command == Command::Set;
  std::string error;
  if (!validatePdfPath(pdfPath, writes, error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  try {
    fieldedit::TemplateEditor editor(pdfPath, config);

    switch (command) {
    case Command::Generate: {
      std::vector<fieldedit::TextRun> runs = editor.findTemplates(filter, true);
      if (!editor.saveMapping(runs, commandArg)) {
        return 1;
      }
      std::cout << "Wrote " << runs.size() << " fields to " << commandArg
                << "\n";
      return 0;
    }

    case Command::Replace: {
      fieldedit::MappingFile mapping = fieldedit::readMappingFile(commandArg);
      if (!mapping.success) {
        std::cerr << "Error: " << mapping.errorMessage << "\n";
        return 1;
      }
      if (config.verbose) {
        std::cerr << "DEBUG: Loaded " << mapping.entries.size()
                  << " entries from " << commandArg << " ("
                  << mapping.nullEntries << " empty, "
                  << mapping.malformedLines << " malformed)" << std::endl;
      }
      return printReplacementReport(editor.replaceTemplates(
          fieldedit::toReplacementRequest(mapping.entries)));
    }

    case Command::Clear: {
      fieldedit::RemovalReport report = editor.removeTemplates(pattern);
      if (!report.success) {
        std::cerr << "Error: " << report.errorMessage << "\n";
        return 1;
      }
      std::cout << "Removed " << report.removed << " placeholders ("
                << report.reinserted << " remainders kept)\n";
      for (const std::string &text : report.texts) {
        std::cout << "  " << text << "\n";
      }
      return 0;
    }

    case Command::List: {
      std::vector<fieldedit::TextRun> runs =
          editor.findTemplates(fieldedit::ColorFilter::Red, true);
      for (const std::string &line : fieldedit::formatFieldList(
               runs, fieldedit::loadAliasMap(pdfPath))) {
        std::cout << line << "\n";
      }
      return 0;
    }

    case Command::Set:
      return printReplacementReport(editor.replaceTemplates(
          fieldedit::resolveAliases(fields, fieldedit::loadAliasMap(pdfPath))));

    case Command::None:
      break;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 1;
}
