#include "MenuDriver.hpp"

#include <filesystem>
#include <istream>
#include <ostream>

#include "core/format/RecordFormat.hpp"
#include "core/record/RecordId.hpp"
#include "core/vault/VaultController.hpp"

namespace vault {

bool MenuDriver::prompt(const std::string& question, std::string& answer) {
  out_ << question << std::flush;
  if (stopped() || !std::getline(in_, answer)) return false;
  answer = trim(answer);
  return true;
}

void MenuDriver::printMenu() {
  out_ << "\n==== Vault Menu ====\n"
       << "1. Add Record\n"
       << "2. Update Record\n"
       << "3. Delete Record\n"
       << "4. List All Records\n"
       << "5. Search Records\n"
       << "6. Sort Records\n"
       << "7. Export Data\n"
       << "8. View Vault Statistics\n"
       << "0. Exit\n";
}

void MenuDriver::show(const OpResult& r, bool withRecords) {
  if (withRecords && !r.records.empty()) {
    out_ << "\n" << r.message << "\n" << render_records(r.records);
  } else {
    out_ << r.message << "\n";
  }
}

void MenuDriver::showBackup(const OpResult& r) {
  if (r.ok() && !r.artifact.empty()) {
    out_ << "Backup created: " << std::filesystem::path(r.artifact).filename().string() << "\n";
  }
}

void MenuDriver::run() {
  using Action = bool (MenuDriver::*)();
  static const struct { const char* key; Action action; } kActions[] = {
    {"1", &MenuDriver::addRecord},
    {"2", &MenuDriver::updateRecord},
    {"3", &MenuDriver::deleteRecord},
    {"4", &MenuDriver::listRecords},
    {"5", &MenuDriver::searchRecords},
    {"6", &MenuDriver::sortRecords},
    {"7", &MenuDriver::exportData},
    {"8", &MenuDriver::viewStatistics},
  };

  while (!stopped()) {
    printMenu();
    std::string choice;
    if (!prompt("Select an option: ", choice)) break;
    if (choice == "0") {
      out_ << "Exiting application...\n";
      return;
    }

    Action action = nullptr;
    for (const auto& a : kActions) {
      if (choice == a.key) action = a.action;
    }
    if (!action) {
      out_ << "Invalid selection. Please try again.\n";
      continue;
    }

    if (!(this->*action)()) break;

    std::string ignored;
    if (!prompt("\nPress Enter to return to menu...", ignored)) break;
  }
  out_ << "\nGracefully shutting down...\n";
}

bool MenuDriver::addRecord() {
  std::string name, details;
  if (!prompt("Enter record name: ", name)) return false;
  if (name.empty()) {
    out_ << "Name is required. Aborting add operation.\n";
    return true;
  }
  if (!prompt("Enter record details (optional): ", details)) return false;
  const auto r = vault_.addRecord(name, details);
  show(r, true);
  showBackup(r);
  return true;
}

bool MenuDriver::updateRecord() {
  std::string id;
  if (!prompt("Enter record ID to update: ", id)) return false;

  const auto found = vault_.searchRecords("id", id);
  if (!found.ok()) { show(found, false); return true; }
  if (found.records.empty()) {
    out_ << "Record not found.\n";
    return true;
  }
  const Record& current = found.records.front();

  std::string name, details;
  if (!prompt("Enter new name (" + current.name + "): ", name)) return false;
  if (!prompt("Enter new details (" +
              (current.details.empty() ? std::string(kNotAvailable) : current.details) + "): ",
              details)) return false;
  show(vault_.updateRecord(id, name, details), true);
  return true;
}

bool MenuDriver::deleteRecord() {
  std::string id, confirm;
  if (!prompt("Enter record ID to delete: ", id)) return false;
  if (!is_valid_record_id(id)) {
    out_ << "Invalid ID format.\n";
    return true;
  }
  if (!prompt("Are you sure you want to delete this record? (y/N): ", confirm)) return false;
  const auto r = vault_.deleteRecord(id, confirm == "y" || confirm == "Y");
  show(r, false);
  showBackup(r);
  return true;
}

bool MenuDriver::listRecords() {
  show(vault_.listRecords(), true);
  return true;
}

bool MenuDriver::searchRecords() {
  std::string mode, term;
  out_ << "\nSearch by:\n1. Name\n2. ID\n";
  if (!prompt("Select an option: ", mode)) return false;
  if (mode == "1") {
    if (!prompt("Enter name to search: ", term)) return false;
  } else if (mode == "2") {
    if (!prompt("Enter ID to search: ", term)) return false;
  }
  show(vault_.searchRecords(mode, term), true);
  return true;
}

bool MenuDriver::sortRecords() {
  std::string field, direction;
  out_ << "\nSort by:\n1. Name\n2. Creation Date\n";
  if (!prompt("Select an option: ", field)) return false;
  if (field != "1" && field != "2") {
    out_ << "Invalid selection.\n";
    return true;
  }
  out_ << "\nOrder:\n1. Ascending\n2. Descending\n";
  if (!prompt("Select an option: ", direction)) return false;
  show(vault_.sortRecords(field, direction), true);
  return true;
}

bool MenuDriver::exportData() {
  show(vault_.exportData(), false);
  return true;
}

bool MenuDriver::viewStatistics() {
  const auto r = vault_.viewStatistics();
  out_ << "\n";
  show(r, false);
  return true;
}

} // namespace vault
