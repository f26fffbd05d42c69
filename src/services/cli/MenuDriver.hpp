#pragma once
#include <atomic>
#include <iosfwd>
#include <string>

namespace vault {

class VaultController;
struct OpResult;

// Read-eval-print menu over the vault operations. Reads choices from `in`,
// writes prompts and results to `out`. A failed operation is reported and
// the loop carries on; only Exit, end of input or `stop` end it.
class MenuDriver {
public:
  MenuDriver(VaultController& vault, std::istream& in, std::ostream& out,
             const std::atomic<bool>* stop = nullptr)
    : vault_(vault), in_(in), out_(out), stop_(stop) {}

  void run();

private:
  bool prompt(const std::string& question, std::string& answer);
  void printMenu();
  void show(const OpResult& r, bool withRecords);
  void showBackup(const OpResult& r);

  // Each returns false when input ran out mid-action.
  bool addRecord();
  bool updateRecord();
  bool deleteRecord();
  bool listRecords();
  bool searchRecords();
  bool sortRecords();
  bool exportData();
  bool viewStatistics();

  bool stopped() const { return stop_ && stop_->load(); }

  VaultController&         vault_;
  std::istream&            in_;
  std::ostream&            out_;
  const std::atomic<bool>* stop_;
};

} // namespace vault
