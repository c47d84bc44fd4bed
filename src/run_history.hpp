#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct RunRecord {
  std::string time; // local time, "YYYY-MM-DD HH:MM:SS"
  std::string path;
  std::vector<std::string> hosts;
  bool back = false;
  bool delete_extraneous = false;
  bool git_repo = false;
};

void to_json(nlohmann::json& j, const RunRecord& record);
void from_json(const nlohmann::json& j, RunRecord& record);

// Append-only log of finished syncs, one JSON object per line.
class RunHistory {
public:
  explicit RunHistory(std::filesystem::path file);

  static std::filesystem::path default_path();

  // Stamps record.time when empty. Returns false when the file could not be
  // written.
  bool append(RunRecord record) const;
  std::optional<RunRecord> last() const;
  std::vector<RunRecord> load() const;

  void print_last(std::ostream& out) const;

  const std::filesystem::path& file() const { return file_; }

private:
  std::filesystem::path file_;
};

std::string format_record(const RunRecord& record);
