#include "run_history.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>

#include <spdlog/fmt/fmt.h>

#include "ansi_style.hpp"
#include "log.hpp"
#include "server_config.hpp"

namespace {

std::string now_string() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

} // namespace

void to_json(nlohmann::json& j, const RunRecord& record) {
  j = nlohmann::json{
    {"time", record.time},
    {"path", record.path},
    {"hosts", record.hosts},
    {"back", record.back},
    {"delete", record.delete_extraneous},
    {"git_repo", record.git_repo}
  };
}

void from_json(const nlohmann::json& j, RunRecord& record) {
  record.time = j.value("time", "");
  record.path = j.at("path").get<std::string>();
  record.hosts = j.value("hosts", std::vector<std::string>{});
  record.back = j.value("back", false);
  record.delete_extraneous = j.value("delete", false);
  record.git_repo = j.value("git_repo", false);
}

RunHistory::RunHistory(std::filesystem::path file) : file_(std::move(file)) {}

std::filesystem::path RunHistory::default_path() {
  return lsync_dir() / "sync_log.jsonl";
}

bool RunHistory::append(RunRecord record) const {
  if(record.time.empty()) record.time = now_string();

  std::error_code ec;
  if(file_.has_parent_path()) {
    std::filesystem::create_directories(file_.parent_path(), ec);
  }
  std::ofstream out(file_, std::ios::app);
  if(!out) {
    print_err("Unable to write {}", file_.string());
    return false;
  }
  out << nlohmann::json(record).dump() << '\n';
  return static_cast<bool>(out);
}

std::vector<RunRecord> RunHistory::load() const {
  std::vector<RunRecord> records;
  std::ifstream in(file_);
  if(!in) return records;

  std::string line;
  std::size_t line_no = 0;
  while(std::getline(in, line)) {
    ++line_no;
    if(line.empty()) continue;
    try {
      records.push_back(nlohmann::json::parse(line).get<RunRecord>());
    } catch(const nlohmann::json::exception& e) {
      log_debug(nullptr, "skipping history line {} of {}: {}", line_no, file_.string(), e.what());
    }
  }
  return records;
}

std::optional<RunRecord> RunHistory::last() const {
  auto records = load();
  if(records.empty()) return std::nullopt;
  return records.back();
}

std::string format_record(const RunRecord& record) {
  std::string hosts;
  for(const auto& host : record.hosts) {
    if(!hosts.empty()) hosts += ", ";
    hosts += host;
  }
  return fmt::format("Last sync at {}: {} {} [{}] (delete={}, git_repo={})",
                     record.time,
                     record.path,
                     record.back ? "<-" : "->",
                     hosts,
                     record.delete_extraneous,
                     record.git_repo);
}

void RunHistory::print_last(std::ostream& out) const {
  auto record = last();
  if(!record) {
    out << "No previous sync recorded\n";
    return;
  }
  out << ansi::yellow_text(format_record(*record)) << '\n';
}
