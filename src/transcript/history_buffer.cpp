#include "transcript/history_buffer.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace agentdeck {

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return "";
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

bool is_blank(const std::string &s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// A crash mid-write leaves a last line without its newline
bool has_torn_tail(const fs::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open() || file.tellg() <= 0) {
    return false;
  }
  file.seekg(-1, std::ios::end);
  char last = '\n';
  file.get(last);
  return last != '\n';
}

}  // namespace

std::vector<Message> parse_history_content(const std::string &content, bool *is_legacy_array) {
  if (is_legacy_array) *is_legacy_array = false;
  if (is_blank(content)) {
    return {};
  }

  // Legacy format: the whole file is one JSON array
  auto first = content.find_first_not_of(" \t\r\n");
  if (content[first] == '[') {
    try {
      json j = json::parse(content);
      if (j.is_array()) {
        std::vector<Message> messages;
        size_t skipped = 0;
        for (size_t i = 0; i < j.size(); ++i) {
          if (!j[i].is_object()) {
            ++skipped;
            continue;
          }
          try {
            messages.push_back(Message::from_json(j[i]));
          } catch (const std::exception &e) {
            ++skipped;
            spdlog::debug("Skipping malformed legacy history entry {}: {}", i, e.what());
          }
        }
        if (skipped > 0) {
          spdlog::warn("Skipped {} malformed legacy history entr{}", skipped, skipped == 1 ? "y" : "ies");
        }
        if (is_legacy_array) *is_legacy_array = true;
        return messages;
      }
    } catch (const std::exception &e) {
      spdlog::debug("History content is not a JSON array, reading as NDJSON: {}", e.what());
    }
  }

  std::vector<Message> messages;
  std::istringstream lines(content);
  std::string line;
  size_t line_number = 0;
  size_t skipped = 0;
  while (std::getline(lines, line)) {
    ++line_number;
    if (is_blank(line)) continue;
    try {
      json j = json::parse(line);
      if (!j.is_object()) {
        ++skipped;
        continue;
      }
      messages.push_back(Message::from_json(j));
    } catch (const std::exception &e) {
      ++skipped;
      spdlog::debug("Skipping malformed history line {}: {}", line_number, e.what());
    }
  }
  if (skipped > 0) {
    spdlog::warn("Skipped {} malformed history line(s)", skipped);
  }
  return messages;
}

HistoryBuffer::HistoryBuffer(fs::path path) : path_(std::move(path)) {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return;
  }
  bool legacy = false;
  for (const auto &msg : parse_history_content(read_file(path_), &legacy)) {
    written_ids_.insert(msg.id());
  }
  legacy_pending_ = legacy;
  spdlog::debug("History buffer {} opened with {} entries{}", path_.string(), written_ids_.size(),
                legacy ? " (legacy array)" : "");
}

fs::path HistoryBuffer::path_for_process(const fs::path &dir) {
  return dir / ("history-" + std::to_string(::getpid()) + ".json");
}

size_t HistoryBuffer::append(const std::vector<Message> &messages) {
  if (legacy_pending_) {
    migrate_legacy_file();
  }

  std::vector<const Message *> fresh;
  std::unordered_set<MessageId> batch_ids;
  for (const auto &msg : messages) {
    if (written_ids_.count(msg.id()) || !batch_ids.insert(msg.id()).second) continue;
    fresh.push_back(&msg);
  }
  if (fresh.empty()) {
    return 0;
  }

  create_owner_only();
  bool torn = has_torn_tail(path_);
  std::ofstream file(path_, std::ios::app | std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open history buffer for append: " + path_.string());
  }
  restrict_permissions();

  if (torn) {
    spdlog::warn("History buffer {} ends in a partial line, starting a new one", path_.string());
    file << '\n';
  }
  for (const auto *msg : fresh) {
    file << msg->to_json().dump() << '\n';
  }
  file.flush();
  if (file.fail()) {
    throw std::runtime_error("Failed to write history buffer: " + path_.string());
  }

  for (const auto *msg : fresh) {
    written_ids_.insert(msg->id());
  }
  return fresh.size();
}

void HistoryBuffer::replace(const std::vector<Message> &messages) {
  truncate();
  append(messages);
}

void HistoryBuffer::clear() {
  truncate();
}

Message HistoryBuffer::append_compaction_summary(const std::string &summary) {
  clear();
  Message marker = Message::assistant(summary);
  marker.set_id(make_id("compact"));
  append({marker});
  spdlog::info("History buffer compacted into {}", marker.id());
  return marker;
}

std::vector<Message> HistoryBuffer::read() const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return {};
  }
  return parse_history_content(read_file(path_));
}

void HistoryBuffer::truncate() {
  create_owner_only();
  std::ofstream file(path_, std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to truncate history buffer: " + path_.string());
  }
  restrict_permissions();
  written_ids_.clear();
  legacy_pending_ = false;
}

void HistoryBuffer::migrate_legacy_file() {
  auto messages = parse_history_content(read_file(path_));
  spdlog::info("Migrating legacy history buffer {} ({} entries) to NDJSON", path_.string(), messages.size());
  truncate();
  append(messages);
}

void HistoryBuffer::create_owner_only() const {
  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw std::runtime_error("Failed to create history buffer " + path_.string() + ": " + std::strerror(errno));
  }
  ::close(fd);
}

void HistoryBuffer::restrict_permissions() const {
  std::error_code ec;
  fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    spdlog::warn("Failed to restrict permissions of {}: {}", path_.string(), ec.message());
  }
}

}  // namespace agentdeck
