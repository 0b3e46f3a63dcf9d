#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/message.hpp"

namespace agentdeck {

// Append-only NDJSON journal of messages that left the live window.
// One writer per file; the file is named after the owning process.
class HistoryBuffer {
 public:
  // Seeds the written-id set from an existing file
  explicit HistoryBuffer(std::filesystem::path path);

  // <dir>/history-<pid>.json
  static std::filesystem::path path_for_process(const std::filesystem::path &dir);

  const std::filesystem::path &path() const {
    return path_;
  }

  // Writes the messages whose id was not written before, in order.
  // Returns how many were written. Throws std::runtime_error when the file
  // cannot be opened, e.g. the directory does not exist.
  size_t append(const std::vector<Message> &messages);

  // Truncates, forgets written ids, writes messages as the whole content
  void replace(const std::vector<Message> &messages);

  // Truncates and forgets written ids
  void clear();

  // Clears, then writes a single assistant message carrying the summary
  Message append_compaction_summary(const std::string &summary);

  // Never throws: missing/empty/garbage → empty, legacy JSON array → migrated
  std::vector<Message> read() const;

  bool contains(const MessageId &id) const {
    return written_ids_.count(id) > 0;
  }

  size_t written_count() const {
    return written_ids_.size();
  }

 private:
  void truncate();
  void migrate_legacy_file();
  // Creates the file as 0600 if missing; existing files keep their mode
  void create_owner_only() const;
  void restrict_permissions() const;

  std::filesystem::path path_;
  std::unordered_set<MessageId> written_ids_;
  bool legacy_pending_ = false;
};

// Parses history file content; shared by HistoryBuffer::read and the transcript view
std::vector<Message> parse_history_content(const std::string &content, bool *is_legacy_array = nullptr);

}  // namespace agentdeck
