#include "TransactionStore.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <fstream>
#include <random>
#include <set>
#include <string_view>

#include "Executor.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

namespace {
OrganizerError fatal(std::string message) {
  return OrganizerError{OrganizerError::Kind::FATAL, std::move(message)};
}

bool newer_first(const StoredTransaction& a, const StoredTransaction& b) {
  if (a.record.created_at != b.record.created_at) {
    return a.record.created_at > b.record.created_at;
  }
  return a.record.id > b.record.id;
}

// Ids name files directly inside the undo directory.
bool is_valid_record_id(std::string_view id) {
  return !id.empty() && id != "." && id != ".." &&
         id.find_first_of("/\\") == std::string_view::npos;
}

std::string string_field(const json& raw, const char* key) {
  if (raw.contains(key) && raw[key].is_string()) {
    return raw[key].get<std::string>();
  }
  return {};
}

StoredTransaction read_record(const fs::path& file) {
  StoredTransaction stored;
  stored.file = file;
  stored.record.id = safe_path_to_string(file.stem());

  std::ifstream in(file);
  if (!in) {
    stored.load_error = "cannot read file";
    return stored;
  }
  json raw;
  try {
    raw = json::parse(in);
  } catch (const json::exception& e) {
    stored.load_error = e.what();
    return stored;
  }
  if (!raw.is_object()) {
    stored.load_error = "not a JSON object";
    return stored;
  }
  try {
    stored.record = raw.get<TransactionRecord>();
  } catch (const json::exception& e) {
    // Keep what identifies the record so it can still be listed and deleted.
    stored.load_error = e.what();
    if (const std::string id = string_field(raw, "id"); !id.empty()) {
      stored.record.id = id;
    }
    stored.record.created_at = string_field(raw, "created_at");
    stored.record.source_dir = path_from_utf8(string_field(raw, "source_dir"));
    stored.record.destination_dir =
        path_from_utf8(string_field(raw, "destination_dir"));
    if (const std::string undone = string_field(raw, "undone_at");
        !undone.empty()) {
      stored.record.undone_at = undone;
    }
  }
  return stored;
}

std::expected<StoredTransaction, OrganizerError> require_valid(
    StoredTransaction stored) {
  if (stored.load_error) {
    return std::unexpected(fatal(std::format(
        "invalid undo record '{}': {}", safe_path_to_string(stored.file),
        *stored.load_error)));
  }
  return stored;
}

// Reads exactly `width` ASCII digits at `pos`.
std::optional<int> read_number(std::string_view text, std::size_t& pos,
                               std::size_t width) {
  if (pos + width > text.size()) return std::nullopt;
  const std::string_view digits = text.substr(pos, width);
  if (!std::all_of(digits.begin(), digits.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  int value = 0;
  if (std::from_chars(digits.data(), digits.data() + digits.size(), value).ec !=
      std::errc{}) {
    return std::nullopt;
  }
  pos += width;
  return value;
}

bool read_separator(std::string_view text, std::size_t& pos,
                    std::string_view accepted) {
  if (pos >= text.size() || accepted.find(text[pos]) == std::string_view::npos) {
    return false;
  }
  ++pos;
  return true;
}
}  // namespace

std::string make_transaction_id(TimePoint now) {
  static std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<std::uint32_t> dist;
  return std::format("{:%Y%m%d-%H%M%S}-{:08x}",
                     std::chrono::floor<std::chrono::seconds>(now), dist(rng));
}

std::string format_iso8601(TimePoint tp) {
  return std::format("{:%FT%T}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

// Accepts "YYYY-MM-DDTHH:MM:SS", an optional fraction, and an optional "Z" or
// "+HH:MM"/"-HH:MM" suffix.
std::optional<TimePoint> parse_iso8601(const std::string& text) {
  std::size_t pos = 0;
  const auto y = read_number(text, pos, 4);
  if (!y || !read_separator(text, pos, "-")) return std::nullopt;
  const auto mo = read_number(text, pos, 2);
  if (!mo || !read_separator(text, pos, "-")) return std::nullopt;
  const auto d = read_number(text, pos, 2);
  if (!d || !read_separator(text, pos, "T ")) return std::nullopt;
  const auto h = read_number(text, pos, 2);
  if (!h || !read_separator(text, pos, ":")) return std::nullopt;
  const auto mi = read_number(text, pos, 2);
  if (!mi || !read_separator(text, pos, ":")) return std::nullopt;
  const auto s = read_number(text, pos, 2);
  if (!s) return std::nullopt;

  const std::chrono::year_month_day ymd{
      std::chrono::year{*y}, std::chrono::month{static_cast<unsigned>(*mo)},
      std::chrono::day{static_cast<unsigned>(*d)}};
  if (!ymd.ok() || *h > 23 || *mi > 59 || *s > 60) return std::nullopt;

  std::chrono::microseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long long value = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        value = value * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    while (digits < 6) {
      value *= 10;
      ++digits;
    }
    fraction = std::chrono::microseconds{value};
  }

  std::chrono::minutes offset{0};
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const bool negative = text[pos] == '-';
    ++pos;
    const auto oh = read_number(text, pos, 2);
    if (!oh || !read_separator(text, pos, ":")) return std::nullopt;
    const auto om = read_number(text, pos, 2);
    if (!om) return std::nullopt;
    offset = std::chrono::hours{*oh} + std::chrono::minutes{*om};
    if (negative) offset = -offset;
  }

  const auto local = std::chrono::sys_days{ymd} + std::chrono::hours{*h} +
                     std::chrono::minutes{*mi} + std::chrono::seconds{*s} +
                     fraction;
  return std::chrono::time_point_cast<TimePoint::duration>(local - offset);
}

TransactionStore::TransactionStore(fs::path undo_dir)
    : m_undo_dir(std::move(undo_dir)) {}

fs::path TransactionStore::path_for(const std::string& id) const {
  return m_undo_dir / path_from_utf8(id + ".json");
}

std::expected<TransactionRecord, OrganizerError> TransactionStore::record(
    const fs::path& source_dir, const fs::path& destination_dir,
    std::vector<MoveRecord> moves, std::vector<fs::path> removed_empty_dirs) {
  const TimePoint now = std::chrono::system_clock::now();
  TransactionRecord record;
  record.id = make_transaction_id(now);
  while (fs::exists(path_for(record.id))) {
    record.id = make_transaction_id(now);
  }
  record.created_at = format_iso8601(now);
  record.source_dir = source_dir;
  record.destination_dir = destination_dir;
  record.moves = std::move(moves);
  record.removed_empty_dirs = std::move(removed_empty_dirs);

  const fs::path file = path_for(record.id);
  if (!IOManager::write_json_file(file, json(record))) {
    return std::unexpected(
        fatal(std::format("failed to write undo record into '{}'",
                          safe_path_to_string(m_undo_dir))));
  }
  IOManager::log(std::format("UNDO RECORD: '{}'", safe_path_to_string(file)));
  return record;
}

std::vector<StoredTransaction> TransactionStore::load_all() const {
  std::vector<StoredTransaction> records;
  std::error_code ec;
  if (!fs::is_directory(m_undo_dir, ec)) return records;

  for (const auto& entry : fs::directory_iterator(m_undo_dir, ec)) {
    if (entry.path().extension() != ".json") continue;
    StoredTransaction stored = read_record(entry.path());
    if (stored.load_error) {
      IOManager::log(std::format("Warning: malformed undo record '{}': {}",
                                 safe_path_to_string(entry.path()),
                                 *stored.load_error));
    }
    records.push_back(std::move(stored));
  }
  std::sort(records.begin(), records.end(), newer_first);
  return records;
}

std::vector<StoredTransaction> TransactionStore::list() const {
  return load_all();
}

std::expected<StoredTransaction, OrganizerError> TransactionStore::select(
    const std::optional<std::string>& id) const {
  if (id) {
    if (!is_valid_record_id(*id)) {
      return std::unexpected(fatal(std::format("invalid undo id: {}", *id)));
    }
    const fs::path file = path_for(*id);
    std::error_code ec;
    if (fs::exists(file, ec)) {
      return require_valid(read_record(file));
    }
    for (auto& stored : load_all()) {
      if (stored.record.id == *id) return require_valid(std::move(stored));
    }
    return std::unexpected(fatal(std::format("undo record not found: {}", *id)));
  }

  for (auto& stored : load_all()) {
    if (!stored.record.undone_at) return require_valid(std::move(stored));
  }
  return std::unexpected(fatal(std::format(
      "no pending undo record in '{}'", safe_path_to_string(m_undo_dir))));
}

std::expected<UndoResult, OrganizerError> TransactionStore::undo(
    const std::optional<std::string>& id, bool apply) {
  auto selected = select(id);
  if (!selected) {
    return std::unexpected(selected.error());
  }
  const fs::path file = selected->file;
  TransactionRecord record = std::move(selected->record);
  if (record.undone_at) {
    return std::unexpected(fatal(std::format(
        "undo record already applied: {} (at {})", record.id,
        *record.undone_at)));
  }

  IOManager::log(std::format("{} undo of {} ({} moves)",
                             apply ? "Starting" : "Previewing", record.id,
                             record.moves.size()));
  UndoResult result;
  std::set<fs::path> claimed;
  for (auto move = record.moves.rbegin(); move != record.moves.rend(); ++move) {
    const fs::path& current = move->to;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(current, ec))) {
      ++result.errors;
      IOManager::log(std::format("UNDO source missing: '{}'",
                                 safe_path_to_string(current)));
      continue;
    }
    auto [target, renamed] = generate_unique_path(move->from, claimed);
    claimed.insert(target);
    if (renamed) ++result.collisions;

    if (!apply) {
      IOManager::log(std::format("DRY-RUN UNDO: '{}' -> '{}'",
                                 safe_path_to_string(current),
                                 safe_path_to_string(target)));
      continue;
    }
    if (auto moved = Executor::move_entry(current, target); !moved) {
      ++result.errors;
      IOManager::log(std::format("UNDO ERROR: {}", moved.error().message));
      continue;
    }
    ++result.restored;
    IOManager::log(std::format("UNDO MOVE: '{}' -> '{}'",
                               safe_path_to_string(current),
                               safe_path_to_string(target)));
  }

  for (const auto& dir : record.removed_empty_dirs) {
    if (!apply) {
      IOManager::log(std::format("DRY-RUN UNDO DIR CREATE: '{}'",
                                 safe_path_to_string(dir)));
      continue;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      IOManager::log(std::format("Warning: could not recreate '{}': {}",
                                 safe_path_to_string(dir), ec.message()));
    }
  }

  if (apply && result.errors == 0) {
    record.undone_at = format_iso8601(std::chrono::system_clock::now());
    if (!IOManager::write_json_file(file, json(record))) {
      ++result.errors;
      IOManager::log(
          std::format("ERROR: could not mark {} as undone", record.id));
    }
  }
  return result;
}

std::expected<int, OrganizerError> TransactionStore::remove(
    const std::optional<std::string>& id, std::optional<int> older_than_days,
    bool apply) {
  if (!id && !older_than_days) {
    return std::unexpected(fatal("specify --id or --older-than-days"));
  }
  if (id && !is_valid_record_id(*id)) {
    return std::unexpected(fatal(std::format("invalid undo id: {}", *id)));
  }
  std::optional<TimePoint> cutoff;
  if (older_than_days) {
    cutoff = std::chrono::system_clock::now() -
             std::chrono::days{*older_than_days};
  }

  int count = 0;
  for (const auto& stored : load_all()) {
    if (id && stored.record.id != *id &&
        safe_path_to_string(stored.file.stem()) != *id) {
      continue;
    }
    if (cutoff) {
      const auto created = parse_iso8601(stored.record.created_at);
      if (!created || *created >= *cutoff) continue;
    }
    if (!apply) {
      ++count;
      continue;
    }
    std::error_code ec;
    if (fs::remove(stored.file, ec)) {
      ++count;
      IOManager::log(std::format("Deleted undo record {}", stored.record.id));
    } else if (ec) {
      IOManager::log(std::format("Warning: could not delete '{}': {}",
                                 safe_path_to_string(stored.file),
                                 ec.message()));
    }
  }
  return count;
}
