// surn/driver/context.hpp - Per-file compilation bookkeeping
//
// A Context is created for every source handed to the parser. It records
// where the text came from and hands out file-local node ids. Contexts live
// in a ContextStore arena addressed by ContextId.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "surn/basic/source_manager.hpp"

namespace surn
{

// ============================================================================
// ContextId
// ============================================================================

/// Index of a Context inside its ContextStore.
struct ContextId
{
  uint32_t value = 0;

  [[nodiscard]] constexpr bool operator==(ContextId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(ContextId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceOrigin
// ============================================================================

/**
 * Where a compilation unit's text comes from: a file on disk, or an
 * in-memory script with a caller-chosen name.
 */
class SourceOrigin
{
public:
  [[nodiscard]] static SourceOrigin from_path(std::filesystem::path path);
  [[nodiscard]] static SourceOrigin from_virtual(std::string name, std::string contents);

  /// Full text. Reads the file for on-disk origins; std::nullopt if that fails.
  [[nodiscard]] std::optional<std::string> get_contents() const;

  [[nodiscard]] bool is_virtual() const noexcept { return is_virtual_; }

  /// Display name: the path for files, the given name for virtual sources.
  [[nodiscard]] std::string name() const;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

private:
  SourceOrigin() = default;

  std::filesystem::path path_;
  std::string virtual_name_;
  std::string contents_;
  bool is_virtual_ = false;
};

// ============================================================================
// Context
// ============================================================================

class Context
{
public:
  Context(ContextId id, SourceOrigin origin) : id_(id), origin_(std::move(origin)) {}

  [[nodiscard]] ContextId id() const noexcept { return id_; }
  [[nodiscard]] const SourceOrigin & origin() const noexcept { return origin_; }

  /// Registered file backing this context (set by the parser facade).
  [[nodiscard]] FileId file_id() const noexcept { return file_id_; }
  void set_file_id(FileId id) noexcept { file_id_ = id; }

  /// Next file-local node id. The first call returns 1.
  uint32_t get_next_local_id() noexcept { return ++last_local_id_; }

private:
  ContextId id_;
  SourceOrigin origin_;
  FileId file_id_ = FileId::invalid();
  uint32_t last_local_id_ = 0;
};

// ============================================================================
// ContextStore
// ============================================================================

/**
 * Arena of contexts indexed by ContextId.
 *
 * Ids are never reused: `remove` leaves a tombstone so that stale ids fail
 * lookups instead of aliasing a newer context. Single-writer.
 */
class ContextStore
{
public:
  /// Id the next `new_context` call will assign.
  [[nodiscard]] ContextId next_context_id() const noexcept
  {
    return ContextId{static_cast<uint32_t>(slots_.size())};
  }

  /// Allocate a context for `origin`. The reference is invalidated by the next insertion.
  Context & new_context(SourceOrigin origin);

  /// Insert a context built elsewhere. Fails unless its id is `next_context_id()`.
  bool add_context(Context context);

  [[nodiscard]] Context * get(ContextId id) noexcept;
  [[nodiscard]] const Context * get(ContextId id) const noexcept;
  [[nodiscard]] bool contains(ContextId id) const noexcept { return get(id) != nullptr; }

  /// Drop a context. Returns false if it was already gone.
  bool remove(ContextId id);

  /// Number of live contexts.
  [[nodiscard]] size_t size() const noexcept;

  /// Contexts whose declarations are visible to every file.
  [[nodiscard]] const std::vector<ContextId> & globals() const noexcept { return globals_; }
  void add_global(ContextId id);

private:
  std::vector<std::optional<Context>> slots_;
  std::vector<ContextId> globals_;
};

}  // namespace surn
