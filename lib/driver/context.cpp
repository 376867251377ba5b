// surn/driver/context.cpp
#include "surn/driver/context.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace surn
{

// ============================================================================
// SourceOrigin
// ============================================================================

SourceOrigin SourceOrigin::from_path(std::filesystem::path path)
{
  SourceOrigin origin;
  origin.path_ = std::move(path);
  return origin;
}

SourceOrigin SourceOrigin::from_virtual(std::string name, std::string contents)
{
  SourceOrigin origin;
  origin.path_ = name;
  origin.virtual_name_ = std::move(name);
  origin.contents_ = std::move(contents);
  origin.is_virtual_ = true;
  return origin;
}

std::optional<std::string> SourceOrigin::get_contents() const
{
  if (is_virtual_) {
    return contents_;
  }
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

std::string SourceOrigin::name() const
{
  return is_virtual_ ? virtual_name_ : path_.string();
}

// ============================================================================
// ContextStore
// ============================================================================

Context & ContextStore::new_context(SourceOrigin origin)
{
  const ContextId id = next_context_id();
  slots_.emplace_back(std::in_place, id, std::move(origin));
  return *slots_.back();
}

bool ContextStore::add_context(Context context)
{
  if (context.id() != next_context_id()) {
    return false;
  }
  slots_.emplace_back(std::move(context));
  return true;
}

Context * ContextStore::get(ContextId id) noexcept
{
  if (id.value >= slots_.size() || !slots_[id.value]) {
    return nullptr;
  }
  return &*slots_[id.value];
}

const Context * ContextStore::get(ContextId id) const noexcept
{
  if (id.value >= slots_.size() || !slots_[id.value]) {
    return nullptr;
  }
  return &*slots_[id.value];
}

bool ContextStore::remove(ContextId id)
{
  Context * ctx = get(id);
  if (!ctx) {
    return false;
  }
  slots_[id.value].reset();
  globals_.erase(std::remove(globals_.begin(), globals_.end(), id), globals_.end());
  return true;
}

size_t ContextStore::size() const noexcept
{
  return static_cast<size_t>(
    std::count_if(slots_.begin(), slots_.end(), [](const auto & slot) { return slot.has_value(); }));
}

void ContextStore::add_global(ContextId id)
{
  if (std::find(globals_.begin(), globals_.end(), id) == globals_.end()) {
    globals_.push_back(id);
  }
}

}  // namespace surn
