#pragma once

/// @file template_store.h
/// @brief Persistence for generated template grids.

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "pattern/tempo_band.h"
#include "pattern/template_grid.h"

namespace cadence {

/// @brief Storage backend for template grids.
class TemplateStore {
 public:
  virtual ~TemplateStore() = default;

  /// @brief Loads a cached grid.
  /// @param band Tempo band
  /// @param resolution Coarse or fine
  /// @return The grid, or std::nullopt if nothing is cached
  /// @throws CadenceException with InvalidFormat if the cached data is corrupt,
  ///         IoError on any other read failure
  virtual std::optional<TemplateGrid> load(TempoBand band, Resolution resolution) = 0;

  /// @brief Stores a grid, replacing any previous entry.
  /// @throws CadenceException with IoError on write failure
  virtual void save(TempoBand band, Resolution resolution, const TemplateGrid& grid) = 0;
};

/// @brief Stores grids as binary files in a directory.
/// @details File names are "<base>_bpm_pattern.bin" (coarse) and
///          "<base>_bpm_pattern_fine.bin" (fine). The layout is private to this
///          class: a fixed header followed by the raw int32 rows.
class FileTemplateStore : public TemplateStore {
 public:
  /// @brief Creates a store rooted at a directory (created on first save).
  explicit FileTemplateStore(std::string directory);

  std::optional<TemplateGrid> load(TempoBand band, Resolution resolution) override;
  void save(TempoBand band, Resolution resolution, const TemplateGrid& grid) override;

  /// @brief Returns the file path used for a band and resolution.
  std::string path_for(TempoBand band, Resolution resolution) const;

  const std::string& directory() const { return directory_; }

 private:
  std::string directory_;
};

/// @brief Keeps grids in memory. Counts loads and saves.
class MemoryTemplateStore : public TemplateStore {
 public:
  std::optional<TemplateGrid> load(TempoBand band, Resolution resolution) override;
  void save(TempoBand band, Resolution resolution, const TemplateGrid& grid) override;

  int load_count() const { return load_count_; }
  int save_count() const { return save_count_; }

 private:
  std::map<std::pair<TempoBand, Resolution>, TemplateGrid> grids_;
  int load_count_ = 0;
  int save_count_ = 0;
};

}  // namespace cadence
