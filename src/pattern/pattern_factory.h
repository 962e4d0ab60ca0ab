#pragma once

/// @file pattern_factory.h
/// @brief Builds, caches and loads the template pairs of each tempo band.

#include <array>
#include <memory>

#include "pattern/tempo_band.h"
#include "pattern/template_grid.h"
#include "pattern/template_store.h"

namespace cadence {

/// @brief Coarse and fine template grids of one band.
struct BandTemplates {
  TempoBand band;
  TemplateGrid coarse;
  TemplateGrid fine;

  int base_bpm() const { return band_base_bpm(band); }
};

/// @brief Loaded template pairs, indexed by band.
/// @details Entries are shared and immutable, so a search holding one keeps
///          it alive after a band switch.
class TemplateLibrary {
 public:
  /// @brief Returns true if the band has been loaded.
  bool has(TempoBand band) const { return entries_[band_index(band)] != nullptr; }

  /// @brief Returns the templates of a band.
  /// @throws CadenceException with InvalidState if the band is not loaded
  std::shared_ptr<const BandTemplates> get(TempoBand band) const;

  /// @brief Adds or replaces the templates of a band.
  void set(std::shared_ptr<const BandTemplates> templates);

 private:
  std::array<std::shared_ptr<const BandTemplates>, kAllBands.size()> entries_;
};

/// @brief Generates template grids and keeps them in a store.
class PatternFactory {
 public:
  /// @brief Constructs a factory.
  /// @param config Pattern configuration
  /// @param store Cache backend (not owned, must outlive the factory)
  PatternFactory(const PatternConfig& config, TemplateStore& store);

  /// @brief Generates both grids of a band without touching the store.
  BandTemplates generate(TempoBand band) const;

  /// @brief Loads a band from the store, regenerating missing or corrupt grids.
  /// @details Regenerated grids are written back. A cached grid whose shape or
  ///          sample rate differs from the configuration counts as corrupt.
  /// @throws CadenceException on store I/O failures other than corruption
  std::shared_ptr<const BandTemplates> load_or_generate(TempoBand band);

  /// @brief Loads every band.
  TemplateLibrary load_all();

  const PatternConfig& config() const { return config_; }

 private:
  TemplateGrid load_grid(TempoBand band, Resolution resolution);
  bool matches_config(const TemplateGrid& grid, TempoBand band, Resolution resolution) const;

  PatternConfig config_;
  TemplateStore& store_;
};

}  // namespace cadence
