#include "pattern/pattern_factory.h"

#include <optional>
#include <utility>

#include "util/exception.h"
#include "util/log.h"

namespace cadence {

std::shared_ptr<const BandTemplates> TemplateLibrary::get(TempoBand band) const {
  const auto& entry = entries_[band_index(band)];
  CADENCE_CHECK_MSG(entry != nullptr, ErrorCode::InvalidState,
                    std::string("Templates not loaded for band ") + band_key(band));
  return entry;
}

void TemplateLibrary::set(std::shared_ptr<const BandTemplates> templates) {
  CADENCE_CHECK(templates != nullptr, ErrorCode::InvalidParameter);
  size_t index = band_index(templates->band);
  entries_[index] = std::move(templates);
}

PatternFactory::PatternFactory(const PatternConfig& config, TemplateStore& store)
    : config_(config), store_(store) {
  CADENCE_CHECK_MSG(config.sample_rate > 0 && config.width > 0, ErrorCode::InvalidParameter,
                    "Pattern sample rate and width must be positive");
  CADENCE_CHECK_MSG(config.coarse_step > 0.0 && config.fine_step > 0.0,
                    ErrorCode::InvalidParameter, "Pattern steps must be positive");
}

BandTemplates PatternFactory::generate(TempoBand band) const {
  int base = band_base_bpm(band);
  return BandTemplates{band, TemplateGrid::generate(base, Resolution::Coarse, config_),
                       TemplateGrid::generate(base, Resolution::Fine, config_)};
}

std::shared_ptr<const BandTemplates> PatternFactory::load_or_generate(TempoBand band) {
  auto templates = std::make_shared<BandTemplates>();
  templates->band = band;
  templates->coarse = load_grid(band, Resolution::Coarse);
  templates->fine = load_grid(band, Resolution::Fine);
  return templates;
}

TemplateLibrary PatternFactory::load_all() {
  TemplateLibrary library;
  for (TempoBand band : kAllBands) {
    library.set(load_or_generate(band));
  }
  return library;
}

TemplateGrid PatternFactory::load_grid(TempoBand band, Resolution resolution) {
  std::optional<TemplateGrid> cached;
  try {
    cached = store_.load(band, resolution);
  } catch (const CadenceException& e) {
    if (e.code() != ErrorCode::InvalidFormat) {
      log::logger()->error("Error loading {} templates for {}: {}", resolution_name(resolution),
                           band_key(band), e.what());
      throw;
    }
    log::logger()->warn("Discarding corrupt template cache: {}", e.what());
  }

  if (cached && !matches_config(*cached, band, resolution)) {
    log::logger()->warn("Cached {} templates for {} do not match the configuration",
                        resolution_name(resolution), band_key(band));
    cached.reset();
  }

  if (cached) {
    log::logger()->debug("Loaded {} templates for {}", resolution_name(resolution),
                         band_key(band));
    return std::move(*cached);
  }

  log::logger()->info("Generating {} templates for {}", resolution_name(resolution),
                      band_key(band));
  TemplateGrid grid = TemplateGrid::generate(band_base_bpm(band), resolution, config_);
  store_.save(band, resolution, grid);
  return grid;
}

bool PatternFactory::matches_config(const TemplateGrid& grid, TempoBand band,
                                    Resolution resolution) const {
  return grid.base_bpm() == band_base_bpm(band) && grid.resolution() == resolution &&
         grid.sample_rate() == config_.sample_rate && grid.step() == config_.step(resolution) &&
         grid.candidate_count() == config_.candidate_count(resolution) &&
         grid.window_count() == config_.window_count();
}

}  // namespace cadence
