/// @file template_store_test.cpp
/// @brief Tests for template persistence.

#include "pattern/template_store.h"

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>

#include "util/exception.h"
#include "util/test_fixtures.h"

using namespace cadence;
using cadence::test::TempDir;

namespace {

PatternConfig small_config() {
  PatternConfig config;
  config.sample_rate = 2000;
  return config;
}

ErrorCode load_error(FileTemplateStore& store, TempoBand band, Resolution resolution) {
  try {
    store.load(band, resolution);
  } catch (const CadenceException& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

}  // namespace

TEST_CASE("FileTemplateStore file names", "[template_store]") {
  FileTemplateStore store("patterns");
  auto coarse = std::filesystem::path(store.path_for(TempoBand::Band60To160, Resolution::Coarse));
  auto fine = std::filesystem::path(store.path_for(TempoBand::Band130To230, Resolution::Fine));

  REQUIRE(coarse.filename() == "60_bpm_pattern.bin");
  REQUIRE(fine.filename() == "130_bpm_pattern_fine.bin");
  REQUIRE(coarse.parent_path() == "patterns");
}

TEST_CASE("FileTemplateStore missing file", "[template_store]") {
  TempDir dir;
  FileTemplateStore store(dir.str());
  REQUIRE_FALSE(store.load(TempoBand::Band60To160, Resolution::Coarse).has_value());
}

TEST_CASE("FileTemplateStore save and load", "[template_store]") {
  TempDir dir;
  FileTemplateStore store((dir.path() / "nested" / "cache").string());
  auto grid = TemplateGrid::generate(130, Resolution::Fine, small_config());

  store.save(TempoBand::Band130To230, Resolution::Fine, grid);
  REQUIRE(std::filesystem::exists(store.path_for(TempoBand::Band130To230, Resolution::Fine)));

  auto loaded = store.load(TempoBand::Band130To230, Resolution::Fine);
  REQUIRE(loaded.has_value());
  REQUIRE(*loaded == grid);
  REQUIRE(loaded->at(17, 3, 9) == grid.at(17, 3, 9));
  REQUIRE_FALSE(store.load(TempoBand::Band130To230, Resolution::Coarse).has_value());
}

TEST_CASE("FileTemplateStore save overwrites", "[template_store]") {
  TempDir dir;
  FileTemplateStore store(dir.str());
  PatternConfig first = small_config();
  PatternConfig second = small_config();
  second.sample_rate = 4000;

  store.save(TempoBand::Band60To160, Resolution::Coarse,
             TemplateGrid::generate(60, Resolution::Coarse, first));
  auto grid = TemplateGrid::generate(60, Resolution::Coarse, second);
  store.save(TempoBand::Band60To160, Resolution::Coarse, grid);

  auto loaded = store.load(TempoBand::Band60To160, Resolution::Coarse);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded->sample_rate() == 4000);
  REQUIRE(*loaded == grid);
}

TEST_CASE("FileTemplateStore rejects corrupt files", "[template_store]") {
  TempDir dir;
  FileTemplateStore store(dir.str());
  auto grid = TemplateGrid::generate(60, Resolution::Coarse, small_config());
  store.save(TempoBand::Band60To160, Resolution::Coarse, grid);
  std::string path = store.path_for(TempoBand::Band60To160, Resolution::Coarse);
  auto full_size = std::filesystem::file_size(path);

  SECTION("truncated data") {
    std::filesystem::resize_file(path, full_size - 100);
    REQUIRE(load_error(store, TempoBand::Band60To160, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }

  SECTION("truncated header") {
    std::filesystem::resize_file(path, 10);
    REQUIRE(load_error(store, TempoBand::Band60To160, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }

  SECTION("trailing data") {
    std::ofstream(path, std::ios::binary | std::ios::app) << "extra";
    REQUIRE(load_error(store, TempoBand::Band60To160, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }

  SECTION("foreign file") {
    std::ofstream(path, std::ios::binary | std::ios::trunc) << "not a template grid at all....";
    REQUIRE(load_error(store, TempoBand::Band60To160, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }

  SECTION("header describing an oversized grid") {
    {
      std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
      int32_t huge = 2000000000;
      // candidate_count and window_count follow magic, version, base BPM,
      // resolution and sample rate.
      file.seekp(20);
      file.write(reinterpret_cast<const char*>(&huge), sizeof(huge));
      file.write(reinterpret_cast<const char*>(&huge), sizeof(huge));
    }
    REQUIRE(std::filesystem::file_size(path) == full_size);
    REQUIRE(load_error(store, TempoBand::Band60To160, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }

  SECTION("file renamed to another band") {
    std::filesystem::rename(path, store.path_for(TempoBand::Band210To300, Resolution::Coarse));
    REQUIRE(load_error(store, TempoBand::Band210To300, Resolution::Coarse) ==
            ErrorCode::InvalidFormat);
  }
}

TEST_CASE("MemoryTemplateStore counts accesses", "[template_store]") {
  MemoryTemplateStore store;
  auto grid = TemplateGrid::generate(210, Resolution::Coarse, small_config());

  REQUIRE_FALSE(store.load(TempoBand::Band210To300, Resolution::Coarse).has_value());
  store.save(TempoBand::Band210To300, Resolution::Coarse, grid);
  auto loaded = store.load(TempoBand::Band210To300, Resolution::Coarse);

  REQUIRE(loaded.has_value());
  REQUIRE(*loaded == grid);
  REQUIRE(store.load_count() == 2);
  REQUIRE(store.save_count() == 1);
}
