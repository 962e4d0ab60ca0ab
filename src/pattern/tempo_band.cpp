#include "pattern/tempo_band.h"

#include "util/exception.h"

namespace cadence {

namespace {

struct BandInfo {
  TempoBand band;
  int base_bpm;
  const char* key;
  const char* ascii_key;
};

// Keys use U+2013 EN DASH between the bounds.
constexpr std::array<BandInfo, 3> kBandInfo = {{
    {TempoBand::Band60To160, 60, "60\xE2\x80\x93" "160", "60-160"},
    {TempoBand::Band130To230, 130, "130\xE2\x80\x93" "230", "130-230"},
    {TempoBand::Band210To300, 210, "210\xE2\x80\x93" "300", "210-300"},
}};

const BandInfo& info(TempoBand band) { return kBandInfo[band_index(band)]; }

}  // namespace

size_t band_index(TempoBand band) {
  switch (band) {
    case TempoBand::Band60To160:
      return 0;
    case TempoBand::Band130To230:
      return 1;
    case TempoBand::Band210To300:
      return 2;
  }
  throw CadenceException(ErrorCode::InvalidParameter, "Unknown tempo band");
}

int band_base_bpm(TempoBand band) { return info(band).base_bpm; }

const char* band_key(TempoBand band) { return info(band).key; }

TempoBand band_from_key(const std::string& key) {
  for (const auto& entry : kBandInfo) {
    if (key == entry.key || key == entry.ascii_key) {
      return entry.band;
    }
  }
  throw CadenceException(ErrorCode::InvalidParameter, "Unknown tempo range: " + key);
}

}  // namespace cadence
