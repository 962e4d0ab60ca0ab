#include "pattern/template_store.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "util/exception.h"

namespace cadence {

namespace {

constexpr char kMagic[4] = {'C', 'D', 'T', 'G'};
constexpr uint32_t kFormatVersion = 1;

/// @brief Serialized size of FileHeader.
constexpr uint64_t kHeaderBytes =
    sizeof(kMagic) + sizeof(uint32_t) + 6 * sizeof(int32_t) + sizeof(double);

/// @brief On-disk header preceding the row data.
struct FileHeader {
  char magic[4];
  uint32_t version;
  int32_t base_bpm;
  int32_t resolution;
  int32_t sample_rate;
  int32_t candidate_count;
  int32_t window_count;
  int32_t beats_per_template;
  double step;
};

template <typename T>
bool read_value(std::istream& in, T& value) {
  in.read(reinterpret_cast<char*>(&value), sizeof(T));
  return static_cast<bool>(in);
}

template <typename T>
void write_value(std::ostream& out, const T& value) {
  out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

FileHeader read_header(std::istream& in, const std::string& path) {
  FileHeader h{};
  bool ok = true;
  in.read(h.magic, sizeof(h.magic));
  ok = ok && static_cast<bool>(in);
  ok = ok && read_value(in, h.version);
  ok = ok && read_value(in, h.base_bpm);
  ok = ok && read_value(in, h.resolution);
  ok = ok && read_value(in, h.sample_rate);
  ok = ok && read_value(in, h.candidate_count);
  ok = ok && read_value(in, h.window_count);
  ok = ok && read_value(in, h.beats_per_template);
  ok = ok && read_value(in, h.step);
  CADENCE_CHECK_MSG(ok, ErrorCode::InvalidFormat, "Truncated template header: " + path);
  CADENCE_CHECK_MSG(std::memcmp(h.magic, kMagic, sizeof(kMagic)) == 0, ErrorCode::InvalidFormat,
                    "Bad template magic: " + path);
  CADENCE_CHECK_MSG(h.version == kFormatVersion, ErrorCode::InvalidFormat,
                    "Unsupported template version: " + path);
  CADENCE_CHECK_MSG(h.beats_per_template == template_constants::kBeatsPerTemplate,
                    ErrorCode::InvalidFormat, "Unexpected template row width: " + path);
  CADENCE_CHECK_MSG(h.candidate_count > 0 && h.window_count > 0 && h.sample_rate > 0,
                    ErrorCode::InvalidFormat, "Invalid template shape: " + path);
  CADENCE_CHECK_MSG(h.resolution == static_cast<int32_t>(Resolution::Coarse) ||
                        h.resolution == static_cast<int32_t>(Resolution::Fine),
                    ErrorCode::InvalidFormat, "Invalid template resolution: " + path);
  return h;
}

}  // namespace

FileTemplateStore::FileTemplateStore(std::string directory) : directory_(std::move(directory)) {}

std::string FileTemplateStore::path_for(TempoBand band, Resolution resolution) const {
  std::string name = std::to_string(band_base_bpm(band)) + "_bpm_pattern" +
                     (resolution == Resolution::Fine ? "_fine" : "") + ".bin";
  return (std::filesystem::path(directory_) / name).string();
}

std::optional<TemplateGrid> FileTemplateStore::load(TempoBand band, Resolution resolution) {
  std::string path = path_for(band, resolution);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    CADENCE_CHECK_MSG(!ec, ErrorCode::IoError, "Cannot stat " + path + ": " + ec.message());
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  CADENCE_CHECK_MSG(file.is_open(), ErrorCode::IoError,
                    "Cannot open " + path + ": " + std::strerror(errno));

  FileHeader h = read_header(file, path);
  CADENCE_CHECK_MSG(h.base_bpm == band_base_bpm(band) &&
                        h.resolution == static_cast<int32_t>(resolution),
                    ErrorCode::InvalidFormat, "Template file does not match its name: " + path);

  // The header is untrusted until the file holds exactly the data it describes.
  uint64_t expected = kHeaderBytes + static_cast<uint64_t>(h.candidate_count) *
                                         static_cast<uint64_t>(h.window_count) *
                                         template_constants::kBeatsPerTemplate * sizeof(int32_t);
  uint64_t actual = std::filesystem::file_size(path, ec);
  CADENCE_CHECK_MSG(!ec, ErrorCode::IoError, "Cannot stat " + path + ": " + ec.message());
  CADENCE_CHECK_MSG(actual == expected, ErrorCode::InvalidFormat,
                    "Template file size does not match its header: " + path);

  TemplateGrid grid(h.base_bpm, resolution, h.sample_rate, h.step, h.candidate_count,
                    h.window_count);
  auto bytes = static_cast<std::streamsize>(grid.size() * sizeof(int32_t));
  file.read(reinterpret_cast<char*>(grid.mutable_data()), bytes);
  CADENCE_CHECK_MSG(file.gcount() == bytes, ErrorCode::InvalidFormat,
                    "Truncated template data: " + path);

  // Trailing bytes mean the writer and reader disagree on the layout.
  CADENCE_CHECK_MSG(file.peek() == std::char_traits<char>::eof(), ErrorCode::InvalidFormat,
                    "Trailing data in template file: " + path);

  return grid;
}

void FileTemplateStore::save(TempoBand band, Resolution resolution, const TemplateGrid& grid) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  CADENCE_CHECK_MSG(!ec, ErrorCode::IoError,
                    "Cannot create template directory " + directory_ + ": " + ec.message());

  std::string path = path_for(band, resolution);
  std::string tmp_path = path + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    CADENCE_CHECK_MSG(file.is_open(), ErrorCode::IoError,
                      "Cannot write " + tmp_path + ": " + std::strerror(errno));

    file.write(kMagic, sizeof(kMagic));
    write_value(file, kFormatVersion);
    write_value(file, static_cast<int32_t>(grid.base_bpm()));
    write_value(file, static_cast<int32_t>(resolution));
    write_value(file, static_cast<int32_t>(grid.sample_rate()));
    write_value(file, static_cast<int32_t>(grid.candidate_count()));
    write_value(file, static_cast<int32_t>(grid.window_count()));
    write_value(file, static_cast<int32_t>(template_constants::kBeatsPerTemplate));
    write_value(file, grid.step());
    file.write(reinterpret_cast<const char*>(grid.data()),
               static_cast<std::streamsize>(grid.size() * sizeof(int32_t)));
    file.flush();
    CADENCE_CHECK_MSG(file.good(), ErrorCode::IoError, "Failed to write " + tmp_path);
  }

  std::filesystem::rename(tmp_path, path, ec);
  CADENCE_CHECK_MSG(!ec, ErrorCode::IoError, "Cannot replace " + path + ": " + ec.message());
}

std::optional<TemplateGrid> MemoryTemplateStore::load(TempoBand band, Resolution resolution) {
  ++load_count_;
  auto it = grids_.find({band, resolution});
  if (it == grids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryTemplateStore::save(TempoBand band, Resolution resolution, const TemplateGrid& grid) {
  ++save_count_;
  grids_[{band, resolution}] = grid;
}

}  // namespace cadence
