#include "fixtures/fake_catalog.hpp"

#include "fixtures/sample_assets.hpp"

namespace slide_reel::tests::fixtures {

void FakeCatalog::add_soundtrack(SoundtrackEntry entry, Blob data) {
  files_[entry.file_ref] = std::move(data);
  soundtracks_[entry.id] = std::move(entry);
}

void FakeCatalog::add_filter(FilterEntry entry, Blob data) {
  files_[entry.file_ref] = std::move(data);
  filters_[entry.id] = std::move(entry);
}

std::optional<SoundtrackEntry>
FakeCatalog::find_soundtrack(const std::string &id) const {
  auto it = soundtracks_.find(id);
  if (it == soundtracks_.end())
    return std::nullopt;
  return it->second;
}

std::optional<FilterEntry> FakeCatalog::find_filter(const std::string &id) const {
  auto it = filters_.find(id);
  if (it == filters_.end())
    return std::nullopt;
  return it->second;
}

bool FakeCatalog::fetch(const std::string &file_ref, Blob &out) const {
  auto it = files_.find(file_ref);
  if (it == files_.end())
    return false;
  out = it->second;
  return true;
}

FakeCatalog make_standard_catalog() {
  FakeCatalog catalog;

  SoundtrackEntry calm;
  calm.id = "calm";
  calm.name = "Calm Piano";
  calm.file_ref = "/sounds/calm.mp3";
  calm.duration_seconds = 30.0;
  catalog.add_soundtrack(calm, mp3_blob());

  FilterEntry rain;
  rain.id = "rain";
  rain.name = "Rain";
  rain.file_ref = "/filters/rain.mp4";
  catalog.add_filter(rain, mp4_blob());

  return catalog;
}

} // namespace slide_reel::tests::fixtures
