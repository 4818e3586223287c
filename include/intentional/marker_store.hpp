#ifndef INTENTIONAL_MARKER_STORE_HPP
#define INTENTIONAL_MARKER_STORE_HPP

#include <chrono>
#include <filesystem>
#include <optional>

namespace intentional {

// No-relaunch marker (mtime is the payload) and strict-mode flag
// (existence is the payload). Both outlive any single process.
class MarkerStore {
public:
  static constexpr std::chrono::seconds kMarkerFreshness{30};

  MarkerStore(const std::filesystem::path &markerPath,
              const std::filesystem::path &strictPath);

  // Creates the marker or bumps its mtime to now
  bool writeNoRelaunch();

  // Age of the marker, nullopt when absent. A future mtime reads as zero.
  std::optional<std::chrono::seconds> markerAge() const;

  // Present and younger than kMarkerFreshness
  bool markerFresh() const;

  bool removeMarker();

  bool strictMode() const;
  bool setStrictMode(bool enabled);

  const std::filesystem::path &markerPath() const { return markerPath_; }
  const std::filesystem::path &strictPath() const { return strictPath_; }

private:
  std::filesystem::path markerPath_;
  std::filesystem::path strictPath_;
};

} // namespace intentional

#endif // INTENTIONAL_MARKER_STORE_HPP
