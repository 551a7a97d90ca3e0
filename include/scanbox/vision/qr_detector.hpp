#pragma once

#include <scanbox/vision/detector.hpp>
#include <memory>

namespace scanbox::vision {

/// QR code detector backed by cv::QRCodeDetector (multi-code detect + decode).
/// Every located symbol is reported with type tag core::kQrTypeTag; symbols
/// that could not be decoded carry no content.
class QrDetector : public IDetector {
 public:
  QrDetector();
  ~QrDetector() override;

  QrDetector(const QrDetector&) = delete;
  QrDetector& operator=(const QrDetector&) = delete;

  [[nodiscard]] std::expected<std::vector<scanbox::core::DetectionEvent>,
                              scanbox::core::ScanError>
  detect(const scanbox::core::Frame& input,
         std::optional<scanbox::core::NormalizedRect> roi) override;

  [[nodiscard]] std::expected<void, scanbox::core::ScanError>
  validate_input(const scanbox::core::Frame& input) const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace scanbox::vision
