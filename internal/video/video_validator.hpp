#pragma once

#include <string>
#include <vector>

namespace demonlist::video {

/*
  Video reference collaborator: returns the canonical form of a raw
  reference or throws util::InvalidVideo.
*/
class VideoValidator {
 public:
  virtual ~VideoValidator() = default;

  virtual std::string Validate(const std::string& raw) = 0;
};

/*
  Accepts http(s) URLs on a fixed set of hosting sites and canonicalizes
  them to https with the host lower-cased and a trailing slash removed.
*/
class HostListVideoValidator final : public VideoValidator {
 public:
  HostListVideoValidator();
  explicit HostListVideoValidator(std::vector<std::string> hosts);

  std::string Validate(const std::string& raw) override;

 private:
  std::vector<std::string> hosts_;
};

} // namespace demonlist::video
