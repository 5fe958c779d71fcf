#pragma once

#include <functional>
#include <rs/result.hpp>

namespace imgbuild {

// Runs work under an alternate identity, e.g. registry credentials for
// pushing.
class IdentityScope {
public:
  virtual ~IdentityScope() = default;
  virtual rs::Result<void> runAs(const std::function<rs::Result<void>()>& work) = 0;
};

// Runs the work as the current user.
class AmbientIdentity final : public IdentityScope {
public:
  rs::Result<void> runAs(const std::function<rs::Result<void>()>& work) override {
    return work();
  }
};

} // namespace imgbuild
